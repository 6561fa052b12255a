#include <chrono>
#include "CLocationHistoryStore.hpp"
#include "CFileBackupArea.hpp"
#include "CQueryBuilder.hpp"
#include "CStoragePathManager.hpp"

namespace lap
{
namespace geo
{
    LocationHistoryStore::LocationHistoryStore( const StoreConfig &config ) noexcept
        : LocationHistoryStore( config, nullptr, nullptr )
    {
        ;
    }

    LocationHistoryStore::LocationHistoryStore( const StoreConfig &config,
                                                core::SharedHandle< CapabilityDetector > detector,
                                                core::SharedHandle< IBackupArea > backupArea,
                                                core::SharedHandle< RecordStrategyFactory > factory ) noexcept
        : m_config( config )
        , m_pDetector( ::std::move( detector ) )
        , m_pBackupArea( ::std::move( backupArea ) )
        , m_pFactory( ::std::move( factory ) )
    {
        if ( !m_pDetector ) m_pDetector = ::std::make_shared< CapabilityDetector >( m_config );
        if ( !m_pFactory ) m_pFactory = ::std::make_shared< RecordStrategyFactory >();
    }

    LocationHistoryStore::~LocationHistoryStore() noexcept
    {
        Close();
    }

    // ==================== Session ====================

    core::Result< void > LocationHistoryStore::Initialize() noexcept
    {
        using result = core::Result< void >;

        ::std::shared_future< result > pending;
        ::std::promise< result > promise;
        core::Bool bOwner = false;

        {
            core::LockGuard lock( m_initMutex );

            switch ( m_state.load() ) {
            case SessionState::kReady:
                return result::FromValue();
            case SessionState::kFailed:
                return result::FromError( GeoErrc::kInitializationFailed );
            case SessionState::kInitializing:
                pending = m_initFuture;
                break;
            default:
                m_state = SessionState::kInitializing;
                m_initFuture = promise.get_future().share();
                pending = m_initFuture;
                bOwner = true;
                break;
            }
        }

        if ( bOwner ) {
            auto bootstrapped = bootstrap();

            {
                core::LockGuard lock( m_initMutex );
                m_state = bootstrapped.HasValue() ? SessionState::kReady : SessionState::kFailed;
            }

            promise.set_value( bootstrapped );
        }

        return pending.get();
    }

    core::Result< void > LocationHistoryStore::bootstrap() noexcept
    {
        using result = core::Result< void >;

        core::LockGuard lock( m_opMutex );

        EngineOptions options;
        options.busyTimeoutMs = m_config.busyTimeoutMs;

        core::UniqueHandle< IRecordStrategy > strategy;

        if ( m_pDetector->IsDurableAreaAvailable() ) {
            strategy = m_pFactory->Create( StrategyType::kDurableFile, m_config, options, m_pBackupArea );

            auto started = startStrategy( strategy.get() );
            if ( !started.HasValue() ) {
                LAP_GEO_LOG_WARN << "Durable file strategy failed, falling back to volatile backup: "
                                 << started.Error().Message();
                strategy.reset();
            }
        }

        if ( !strategy ) {
            if ( !m_pBackupArea ) {
                m_pBackupArea = ::std::make_shared< FileBackupArea >( CStoragePathManager::getBackupRoot( m_config ) );
            }

            strategy = m_pFactory->Create( StrategyType::kVolatileBackup, m_config, options, m_pBackupArea );

            auto started = startStrategy( strategy.get() );
            if ( !started.HasValue() ) {
                LAP_GEO_LOG_ERROR << "Volatile backup strategy failed: " << started.Error().Message();
                return result::FromError( GeoErrc::kInitializationFailed );
            }
        }

        m_activeStrategy = strategy->Type();
        m_pStrategy = ::std::move( strategy );

        LAP_GEO_LOG_INFO << "Location history ready with strategy " << ToString( m_activeStrategy.load() );
        return result::FromValue();
    }

    core::Result< void > LocationHistoryStore::startStrategy( IRecordStrategy *strategy ) noexcept
    {
        using result = core::Result< void >;

        if ( strategy == nullptr ) return result::FromError( GeoErrc::kInitializationFailed );

        ++m_uEngineInstantiations;

        auto opened = strategy->Open();
        if ( !opened.HasValue() ) {
            strategy->Close();
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        auto schema = strategy->EnsureSchema();
        if ( !schema.HasValue() ) {
            strategy->Close();
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        return result::FromValue();
    }

    void LocationHistoryStore::Close() noexcept
    {
        for ( ;; ) {
            ::std::shared_future< core::Result< void > > pending;

            {
                core::LockGuard lock( m_initMutex );

                if ( m_state.load() != SessionState::kInitializing ) {
                    {
                        core::LockGuard opLock( m_opMutex );
                        if ( m_pStrategy ) {
                            m_pStrategy->Close();
                            m_pStrategy.reset();
                            LAP_GEO_LOG_INFO << "Location history session closed";
                        }
                        m_activeStrategy = StrategyType::kNone;
                    }

                    m_pDetector->Reset();
                    m_initFuture = ::std::shared_future< core::Result< void > >();
                    m_state = SessionState::kClosed;
                    return;
                }

                pending = m_initFuture;
            }

            pending.wait();
        }
    }

    SqlEngine* LocationHistoryStore::activeEngine() noexcept
    {
        return m_pStrategy ? m_pStrategy->Engine() : nullptr;
    }

    MutationOutcome LocationHistoryStore::completeMutation( core::Int64 affectedRows ) noexcept
    {
        auto outcome = m_pStrategy->AfterMutation();
        outcome.affectedRows = affectedRows;

        if ( !outcome.IsDurable() ) {
            ++m_uDurabilityFailures;
            LAP_GEO_LOG_WARN << "Durability step failed after mutation: " << outcome.detail;
        }

        return outcome;
    }

    core::Result< core::UInt64 > LocationHistoryStore::count( SqlEngine &engine, const SqlStatement &statement ) noexcept
    {
        using result = core::Result< core::UInt64 >;

        auto rows = engine.Query( statement );
        if ( !rows.HasValue() ) return result::FromError( rows.Error() );

        if ( rows.Value().empty() || rows.Value().front().empty() ) {
            return result::FromError( GeoErrc::kQueryFailed );
        }

        const auto* value = ::std::get_if< core::Int64 >( &rows.Value().front().front() );
        if ( value == nullptr || *value < 0 ) return result::FromError( GeoErrc::kQueryFailed );

        return result::FromValue( static_cast< core::UInt64 >( *value ) );
    }

    // ==================== Mutations ====================

    core::Result< MutationOutcome > LocationHistoryStore::Save( const LocationRecord &record ) noexcept
    {
        using result = core::Result< MutationOutcome >;

        auto init = Initialize();
        if ( !init.HasValue() ) return result::FromError( init.Error() );

        auto valid = ValidateRecord( record, m_config.enforceBounds );
        if ( !valid.HasValue() ) return result::FromError( valid.Error() );

        auto statement = QueryBuilder::Insert( record );
        if ( !statement.HasValue() ) return result::FromError( statement.Error() );

        core::LockGuard lock( m_opMutex );

        auto engine = activeEngine();
        if ( engine == nullptr ) return result::FromError( GeoErrc::kNotInitialized );

        auto inserted = engine->Execute( statement.Value() );
        if ( !inserted.HasValue() ) {
            LAP_GEO_LOG_ERROR << "Failed to save record " << record.id << ": " << inserted.Error().Message();
            return result::FromError( inserted.Error() );
        }

        LAP_GEO_LOG_DEBUG << "Saved record " << record.id;
        return result::FromValue( completeMutation( inserted.Value() ) );
    }

    core::Result< MutationOutcome > LocationHistoryStore::Delete( core::StringView id ) noexcept
    {
        using result = core::Result< MutationOutcome >;

        auto init = Initialize();
        if ( !init.HasValue() ) return result::FromError( init.Error() );

        auto statement = QueryBuilder::DeleteById( id );
        if ( !statement.HasValue() ) return result::FromError( statement.Error() );

        core::LockGuard lock( m_opMutex );

        auto engine = activeEngine();
        if ( engine == nullptr ) return result::FromError( GeoErrc::kNotInitialized );

        auto deleted = engine->Execute( statement.Value() );
        if ( !deleted.HasValue() ) {
            LAP_GEO_LOG_ERROR << "Failed to delete record " << id << ": " << deleted.Error().Message();
            return result::FromError( deleted.Error() );
        }

        if ( deleted.Value() == 0 ) {
            LAP_GEO_LOG_DEBUG << "Delete of absent record " << id;
            return result::FromValue( MutationOutcome{} );
        }

        return result::FromValue( completeMutation( deleted.Value() ) );
    }

    core::Result< MutationOutcome > LocationHistoryStore::ClearAll() noexcept
    {
        using result = core::Result< MutationOutcome >;

        auto init = Initialize();
        if ( !init.HasValue() ) return result::FromError( init.Error() );

        core::LockGuard lock( m_opMutex );

        auto engine = activeEngine();
        if ( engine == nullptr ) return result::FromError( GeoErrc::kNotInitialized );

        auto cleared = engine->Execute( QueryBuilder::DeleteAll() );
        if ( !cleared.HasValue() ) {
            LAP_GEO_LOG_ERROR << "Failed to clear location history: " << cleared.Error().Message();
            return result::FromError( cleared.Error() );
        }

        LAP_GEO_LOG_INFO << "Cleared " << cleared.Value() << " records";
        return result::FromValue( completeMutation( cleared.Value() ) );
    }

    // ==================== Queries ====================

    core::Result< core::Vector< LocationSummary > > LocationHistoryStore::List( core::UInt32 limit ) noexcept
    {
        using result = core::Result< core::Vector< LocationSummary > >;

        auto init = Initialize();
        if ( !init.HasValue() ) return result::FromError( init.Error() );

        core::Vector< LocationSummary > summaries;
        if ( limit == 0U ) return result::FromValue( summaries );

        core::LockGuard lock( m_opMutex );

        auto engine = activeEngine();
        if ( engine == nullptr ) return result::FromError( GeoErrc::kNotInitialized );

        auto rows = engine->Query( QueryBuilder::SelectSummaries( limit ) );
        if ( !rows.HasValue() ) return result::FromError( rows.Error() );

        summaries.reserve( rows.Value().size() );
        for ( const auto& row : rows.Value() ) {
            auto summary = SummaryFromRow( row );
            if ( !summary.HasValue() ) return result::FromError( summary.Error() );

            summaries.emplace_back( ::std::move( summary.Value() ) );
        }

        return result::FromValue( ::std::move( summaries ) );
    }

    core::Result< ::std::optional< LocationRecord > > LocationHistoryStore::GetById( core::StringView id ) noexcept
    {
        using result = core::Result< ::std::optional< LocationRecord > >;

        auto init = Initialize();
        if ( !init.HasValue() ) return result::FromError( init.Error() );

        auto statement = QueryBuilder::SelectById( id );
        if ( !statement.HasValue() ) return result::FromError( statement.Error() );

        core::LockGuard lock( m_opMutex );

        auto engine = activeEngine();
        if ( engine == nullptr ) return result::FromError( GeoErrc::kNotInitialized );

        auto rows = engine->Query( statement.Value() );
        if ( !rows.HasValue() ) return result::FromError( rows.Error() );

        if ( rows.Value().empty() ) return result::FromValue( ::std::optional< LocationRecord >() );

        auto record = RecordFromRow( rows.Value().front() );
        if ( !record.HasValue() ) return result::FromError( record.Error() );

        return result::FromValue( ::std::optional< LocationRecord >( ::std::move( record.Value() ) ) );
    }

    core::Result< core::Vector< LocationSummary > > LocationHistoryStore::Search( core::StringView term, core::UInt32 limit ) noexcept
    {
        using result = core::Result< core::Vector< LocationSummary > >;

        auto init = Initialize();
        if ( !init.HasValue() ) return result::FromError( init.Error() );

        core::Vector< LocationSummary > summaries;
        if ( limit == 0U ) return result::FromValue( summaries );

        auto statement = QueryBuilder::Search( term, limit );
        if ( !statement.HasValue() ) return result::FromError( statement.Error() );

        core::LockGuard lock( m_opMutex );

        auto engine = activeEngine();
        if ( engine == nullptr ) return result::FromError( GeoErrc::kNotInitialized );

        auto rows = engine->Query( statement.Value() );
        if ( !rows.HasValue() ) return result::FromError( rows.Error() );

        summaries.reserve( rows.Value().size() );
        for ( const auto& row : rows.Value() ) {
            auto summary = SummaryFromRow( row );
            if ( !summary.HasValue() ) return result::FromError( summary.Error() );

            summaries.emplace_back( ::std::move( summary.Value() ) );
        }

        return result::FromValue( ::std::move( summaries ) );
    }

    core::Result< LocationStatistics > LocationHistoryStore::GetStatistics() noexcept
    {
        using result = core::Result< LocationStatistics >;

        auto init = Initialize();
        if ( !init.HasValue() ) return result::FromError( init.Error() );

        const core::Int64 now = ::std::chrono::duration_cast< ::std::chrono::milliseconds >(
                                    ::std::chrono::system_clock::now().time_since_epoch() ).count();
        const core::Int64 since = now - static_cast< core::Int64 >( m_config.recentWindowDays ) * 86400000LL;

        core::LockGuard lock( m_opMutex );

        auto engine = activeEngine();
        if ( engine == nullptr ) return result::FromError( GeoErrc::kNotInitialized );

        auto total = count( *engine, QueryBuilder::CountAll() );
        if ( !total.HasValue() ) return result::FromError( total.Error() );

        auto camera = count( *engine, QueryBuilder::CountBySource( RecordSource::kCamera ) );
        if ( !camera.HasValue() ) return result::FromError( camera.Error() );

        auto uploaded = count( *engine, QueryBuilder::CountBySource( RecordSource::kUpload ) );
        if ( !uploaded.HasValue() ) return result::FromError( uploaded.Error() );

        auto recent = count( *engine, QueryBuilder::CountSince( since ) );
        if ( !recent.HasValue() ) return result::FromError( recent.Error() );

        LocationStatistics statistics;
        statistics.totalLocations       = total.Value();
        statistics.cameraLocations      = camera.Value();
        statistics.uploadedLocations    = uploaded.Value();
        statistics.recentLocations      = recent.Value();

        return result::FromValue( statistics );
    }

    core::Result< core::Vector< LocationRecord > > LocationHistoryStore::ExportAll() noexcept
    {
        using result = core::Result< core::Vector< LocationRecord > >;

        auto init = Initialize();
        if ( !init.HasValue() ) return result::FromError( init.Error() );

        core::LockGuard lock( m_opMutex );

        auto engine = activeEngine();
        if ( engine == nullptr ) return result::FromError( GeoErrc::kNotInitialized );

        auto rows = engine->Query( QueryBuilder::SelectAll() );
        if ( !rows.HasValue() ) return result::FromError( rows.Error() );

        core::Vector< LocationRecord > records;
        records.reserve( rows.Value().size() );
        for ( const auto& row : rows.Value() ) {
            auto record = RecordFromRow( row );
            if ( !record.HasValue() ) return result::FromError( record.Error() );

            records.emplace_back( ::std::move( record.Value() ) );
        }

        return result::FromValue( ::std::move( records ) );
    }

} // geo
} // lap
