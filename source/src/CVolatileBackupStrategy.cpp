#include "CVolatileBackupStrategy.hpp"
#include "CQueryBuilder.hpp"
#include "CLocationRecord.hpp"

namespace lap
{
namespace geo
{
    VolatileBackupStrategy::VolatileBackupStrategy( core::SharedHandle< IBackupArea > backupArea,
                                                    core::StringView collection,
                                                    core::StringView key,
                                                    const EngineOptions &options,
                                                    core::UInt32 backupTimeoutMs ) noexcept
        : m_pBackupArea( ::std::move( backupArea ) )
        , m_strCollection( collection )
        , m_strKey( key )
        , m_options( options )
        , m_uBackupTimeoutMs( backupTimeoutMs )
    {
        ;
    }

    VolatileBackupStrategy::~VolatileBackupStrategy() noexcept
    {
        Close();
    }

    core::Result< void > VolatileBackupStrategy::Open() noexcept
    {
        using result = core::Result< void >;

        auto engine = SqlEngine::Open( LAP_GEO_MEMORY_DATABASE, m_options );
        if ( !engine.HasValue() ) {
            return result::FromError( engine.Error() );
        }

        m_pEngine = ::std::move( engine.Value() );
        m_replay = ReplayReport{};
        m_bBackupSuspended = false;

        return result::FromValue();
    }

    core::Result< void > VolatileBackupStrategy::EnsureSchema() noexcept
    {
        using result = core::Result< void >;

        if ( !m_pEngine ) return result::FromError( GeoErrc::kNotInitialized );

        auto schema = ApplySchema( *m_pEngine );
        if ( !schema.HasValue() ) {
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        if ( !m_pBackupArea || !m_pBackupArea->available() ) {
            LAP_GEO_LOG_WARN << "Backup area unavailable, records of this session will not survive a restart";
            return result::FromValue();
        }

        auto snapshot = AwaitBackup( m_pBackupArea->GetAsync( m_strCollection, m_strKey ), m_uBackupTimeoutMs );
        if ( !snapshot.HasValue() ) {
            if ( IsGeoError( snapshot.Error(), GeoErrc::kKeyNotFound ) ) {
                LAP_GEO_LOG_INFO << "No backup snapshot found, starting empty";
                return result::FromValue();
            }

            if ( IsGeoError( snapshot.Error(), GeoErrc::kStorageUnavailable ) ) {
                LAP_GEO_LOG_WARN << "Backup area unavailable, starting empty";
                return result::FromValue();
            }

            LAP_GEO_LOG_ERROR << "Backup snapshot unreadable, suspending snapshot writes: " << snapshot.Error().Message();
            m_bBackupSuspended = true;
            return result::FromValue();
        }

        return replaySnapshot( snapshot.Value() );
    }

    core::Result< void > VolatileBackupStrategy::replaySnapshot( const core::String &snapshot ) noexcept
    {
        using result = core::Result< void >;

        auto records = nlohmann::json::parse( snapshot, nullptr, false );
        if ( records.is_discarded() || !records.is_array() ) {
            LAP_GEO_LOG_ERROR << "Backup snapshot is not a record array, suspending snapshot writes";
            m_bBackupSuspended = true;
            return result::FromValue();
        }

        LAP_GEO_LOG_INFO << "Replaying " << static_cast< core::UInt64 >( records.size() ) << " records from backup snapshot";

        auto begin = m_pEngine->BeginTransaction();
        if ( !begin.HasValue() ) {
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        for ( const auto& item : records ) {
            LocationRecord record;
            try {
                record = item.get< LocationRecord >();
            } catch ( const ::std::exception& e ) {
                LAP_GEO_LOG_WARN << "Skipping malformed backup record: " << e.what();
                ++m_replay.skipped;
                continue;
            }

            auto valid = ValidateRecord( record, false );
            auto statement = valid.HasValue() ? QueryBuilder::Insert( record )
                                              : core::Result< SqlStatement >::FromError( valid.Error() );
            if ( !statement.HasValue() ) {
                LAP_GEO_LOG_WARN << "Skipping backup record " << record.id << ": " << statement.Error().Message();
                ++m_replay.skipped;
                continue;
            }

            auto inserted = m_pEngine->Execute( statement.Value() );
            if ( !inserted.HasValue() ) {
                LAP_GEO_LOG_WARN << "Failed to insert backup record " << record.id << ": " << inserted.Error().Message();
                ++m_replay.skipped;
                continue;
            }

            ++m_replay.replayed;
        }

        auto commit = m_pEngine->Commit();
        if ( !commit.HasValue() ) {
            auto rollback = m_pEngine->Rollback();
            if ( !rollback.HasValue() ) {
                LAP_GEO_LOG_ERROR << "Rollback of snapshot replay failed";
            }
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        LAP_GEO_LOG_INFO.logFormat( "Backup snapshot replayed: %u records, %u skipped", m_replay.replayed, m_replay.skipped );
        return result::FromValue();
    }

    core::Result< core::String > VolatileBackupStrategy::buildSnapshot() noexcept
    {
        using result = core::Result< core::String >;

        auto rows = m_pEngine->Query( QueryBuilder::SelectAll() );
        if ( !rows.HasValue() ) return result::FromError( rows.Error() );

        try {
            nlohmann::json records = nlohmann::json::array();
            for ( const auto& row : rows.Value() ) {
                auto record = RecordFromRow( row );
                if ( !record.HasValue() ) return result::FromError( record.Error() );

                records.push_back( record.Value() );
            }

            return result::FromValue( records.dump() );
        } catch ( const nlohmann::json::exception& e ) {
            LAP_GEO_LOG_WARN << "Failed to serialize backup snapshot: " << e.what();
            return result::FromError( GeoErrc::kBackupSyncFailed );
        }
    }

    MutationOutcome VolatileBackupStrategy::AfterMutation() noexcept
    {
        MutationOutcome outcome;

        if ( !m_pEngine || !m_pBackupArea ) {
            outcome.status = DurabilityStatus::kBackupFailed;
            outcome.detail = "backup area not bound";
            return outcome;
        }

        if ( m_bBackupSuspended ) {
            LAP_GEO_LOG_WARN << "Snapshot rewrite suspended, mutation held in memory only";
            outcome.status = DurabilityStatus::kBackupFailed;
            outcome.detail = "snapshot rewrite suspended";
            return outcome;
        }

        auto snapshot = buildSnapshot();
        if ( !snapshot.HasValue() ) {
            LAP_GEO_LOG_WARN << "Failed to build backup snapshot: " << snapshot.Error().Message();
            outcome.status = DurabilityStatus::kBackupFailed;
            outcome.detail = core::String( snapshot.Error().Message() );
            return outcome;
        }

        auto put = AwaitBackup( m_pBackupArea->PutAsync( m_strCollection, m_strKey, ::std::move( snapshot.Value() ) ),
                                m_uBackupTimeoutMs );
        if ( !put.HasValue() ) {
            LAP_GEO_LOG_WARN << "Failed to write backup snapshot: " << put.Error().Message();
            outcome.status = DurabilityStatus::kBackupFailed;
            outcome.detail = core::String( put.Error().Message() );
        }

        return outcome;
    }

    void VolatileBackupStrategy::Close() noexcept
    {
        m_pEngine.reset();
    }

} // geo
} // lap
