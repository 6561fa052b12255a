#include <lap/core/CPath.hpp>
#include "CDurableFileStrategy.hpp"

namespace lap
{
namespace geo
{
    DurableFileStrategy::DurableFileStrategy( core::StringView databasePath, const EngineOptions &options ) noexcept
        : m_strDatabasePath( databasePath )
        , m_options( options )
    {
        ;
    }

    DurableFileStrategy::~DurableFileStrategy() noexcept
    {
        Close();
    }

    core::Result< void > DurableFileStrategy::Open() noexcept
    {
        using result = core::Result< void >;

        auto pos = m_strDatabasePath.find_last_of( '/' );
        if ( pos != core::String::npos && pos > 0 ) {
            core::String directory = m_strDatabasePath.substr( 0, pos );
            if ( !core::Path::createDirectory( directory ) ) {
                LAP_GEO_LOG_ERROR << "Failed to create database directory: " << directory;
                return result::FromError( GeoErrc::kInitializationFailed );
            }
        }

        auto engine = SqlEngine::Open( m_strDatabasePath, m_options );
        if ( !engine.HasValue() ) {
            return result::FromError( engine.Error() );
        }

        m_pEngine = ::std::move( engine.Value() );
        return result::FromValue();
    }

    core::Result< void > DurableFileStrategy::EnsureSchema() noexcept
    {
        using result = core::Result< void >;

        if ( !m_pEngine ) return result::FromError( GeoErrc::kNotInitialized );

        auto exists = m_pEngine->HasTable( LAP_GEO_TABLE_NAME );
        if ( !exists.HasValue() ) {
            LAP_GEO_LOG_ERROR << "Catalog lookup failed on " << m_strDatabasePath;
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        if ( exists.Value() ) {
            LAP_GEO_LOG_DEBUG << "Schema present in " << m_strDatabasePath;
            return result::FromValue();
        }

        auto schema = ApplySchema( *m_pEngine );
        if ( !schema.HasValue() ) {
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        auto checkpoint = m_pEngine->Checkpoint();
        if ( !checkpoint.HasValue() ) {
            LAP_GEO_LOG_WARN << "Checkpoint after schema creation failed: " << checkpoint.Error().Message();
        }

        LAP_GEO_LOG_INFO << "Schema created in " << m_strDatabasePath;
        return result::FromValue();
    }

    MutationOutcome DurableFileStrategy::AfterMutation() noexcept
    {
        MutationOutcome outcome;

        if ( !m_pEngine ) {
            outcome.status = DurabilityStatus::kCheckpointFailed;
            outcome.detail = "engine closed";
            return outcome;
        }

        auto checkpoint = m_pEngine->Checkpoint();
        if ( !checkpoint.HasValue() ) {
            LAP_GEO_LOG_WARN << "Mutation applied but not checkpointed: " << checkpoint.Error().Message();
            outcome.status = DurabilityStatus::kCheckpointFailed;
            outcome.detail = core::String( checkpoint.Error().Message() );
        }

        return outcome;
    }

    void DurableFileStrategy::Close() noexcept
    {
        if ( !m_pEngine ) return;

        auto checkpoint = m_pEngine->Checkpoint();
        if ( !checkpoint.HasValue() ) {
            LAP_GEO_LOG_WARN << "Final checkpoint failed for " << m_strDatabasePath;
        }

        m_pEngine.reset();
    }

} // geo
} // lap
