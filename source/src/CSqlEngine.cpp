#include <cstring>
#include <unicode/unistr.h>
#include "CSqlEngine.hpp"

namespace lap
{
namespace geo
{
namespace
{
    // geo_fold( text ): Unicode simple case folding of a UTF-8 value, NULL stays NULL
    void foldCaseFunction( sqlite3_context* context, int argc, sqlite3_value** argv )
    {
        if ( argc != 1 || sqlite3_value_type( argv[0] ) == SQLITE_NULL ) {
            sqlite3_result_null( context );
            return;
        }

        const auto* data = reinterpret_cast< const core::Char* >( sqlite3_value_text( argv[0] ) );
        const auto size = sqlite3_value_bytes( argv[0] );
        if ( data == nullptr ) {
            sqlite3_result_null( context );
            return;
        }

        icu::UnicodeString text = icu::UnicodeString::fromUTF8( icu::StringPiece( data, size ) );
        text.foldCase( U_FOLD_CASE_DEFAULT );

        core::String folded;
        text.toUTF8String( folded );
        sqlite3_result_text64( context, folded.data(), folded.size(), SQLITE_TRANSIENT, SQLITE_UTF8 );
    }
}

    // ==================== Constructor/Destructor ====================

    SqlEngine::SqlEngine( core::StringView file ) noexcept
        : m_strFile( file )
        , m_bMemory( file == LAP_GEO_MEMORY_DATABASE )
    {
        ;
    }

    SqlEngine::~SqlEngine() noexcept
    {
        if ( m_bInTransaction ) {
            auto result = Rollback();
            if ( !result.HasValue() ) {
                LAP_GEO_LOG_WARN << "Rollback on close failed: " << core::StringView( m_strFile );
            }
        }

        if ( m_pDB ) {
            sqlite3_close_v2( m_pDB );
            m_pDB = nullptr;
            LAP_GEO_LOG_DEBUG << "SQLite database closed: " << core::StringView( m_strFile );
        }
    }

    core::Result< core::UniqueHandle< SqlEngine > > SqlEngine::Open( core::StringView file, const EngineOptions &options ) noexcept
    {
        using result = core::Result< core::UniqueHandle< SqlEngine > >;

        core::UniqueHandle< SqlEngine > engine( new SqlEngine( file ) );

        auto openResult = engine->openDatabase( options );
        if ( !openResult.HasValue() ) {
            return result::FromError( openResult.Error() );
        }

        LAP_GEO_LOG_INFO << "SQLite engine opened: " << file;
        return result::FromValue( ::std::move( engine ) );
    }

    // ==================== Database Initialization ====================

    core::Result< void > SqlEngine::openDatabase( const EngineOptions &options ) noexcept
    {
        using result = core::Result< void >;

        core::LockGuard lock( m_mutex );

        core::Int32 flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if ( m_bMemory ) flags |= SQLITE_OPEN_MEMORY;

        core::Int32 rc = sqlite3_open_v2( m_strFile.c_str(), &m_pDB, flags, nullptr );
        if ( rc != SQLITE_OK ) {
            LAP_GEO_LOG_ERROR << "Failed to open SQLite database " << core::StringView( m_strFile )
                              << ": " << ( m_pDB ? sqlite3_errmsg( m_pDB ) : sqlite3_errstr( rc ) );
            if ( m_pDB ) {
                sqlite3_close_v2( m_pDB );
                m_pDB = nullptr;
            }
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        // SQLITE_OPEN_READWRITE silently degrades to read-only on a protected file
        if ( sqlite3_db_readonly( m_pDB, "main" ) == 1 ) {
            LAP_GEO_LOG_ERROR << "SQLite database opened read-only: " << core::StringView( m_strFile );
            sqlite3_close_v2( m_pDB );
            m_pDB = nullptr;
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        sqlite3_extended_result_codes( m_pDB, 1 );
        sqlite3_busy_timeout( m_pDB, static_cast< core::Int32 >( options.busyTimeoutMs ) );

        rc = sqlite3_create_function_v2( m_pDB, LAP_GEO_FOLD_FUNCTION, 1, SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                         nullptr, &foldCaseFunction, nullptr, nullptr, nullptr );
        if ( rc != SQLITE_OK ) {
            LAP_GEO_LOG_ERROR << "Failed to register " << LAP_GEO_FOLD_FUNCTION << ": " << sqlite3_errmsg( m_pDB );
            sqlite3_close_v2( m_pDB );
            m_pDB = nullptr;
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        if ( m_bMemory ) return result::FromValue();

        // journal_mode reads the file header: a locked or foreign file fails here
        auto walResult = execRaw( "PRAGMA journal_mode=WAL;" );
        if ( !walResult.HasValue() ) {
            LAP_GEO_LOG_ERROR << "Database file is not usable: " << core::StringView( m_strFile );
            sqlite3_close_v2( m_pDB );
            m_pDB = nullptr;
            return result::FromError( GeoErrc::kInitializationFailed );
        }

        auto syncResult = execRaw( "PRAGMA synchronous=NORMAL;" );
        if ( !syncResult.HasValue() ) {
            LAP_GEO_LOG_WARN << "Failed to set synchronous mode for " << core::StringView( m_strFile );
        }

        return result::FromValue();
    }

    core::Result< void > SqlEngine::execRaw( const core::Char* sql ) noexcept
    {
        using result = core::Result< void >;

        char* errMsg = nullptr;
        core::Int32 rc = sqlite3_exec( m_pDB, sql, nullptr, nullptr, &errMsg );
        if ( rc != SQLITE_OK ) {
            LAP_GEO_LOG_WARN << "Statement failed: " << sql << " : " << ( errMsg ? errMsg : "unknown error" );
            if ( errMsg ) sqlite3_free( errMsg );
            return result::FromError( makeErrorCode( rc ) );
        }

        return result::FromValue();
    }

    // ==================== Statements ====================

    core::Result< sqlite3_stmt* > SqlEngine::prepare( const SqlStatement &statement ) noexcept
    {
        using result = core::Result< sqlite3_stmt* >;

        if ( !m_pDB ) return result::FromError( GeoErrc::kNotInitialized );

        sqlite3_stmt* stmt = nullptr;
        core::Int32 rc = sqlite3_prepare_v2( m_pDB, statement.text.c_str(), -1, &stmt, nullptr );
        if ( rc != SQLITE_OK ) {
            LAP_GEO_LOG_ERROR << "Failed to prepare statement: " << sqlite3_errmsg( m_pDB );
            return result::FromError( makeErrorCode( rc ) );
        }

        if ( static_cast< core::Size >( sqlite3_bind_parameter_count( stmt ) ) != statement.params.size() ) {
            LAP_GEO_LOG_ERROR << "Parameter count mismatch for statement: " << statement.text;
            sqlite3_finalize( stmt );
            return result::FromError( GeoErrc::kQueryFailed );
        }

        for ( core::Size i = 0; i < statement.params.size(); ++i ) {
            const auto& value = statement.params[i];
            const core::Int32 index = static_cast< core::Int32 >( i + 1 );

            switch( static_cast< ESqlValueIndicate >( ::lap::core::GetVariantIndex( value ) ) ) {
            case ESqlValueIndicate::SqlValue_null:
                rc = sqlite3_bind_null( stmt, index );
                break;
            case ESqlValueIndicate::SqlValue_int64:
                rc = sqlite3_bind_int64( stmt, index, ::std::get< core::Int64 >( value ) );
                break;
            case ESqlValueIndicate::SqlValue_double:
                rc = sqlite3_bind_double( stmt, index, ::std::get< core::Double >( value ) );
                break;
            case ESqlValueIndicate::SqlValue_string:
                {
                    const auto& text = ::std::get< core::String >( value );
                    rc = sqlite3_bind_text64( stmt, index, text.data(), text.size(), SQLITE_STATIC, SQLITE_UTF8 );
                }
                break;
            }

            if ( rc != SQLITE_OK ) {
                LAP_GEO_LOG_ERROR << "Failed to bind parameter " << index << ": " << sqlite3_errmsg( m_pDB );
                sqlite3_finalize( stmt );
                return result::FromError( makeErrorCode( rc ) );
            }
        }

        return result::FromValue( stmt );
    }

    SqlValue SqlEngine::readColumn( sqlite3_stmt* stmt, core::Int32 column ) const noexcept
    {
        switch( sqlite3_column_type( stmt, column ) ) {
        case SQLITE_INTEGER:
            return SqlValue( static_cast< core::Int64 >( sqlite3_column_int64( stmt, column ) ) );
        case SQLITE_FLOAT:
            return SqlValue( sqlite3_column_double( stmt, column ) );
        case SQLITE_TEXT:
        case SQLITE_BLOB:
            {
                // text pointer first, then byte count
                const auto* data = reinterpret_cast< const core::Char* >( sqlite3_column_text( stmt, column ) );
                const auto size = static_cast< core::Size >( sqlite3_column_bytes( stmt, column ) );
                return SqlValue( data ? core::String( data, size ) : core::String() );
            }
        default:
            return SqlValue( SqlNull{} );
        }
    }

    core::Result< core::Int64 > SqlEngine::Execute( const SqlStatement &statement ) noexcept
    {
        using result = core::Result< core::Int64 >;

        core::LockGuard lock( m_mutex );

        auto prepared = prepare( statement );
        if ( !prepared.HasValue() ) return result::FromError( prepared.Error() );

        sqlite3_stmt* stmt = prepared.Value();
        core::Int32 rc;
        do {
            rc = sqlite3_step( stmt );
        } while ( rc == SQLITE_ROW );

        if ( rc != SQLITE_DONE ) {
            core::Int32 extended = sqlite3_extended_errcode( m_pDB );
            LAP_GEO_LOG_WARN << "Statement failed: " << sqlite3_errmsg( m_pDB );
            sqlite3_finalize( stmt );
            return result::FromError( makeErrorCode( extended ) );
        }

        sqlite3_finalize( stmt );
        return result::FromValue( static_cast< core::Int64 >( sqlite3_changes( m_pDB ) ) );
    }

    core::Result< void > SqlEngine::ExecuteScript( core::StringView sql ) noexcept
    {
        core::LockGuard lock( m_mutex );

        if ( !m_pDB ) return core::Result< void >::FromError( GeoErrc::kNotInitialized );

        core::String script( sql );
        return execRaw( script.c_str() );
    }

    core::Result< core::Vector< SqlRow > > SqlEngine::Query( const SqlStatement &statement ) noexcept
    {
        using result = core::Result< core::Vector< SqlRow > >;

        core::LockGuard lock( m_mutex );

        auto prepared = prepare( statement );
        if ( !prepared.HasValue() ) return result::FromError( prepared.Error() );

        sqlite3_stmt* stmt = prepared.Value();
        const core::Int32 columns = sqlite3_column_count( stmt );
        core::Vector< SqlRow > rows;

        core::Int32 rc;
        while ( ( rc = sqlite3_step( stmt ) ) == SQLITE_ROW ) {
            SqlRow row;
            row.reserve( static_cast< core::Size >( columns ) );
            for ( core::Int32 column = 0; column < columns; ++column ) {
                row.emplace_back( readColumn( stmt, column ) );
            }
            rows.emplace_back( ::std::move( row ) );
        }

        if ( rc != SQLITE_DONE ) {
            core::Int32 extended = sqlite3_extended_errcode( m_pDB );
            LAP_GEO_LOG_WARN << "Query failed: " << sqlite3_errmsg( m_pDB );
            sqlite3_finalize( stmt );
            return result::FromError( makeErrorCode( extended ) );
        }

        sqlite3_finalize( stmt );
        return result::FromValue( ::std::move( rows ) );
    }

    core::Result< core::Bool > SqlEngine::HasTable( core::StringView table ) noexcept
    {
        using result = core::Result< core::Bool >;

        SqlStatement statement{ "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ? LIMIT 1;",
                                { SqlValue( core::String( table ) ) } };

        auto rows = Query( statement );
        if ( !rows.HasValue() ) return result::FromError( rows.Error() );

        return result::FromValue( !rows.Value().empty() );
    }

    // ==================== Durability ====================

    core::Result< void > SqlEngine::Checkpoint() noexcept
    {
        using result = core::Result< void >;

        core::LockGuard lock( m_mutex );

        if ( !m_pDB ) return result::FromError( GeoErrc::kNotInitialized );
        if ( m_bMemory ) return result::FromValue();

        core::Int32 logFrames = 0;
        core::Int32 checkpointed = 0;
        core::Int32 rc = sqlite3_wal_checkpoint_v2( m_pDB, nullptr, SQLITE_CHECKPOINT_FULL, &logFrames, &checkpointed );
        if ( rc != SQLITE_OK ) {
            LAP_GEO_LOG_WARN << "WAL checkpoint failed: " << sqlite3_errmsg( m_pDB );
            return result::FromError( GeoErrc::kBackupSyncFailed );
        }

        LAP_GEO_LOG_VERBOSE.logFormat( "Checkpoint complete: %d/%d frames", checkpointed, logFrames );
        return result::FromValue();
    }

    // ==================== Transactions ====================

    core::Result< void > SqlEngine::BeginTransaction() noexcept
    {
        using result = core::Result< void >;

        core::LockGuard lock( m_mutex );

        if ( !m_pDB ) return result::FromError( GeoErrc::kNotInitialized );
        if ( m_bInTransaction ) return result::FromValue();

        auto begin = execRaw( "BEGIN IMMEDIATE TRANSACTION;" );
        if ( begin.HasValue() ) m_bInTransaction = true;

        return begin;
    }

    core::Result< void > SqlEngine::Commit() noexcept
    {
        using result = core::Result< void >;

        core::LockGuard lock( m_mutex );

        if ( !m_bInTransaction ) return result::FromValue();

        auto commit = execRaw( "COMMIT TRANSACTION;" );
        if ( commit.HasValue() ) m_bInTransaction = false;

        return commit;
    }

    core::Result< void > SqlEngine::Rollback() noexcept
    {
        using result = core::Result< void >;

        core::LockGuard lock( m_mutex );

        if ( !m_bInTransaction ) return result::FromValue();

        auto rollback = execRaw( "ROLLBACK TRANSACTION;" );
        m_bInTransaction = false;

        return rollback;
    }

    // ==================== Error Handling ====================

    core::ErrorCode SqlEngine::makeErrorCode( core::Int32 sqliteCode ) const noexcept
    {
        switch( sqliteCode ) {
            case SQLITE_CONSTRAINT_PRIMARYKEY:
            case SQLITE_CONSTRAINT_UNIQUE:
                return core::ErrorCode( GeoErrc::kDuplicateKey );
            default:
                break;
        }

        // primary result code
        switch( sqliteCode & 0xFF ) {
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                return core::ErrorCode( GeoErrc::kTimeout );
            case SQLITE_CORRUPT:
            case SQLITE_NOTADB:
            case SQLITE_FORMAT:
                return core::ErrorCode( GeoErrc::kIntegrityCorrupted );
            default:
                return core::ErrorCode( GeoErrc::kQueryFailed );
        }
    }

} // geo
} // lap
