/**
 * @file CDataType.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief
 * @version 0.1
 * @date 2024-02-02
 *
 *
 */
#ifndef LAP_GEOHISTORY_DATATYPE_HPP
#define LAP_GEOHISTORY_DATATYPE_HPP

// core
#include <lap/core/CTypedef.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CVariant.hpp>
#include <lap/core/CResult.hpp>
#include <lap/log/CLog.hpp>

// geohistory common
#include "CGeoErrorDomain.hpp"

namespace lap
{
namespace geo
{
    // ========================================================================
    // Logging Configuration
    // ========================================================================
    #define LAP_GEO_LOG_CONTEXT_ID       "GEO"
    #define LAP_GEO_LOG_CONTEXT_DESC     "GEO log ctx"

    #define LAP_DEBUG

#ifdef LAP_DEBUG
    #define LAP_GEO_LOG                  LAP_LOG( LAP_GEO_LOG_CONTEXT_ID, LAP_GEO_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kVerbose )
    #define LAP_GEO_LOG_VERBOSE          LAP_GEO_LOG.LogVerbose().WithLocation( __FILE__, __LINE__ )
    #define LAP_GEO_LOG_DEBUG            LAP_GEO_LOG.LogDebug().WithLocation( __FILE__, __LINE__ )
    #define LAP_GEO_LOG_INFO             LAP_GEO_LOG.LogInfo().WithLocation( __FILE__, __LINE__ )
#else
    #define LAP_GEO_LOG                  LAP_LOG( LAP_GEO_LOG_CONTEXT_ID, LAP_GEO_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kWarn )
    #define LAP_GEO_LOG_VERBOSE          LAP_GEO_LOG.LogOff()
    #define LAP_GEO_LOG_DEBUG            LAP_GEO_LOG.LogOff()
    #define LAP_GEO_LOG_INFO             LAP_GEO_LOG.LogOff()
#endif
    #define LAP_GEO_LOG_WARN             LAP_GEO_LOG.LogWarn().WithLocation( __FILE__, __LINE__ )
    #define LAP_GEO_LOG_ERROR            LAP_GEO_LOG.LogError().WithLocation( __FILE__, __LINE__ )
    #define LAP_GEO_LOG_FATAL            LAP_GEO_LOG.LogFatal().WithLocation( __FILE__, __LINE__ )

    // ========================================================================
    // Store Default Configuration
    // ========================================================================
    #define LAP_GEO_CONFIG_MODULE                   "geohistory"

    #define LAP_GEO_DEFAULT_STORAGE_ROOT            "/tmp/lap_geohistory"
    #define LAP_GEO_DEFAULT_DATABASE_FILE           "location_tracker.db"
    #define LAP_GEO_DEFAULT_BACKUP_COLLECTION       "locationHistory"
    #define LAP_GEO_DEFAULT_BACKUP_KEY              "records"

    #define LAP_GEO_DEFAULT_BUSY_TIMEOUT_MS         5000U
    #define LAP_GEO_DEFAULT_BACKUP_TIMEOUT_MS       5000U
    #define LAP_GEO_DEFAULT_RECENT_WINDOW_DAYS      7U

    #define LAP_GEO_DEFAULT_LIST_LIMIT              50U
    #define LAP_GEO_DEFAULT_SEARCH_LIMIT            20U

    // Directory layout below the storage root
    #define LAP_GEO_DATABASE_DIR                    "db"
    #define LAP_GEO_BACKUP_DIR                      "backup"

    // Backup area categories
    #define LAP_GEO_CATEGORY_CURRENT                "current"
    #define LAP_GEO_CATEGORY_UPDATE                 "update"
    #define LAP_GEO_CATEGORY_REDUNDANCY             "redundancy"

    #define LAP_GEO_MEMORY_DATABASE                 ":memory:"
    #define LAP_GEO_TABLE_NAME                      "location_history"
    #define LAP_GEO_FOLD_FUNCTION                   "geo_fold"

    // ========================================================================
    // Record Enumerations
    // ========================================================================
    enum class AnalysisMode : core::UInt8
    {
        kBasic          = 0,
        kFunction       = 1,
        kGrounding      = 2,
        kImageSearch    = 3
    };

    enum class RecordSource : core::UInt8
    {
        kCamera         = 0,
        kUpload         = 1
    };

    const core::Char*                       ToString( AnalysisMode mode ) noexcept;
    const core::Char*                       ToString( RecordSource source ) noexcept;
    core::Result< AnalysisMode >            AnalysisModeFromString( core::StringView value ) noexcept;
    core::Result< RecordSource >            RecordSourceFromString( core::StringView value ) noexcept;

    /**
     * @brief Parse a decimal row limit
     * @return kInvalidArgument for signs, trailing text or values past UInt32
     */
    core::Result< core::UInt32 >            LimitFromString( core::StringView value ) noexcept;

    // ========================================================================
    // Session / Strategy State
    // ========================================================================
    enum class SessionState : core::UInt8
    {
        kUninitialized  = 0,
        kInitializing   = 1,
        kReady          = 2,
        kClosed         = 3,
        kFailed         = 4
    };

    enum class StrategyType : core::UInt8
    {
        kNone           = 0,
        kDurableFile    = 1,
        kVolatileBackup = 2
    };

    const core::Char*                       ToString( SessionState state ) noexcept;
    const core::Char*                       ToString( StrategyType type ) noexcept;

    // ========================================================================
    // Durability Outcome
    // ========================================================================
    enum class DurabilityStatus : core::UInt8
    {
        kDurable            = 0,        // checkpoint or backup snapshot written
        kCheckpointFailed   = 1,        // committed in the file engine, not checkpointed
        kBackupFailed       = 2         // committed in memory only, snapshot not rewritten
    };

    /**
     * @brief Result of a mutation. The mutation itself succeeded; status tells
     *        whether the durability step behind it succeeded too.
     */
    struct MutationOutcome
    {
        core::Int64             affectedRows{ 0 };
        DurabilityStatus        status{ DurabilityStatus::kDurable };
        core::String            detail;

        core::Bool IsDurable() const noexcept { return status == DurabilityStatus::kDurable; }
    };

    // ========================================================================
    // Engine Values
    // ========================================================================
    struct SqlNull
    {
    };

    using SqlValue = core::Variant< SqlNull, core::Int64, core::Double, core::String >;

    enum class ESqlValueIndicate : core::UInt32
    {
        SqlValue_null           = 0,
        SqlValue_int64          = 1,
        SqlValue_double         = 2,
        SqlValue_string         = 3
    };

    using SqlRow = core::Vector< SqlValue >;

    struct SqlStatement
    {
        core::String                    text;
        core::Vector< SqlValue >        params;
    };

    struct EngineOptions
    {
        core::UInt32 busyTimeoutMs{ LAP_GEO_DEFAULT_BUSY_TIMEOUT_MS };
    };

    // ========================================================================
    // Store Configuration Structure
    // ========================================================================

    /**
     * @brief Location history store configuration
     * Loaded from Core::ConfigManager "geohistory" module
     */
    struct StoreConfig {
        core::String storageRoot{ LAP_GEO_DEFAULT_STORAGE_ROOT };
        core::String databaseFile{ LAP_GEO_DEFAULT_DATABASE_FILE };
        core::Bool durableAreaEnabled{ true };
        core::String backupRoot{ "" };                              // empty: {storageRoot}/backup
        core::String backupCollection{ LAP_GEO_DEFAULT_BACKUP_COLLECTION };
        core::String backupKey{ LAP_GEO_DEFAULT_BACKUP_KEY };
        core::UInt32 busyTimeoutMs{ LAP_GEO_DEFAULT_BUSY_TIMEOUT_MS };
        core::UInt32 backupTimeoutMs{ LAP_GEO_DEFAULT_BACKUP_TIMEOUT_MS };
        core::Bool enforceBounds{ true };
        core::UInt32 recentWindowDays{ LAP_GEO_DEFAULT_RECENT_WINDOW_DAYS };
    };

} // geo
} // lap

#endif
