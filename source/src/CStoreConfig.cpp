#include <nlohmann/json.hpp>
#include <lap/core/CConfig.hpp>
#include "CStoreConfig.hpp"

namespace lap
{
namespace geo
{
namespace
{
    template < typename T >
    void readKey( const nlohmann::json &moduleConfig, const char *key, T &target ) noexcept
    {
        auto it = moduleConfig.find( key );
        if ( it == moduleConfig.end() || it->is_null() ) return;

        try {
            target = it->get< T >();
        } catch ( const nlohmann::json::exception& e ) {
            LAP_GEO_LOG_WARN << "Invalid value for geohistory." << key << ", keeping default: " << e.what();
        }
    }
} // namespace

    core::Result< StoreConfig > LoadStoreConfig() noexcept
    {
        using result = core::Result< StoreConfig >;

        StoreConfig config;

        try {
            auto& configMgr = core::ConfigManager::getInstance();
            auto moduleConfig = configMgr.getModuleConfigJson( LAP_GEO_CONFIG_MODULE );

            if ( moduleConfig.is_null() || moduleConfig.empty() ) {
                LAP_GEO_LOG_WARN << "Geohistory module config not found, using defaults";
                return result::FromValue( config );
            }

            readKey( moduleConfig, "storageRoot", config.storageRoot );
            readKey( moduleConfig, "databaseFile", config.databaseFile );
            readKey( moduleConfig, "durableAreaEnabled", config.durableAreaEnabled );
            readKey( moduleConfig, "backupRoot", config.backupRoot );
            readKey( moduleConfig, "backupCollection", config.backupCollection );
            readKey( moduleConfig, "backupKey", config.backupKey );
            readKey( moduleConfig, "busyTimeoutMs", config.busyTimeoutMs );
            readKey( moduleConfig, "backupTimeoutMs", config.backupTimeoutMs );
            readKey( moduleConfig, "enforceBounds", config.enforceBounds );
            readKey( moduleConfig, "recentWindowDays", config.recentWindowDays );

            return result::FromValue( config );
        } catch ( const ::std::exception& e ) {
            LAP_GEO_LOG_ERROR << "Failed to load geohistory config: " << e.what();
            return result::FromError( MakeErrorCode( GeoErrc::kInvalidArgument, 0 ) );
        }
    }

    core::Result< void > ValidateStoreConfig( const StoreConfig &config ) noexcept
    {
        using result = core::Result< void >;

        if ( config.storageRoot.empty() ) {
            LAP_GEO_LOG_ERROR << "storageRoot must not be empty";
            return result::FromError( MakeErrorCode( GeoErrc::kInvalidArgument, 0 ) );
        }

        if ( config.databaseFile.empty() || config.databaseFile.find( '/' ) != core::String::npos ) {
            LAP_GEO_LOG_ERROR << "databaseFile must be a plain file name: " << config.databaseFile;
            return result::FromError( MakeErrorCode( GeoErrc::kInvalidArgument, 0 ) );
        }

        if ( config.backupCollection.empty() || config.backupKey.empty() ) {
            LAP_GEO_LOG_ERROR << "Backup collection and key must not be empty";
            return result::FromError( MakeErrorCode( GeoErrc::kInvalidArgument, 0 ) );
        }

        if ( config.backupTimeoutMs == 0U ) {
            LAP_GEO_LOG_ERROR << "backup.timeoutMs must be greater than 0";
            return result::FromError( MakeErrorCode( GeoErrc::kInvalidArgument, 0 ) );
        }

        if ( config.recentWindowDays == 0U ) {
            LAP_GEO_LOG_ERROR << "recentWindowDays must be greater than 0";
            return result::FromError( MakeErrorCode( GeoErrc::kInvalidArgument, 0 ) );
        }

        return result::FromValue();
    }

} // geo
} // lap
