#include "CRecordStrategyFactory.hpp"
#include "CDurableFileStrategy.hpp"
#include "CVolatileBackupStrategy.hpp"
#include "CStoragePathManager.hpp"

namespace lap
{
namespace geo
{
    core::UniqueHandle< IRecordStrategy > RecordStrategyFactory::Create( StrategyType type,
                                                                         const StoreConfig &config,
                                                                         const EngineOptions &options,
                                                                         core::SharedHandle< IBackupArea > backupArea ) noexcept
    {
        switch ( type ) {
        case StrategyType::kDurableFile:
            return ::std::make_unique< DurableFileStrategy >( CStoragePathManager::getDatabasePath( config ), options );
        case StrategyType::kVolatileBackup:
            return ::std::make_unique< VolatileBackupStrategy >( ::std::move( backupArea ),
                                                                 config.backupCollection,
                                                                 config.backupKey,
                                                                 options,
                                                                 config.backupTimeoutMs );
        default:
            return nullptr;
        }
    }

} // geo
} // lap
