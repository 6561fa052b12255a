/**
 * @file CRecordStrategyFactory.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Builds the persistence strategies the store bootstraps
 * @version 0.1
 * @date 2024-02-02
 *
 *
 */
#ifndef LAP_GEOHISTORY_RECORDSTRATEGYFACTORY_HPP
#define LAP_GEOHISTORY_RECORDSTRATEGYFACTORY_HPP

#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "IBackupArea.hpp"
#include "IRecordStrategy.hpp"

namespace lap
{
namespace geo
{
    class RecordStrategyFactory
    {
    public:
        IMP_OPERATOR_NEW(RecordStrategyFactory)

    public:
        RecordStrategyFactory() noexcept = default;
        virtual ~RecordStrategyFactory() noexcept = default;

        /**
         * @brief Create an unopened strategy of the requested type
         * @param backupArea snapshot target, used by kVolatileBackup only
         * @return nullptr for StrategyType::kNone
         */
        virtual core::UniqueHandle< IRecordStrategy >   Create( StrategyType type,
                                                                const StoreConfig &config,
                                                                const EngineOptions &options,
                                                                core::SharedHandle< IBackupArea > backupArea ) noexcept;

    protected:
        RecordStrategyFactory( const RecordStrategyFactory& ) = delete;
        RecordStrategyFactory& operator=( const RecordStrategyFactory& ) = delete;
    };

} // geo
} // lap

#endif
