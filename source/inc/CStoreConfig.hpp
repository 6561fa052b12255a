/**
 * @file CStoreConfig.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Store configuration loading from the "geohistory" module config
 * @version 0.1
 * @date 2024-02-02
 *
 *
 */
#ifndef LAP_GEOHISTORY_STORECONFIG_HPP
#define LAP_GEOHISTORY_STORECONFIG_HPP

#include <lap/core/CResult.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace geo
{
    /**
     * @brief Read StoreConfig from the core ConfigManager
     *
     * Missing keys keep their defaults. A missing module yields the default
     * configuration.
     *
     * @return kInvalidArgument if the module config cannot be interpreted
     */
    core::Result< StoreConfig >                 LoadStoreConfig() noexcept;

    /**
     * @brief Reject configurations the store cannot run with
     * @return kInvalidArgument naming the first bad field in the log
     */
    core::Result< void >                        ValidateStoreConfig( const StoreConfig &config ) noexcept;

} // geo
} // lap

#endif
