/**
 * @file CStoragePathManager.hpp
 * @brief Storage path management for the location history store
 *
 * All paths are derived from StoreConfig and built with Core::Path.
 */

#ifndef LAP_GEOHISTORY_CSTORAGEPATHMANAGER_HPP
#define LAP_GEOHISTORY_CSTORAGEPATHMANAGER_HPP

#include <lap/core/CCore.hpp>

#include "CDataType.hpp"

namespace lap {
namespace geo {

/**
 * @class CStoragePathManager
 * @brief Resolves the on-disk layout below the configured storage root
 *
 * Directory Structure:
 * {storageRoot}/
 * ├── db/
 * │   └── {databaseFile}          # durable file strategy
 * └── backup/                     # key-value backup area (unless backupRoot is set)
 *     └── {collection}/
 *         ├── current/            # active entries
 *         ├── update/             # entry being written
 *         └── redundancy/         # previous version of each entry
 */
class CStoragePathManager {
public:
    /**
     * @brief Get the database directory
     * @return {storageRoot}/db
     */
    static core::String getDatabaseDirectory(const StoreConfig& config);

    /**
     * @brief Get the durable database file path
     * @return {storageRoot}/db/{databaseFile}
     */
    static core::String getDatabasePath(const StoreConfig& config);

    /**
     * @brief Get the root of the key-value backup area
     * @return backupRoot if configured, otherwise {storageRoot}/backup
     */
    static core::String getBackupRoot(const StoreConfig& config);

    /**
     * @brief Get the directory of one category of a backup collection
     * @return {backupRoot}/{collection}/{category}
     */
    static core::String getCollectionCategoryPath(core::StringView backupRoot,
                                                  core::StringView collection,
                                                  core::StringView category);

    /**
     * @brief Create current/, update/ and redundancy/ for a backup collection
     * @return Success or kPhysicalStorageFailure
     */
    static core::Result<void> createCollectionStructure(core::StringView backupRoot,
                                                        core::StringView collection);
};

} // namespace geo
} // namespace lap

#endif // LAP_GEOHISTORY_CSTORAGEPATHMANAGER_HPP
