/**
 * @file CStoragePathManager.cpp
 * @brief Implementation of storage path management
 */

#include "CStoragePathManager.hpp"
#include <lap/core/CPath.hpp>
#include <lap/log/CLog.hpp>

namespace lap {
namespace geo {

core::String CStoragePathManager::getDatabaseDirectory(const StoreConfig& config) {
    return core::Path::appendString(config.storageRoot, LAP_GEO_DATABASE_DIR);
}

core::String CStoragePathManager::getDatabasePath(const StoreConfig& config) {
    return core::Path::appendString(getDatabaseDirectory(config), config.databaseFile);
}

core::String CStoragePathManager::getBackupRoot(const StoreConfig& config) {
    if (!config.backupRoot.empty()) {
        return config.backupRoot;
    }

    return core::Path::appendString(config.storageRoot, LAP_GEO_BACKUP_DIR);
}

core::String CStoragePathManager::getCollectionCategoryPath(core::StringView backupRoot,
                                                            core::StringView collection,
                                                            core::StringView category) {
    core::String collectionPath = core::Path::appendString(core::String(backupRoot), core::String(collection));
    return core::Path::appendString(collectionPath, core::String(category));
}

core::Result<void> CStoragePathManager::createCollectionStructure(core::StringView backupRoot,
                                                                  core::StringView collection) {
    core::Vector<core::String> subdirs = {
        LAP_GEO_CATEGORY_CURRENT,
        LAP_GEO_CATEGORY_UPDATE,
        LAP_GEO_CATEGORY_REDUNDANCY
    };

    for (const auto& subdir : subdirs) {
        core::String fullPath = getCollectionCategoryPath(backupRoot, collection, subdir);
        if (!core::Path::createDirectory(fullPath)) {
            LAP_GEO_LOG_ERROR << "Failed to create subdirectory: " << fullPath.data();
            return core::Result<void>::FromError(GeoErrc::kPhysicalStorageFailure);
        }
    }

    LAP_GEO_LOG_DEBUG << "Created backup collection structure: " << collection;
    return core::Result<void>::FromValue();
}

} // namespace geo
} // namespace lap
