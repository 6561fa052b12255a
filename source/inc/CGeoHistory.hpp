/**
 * @file CGeoHistory.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief 
 * @version 0.1
 * @date 2024-02-02
 * 
 * 
 */
#ifndef LAP_GEOHISTORY_GEOHISTORY_HPP
#define LAP_GEOHISTORY_GEOHISTORY_HPP

#include <lap/core/CCore.hpp>
#include <lap/log/CLog.hpp>

// geohistory common
#include "CDataType.hpp"
#include "CGeoErrorDomain.hpp"
#include "CLocationRecord.hpp"
#include "CStoreConfig.hpp"

// backup area
#include "IBackupArea.hpp"
#include "CFileBackupArea.hpp"

// store
#include "CCapabilityDetector.hpp"
#include "CRecordStrategyFactory.hpp"
#include "CLocationHistoryStore.hpp"

#endif
