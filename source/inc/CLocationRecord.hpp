/**
 * @file CLocationRecord.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Location detection record types
 * @version 0.1
 * @date 2024-02-02
 *
 *
 */
#ifndef LAP_GEOHISTORY_LOCATIONRECORD_HPP
#define LAP_GEOHISTORY_LOCATIONRECORD_HPP

#include <optional>
#include <nlohmann/json.hpp>
#include <lap/core/CResult.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace geo
{
    /**
     * @brief A single geolocation detection event
     *
     * Records are append/delete only: id and timestamp never change once written.
     */
    struct LocationRecord
    {
        core::String                        id;
        core::Double                        latitude{ 0.0 };
        core::Double                        longitude{ 0.0 };
        core::String                        description;
        core::Int64                         timestamp{ 0 };             // milliseconds since epoch
        ::std::optional< core::String >     imageData;
        AnalysisMode                        analysisMode{ AnalysisMode::kBasic };
        ::std::optional< core::Double >     confidenceScore;
        RecordSource                        source{ RecordSource::kCamera };
        nlohmann::json                      weatherData = nlohmann::json::object();
        nlohmann::json                      nearbyPlaces = nlohmann::json::array();
    };

    /**
     * @brief List/search projection of a record, without image and enrichment payloads
     */
    struct LocationSummary
    {
        core::String                        id;
        core::Double                        latitude{ 0.0 };
        core::Double                        longitude{ 0.0 };
        core::String                        description;
        core::Int64                         timestamp{ 0 };
        AnalysisMode                        analysisMode{ AnalysisMode::kBasic };
        RecordSource                        source{ RecordSource::kCamera };
    };

    struct LocationStatistics
    {
        core::UInt64                        totalLocations{ 0 };
        core::UInt64                        cameraLocations{ 0 };
        core::UInt64                        uploadedLocations{ 0 };
        core::UInt64                        recentLocations{ 0 };
    };

    core::Bool operator== ( const LocationRecord& left, const LocationRecord& right ) noexcept;
    inline core::Bool operator!= ( const LocationRecord& left, const LocationRecord& right ) noexcept
    {
        return !( left == right );
    }

    /**
     * @brief Shape and range check applied before a record is written
     * @param enforceBounds also check latitude/longitude ranges and confidence in [0,1]
     * @return kInvalidRecord on the first violation
     */
    core::Result< void >                    ValidateRecord( const LocationRecord& record, core::Bool enforceBounds ) noexcept;

    // Column order follows QueryBuilder::RecordColumns() / SummaryColumns()
    core::Result< LocationRecord >          RecordFromRow( const SqlRow& row ) noexcept;
    core::Result< LocationSummary >         SummaryFromRow( const SqlRow& row ) noexcept;

    // nlohmann adl hooks, snapshot / export representation
    void                                    to_json( nlohmann::json& j, const LocationRecord& record );
    void                                    from_json( const nlohmann::json& j, LocationRecord& record );
    void                                    to_json( nlohmann::json& j, const LocationSummary& summary );
    void                                    to_json( nlohmann::json& j, const LocationStatistics& statistics );

} // geo
} // lap

#endif
