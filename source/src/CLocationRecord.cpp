#include <cmath>
#include "CLocationRecord.hpp"

namespace lap
{
namespace geo
{
namespace
{
    constexpr core::Size kRecordColumnCount    = 11;
    constexpr core::Size kSummaryColumnCount   = 7;

    core::Bool columnAsString( const SqlValue& value, core::String& out ) noexcept
    {
        auto str = ::std::get_if< core::String >( &value );
        if ( str == nullptr ) return false;

        out = *str;
        return true;
    }

    // NUMERIC affinity columns hand back integers for whole numbers
    core::Bool columnAsDouble( const SqlValue& value, core::Double& out ) noexcept
    {
        switch( static_cast< ESqlValueIndicate >( ::lap::core::GetVariantIndex( value ) ) ) {
        case ESqlValueIndicate::SqlValue_double:
            out = ::std::get< core::Double >( value );
            return true;
        case ESqlValueIndicate::SqlValue_int64:
            out = static_cast< core::Double >( ::std::get< core::Int64 >( value ) );
            return true;
        default:
            return false;
        }
    }

    core::Bool columnAsInt64( const SqlValue& value, core::Int64& out ) noexcept
    {
        switch( static_cast< ESqlValueIndicate >( ::lap::core::GetVariantIndex( value ) ) ) {
        case ESqlValueIndicate::SqlValue_int64:
            out = ::std::get< core::Int64 >( value );
            return true;
        case ESqlValueIndicate::SqlValue_double:
            out = static_cast< core::Int64 >( ::std::get< core::Double >( value ) );
            return true;
        default:
            return false;
        }
    }

    nlohmann::json columnAsJson( const SqlValue& value, const nlohmann::json& fallback ) noexcept
    {
        switch( static_cast< ESqlValueIndicate >( ::lap::core::GetVariantIndex( value ) ) ) {
        case ESqlValueIndicate::SqlValue_string:
            {
                auto parsed = nlohmann::json::parse( ::std::get< core::String >( value ), nullptr, false );
                if ( parsed.is_discarded() ) {
                    LAP_GEO_LOG_WARN << "Stored enrichment payload is not valid JSON, using default";
                    return fallback;
                }
                return parsed;
            }
        case ESqlValueIndicate::SqlValue_int64:
            return nlohmann::json( ::std::get< core::Int64 >( value ) );
        case ESqlValueIndicate::SqlValue_double:
            return nlohmann::json( ::std::get< core::Double >( value ) );
        default:
            return fallback;
        }
    }
}

    core::Bool operator== ( const LocationRecord& left, const LocationRecord& right ) noexcept
    {
        return left.id == right.id
            && left.latitude == right.latitude
            && left.longitude == right.longitude
            && left.description == right.description
            && left.timestamp == right.timestamp
            && left.imageData == right.imageData
            && left.analysisMode == right.analysisMode
            && left.confidenceScore == right.confidenceScore
            && left.source == right.source
            && left.weatherData == right.weatherData
            && left.nearbyPlaces == right.nearbyPlaces;
    }

    core::Result< void > ValidateRecord( const LocationRecord& record, core::Bool enforceBounds ) noexcept
    {
        using result = core::Result< void >;

        if ( record.id.empty() ) {
            LAP_GEO_LOG_WARN << "Rejected record with empty id";
            return result::FromError( GeoErrc::kInvalidRecord );
        }

        if ( !::std::isfinite( record.latitude ) || !::std::isfinite( record.longitude ) ) {
            LAP_GEO_LOG_WARN << "Rejected record " << record.id << ": non-finite coordinates";
            return result::FromError( GeoErrc::kInvalidRecord );
        }

        if ( record.confidenceScore.has_value() && !::std::isfinite( *record.confidenceScore ) ) {
            LAP_GEO_LOG_WARN << "Rejected record " << record.id << ": non-finite confidence";
            return result::FromError( GeoErrc::kInvalidRecord );
        }

        if ( !enforceBounds ) return result::FromValue();

        if ( record.latitude < -90.0 || record.latitude > 90.0
            || record.longitude < -180.0 || record.longitude > 180.0 ) {
            LAP_GEO_LOG_WARN.logFormat( "Rejected record %s: coordinates (%f, %f) out of range",
                                        record.id.c_str(), record.latitude, record.longitude );
            return result::FromError( GeoErrc::kInvalidRecord );
        }

        if ( record.confidenceScore.has_value()
            && ( *record.confidenceScore < 0.0 || *record.confidenceScore > 1.0 ) ) {
            LAP_GEO_LOG_WARN << "Rejected record " << record.id << ": confidence out of [0,1]";
            return result::FromError( GeoErrc::kInvalidRecord );
        }

        return result::FromValue();
    }

    core::Result< LocationRecord > RecordFromRow( const SqlRow& row ) noexcept
    {
        using result = core::Result< LocationRecord >;

        if ( row.size() != kRecordColumnCount ) {
            return result::FromError( GeoErrc::kQueryFailed );
        }

        LocationRecord record;
        core::String mode, source;

        if ( !columnAsString( row[0], record.id )
            || !columnAsDouble( row[1], record.latitude )
            || !columnAsDouble( row[2], record.longitude )
            || !columnAsString( row[3], record.description )
            || !columnAsInt64( row[4], record.timestamp )
            || !columnAsString( row[6], mode )
            || !columnAsString( row[8], source ) ) {
            return result::FromError( GeoErrc::kIntegrityCorrupted );
        }

        core::String imageData;
        if ( columnAsString( row[5], imageData ) ) {
            record.imageData = ::std::move( imageData );
        }

        core::Double confidence{ 0.0 };
        if ( columnAsDouble( row[7], confidence ) ) {
            record.confidenceScore = confidence;
        }

        auto modeResult = AnalysisModeFromString( mode );
        auto sourceResult = RecordSourceFromString( source );
        if ( !modeResult.HasValue() || !sourceResult.HasValue() ) {
            return result::FromError( GeoErrc::kIntegrityCorrupted );
        }
        record.analysisMode = modeResult.Value();
        record.source = sourceResult.Value();

        record.weatherData = columnAsJson( row[9], nlohmann::json::object() );
        record.nearbyPlaces = columnAsJson( row[10], nlohmann::json::array() );

        return result::FromValue( ::std::move( record ) );
    }

    core::Result< LocationSummary > SummaryFromRow( const SqlRow& row ) noexcept
    {
        using result = core::Result< LocationSummary >;

        if ( row.size() != kSummaryColumnCount ) {
            return result::FromError( GeoErrc::kQueryFailed );
        }

        LocationSummary summary;
        core::String mode, source;

        if ( !columnAsString( row[0], summary.id )
            || !columnAsDouble( row[1], summary.latitude )
            || !columnAsDouble( row[2], summary.longitude )
            || !columnAsString( row[3], summary.description )
            || !columnAsInt64( row[4], summary.timestamp )
            || !columnAsString( row[5], mode )
            || !columnAsString( row[6], source ) ) {
            return result::FromError( GeoErrc::kIntegrityCorrupted );
        }

        auto modeResult = AnalysisModeFromString( mode );
        auto sourceResult = RecordSourceFromString( source );
        if ( !modeResult.HasValue() || !sourceResult.HasValue() ) {
            return result::FromError( GeoErrc::kIntegrityCorrupted );
        }
        summary.analysisMode = modeResult.Value();
        summary.source = sourceResult.Value();

        return result::FromValue( ::std::move( summary ) );
    }

    // ==================== JSON Representation ====================

    void to_json( nlohmann::json& j, const LocationRecord& record )
    {
        j = nlohmann::json{
            { "id",                 record.id },
            { "latitude",           record.latitude },
            { "longitude",          record.longitude },
            { "description",        record.description },
            { "timestamp",          record.timestamp },
            { "analysis_mode",      ToString( record.analysisMode ) },
            { "source",             ToString( record.source ) },
            { "weather_data",       record.weatherData },
            { "nearby_places",      record.nearbyPlaces }
        };

        j["image_data"] = record.imageData.has_value() ? nlohmann::json( *record.imageData ) : nlohmann::json();
        j["confidence_score"] = record.confidenceScore.has_value() ? nlohmann::json( *record.confidenceScore ) : nlohmann::json();
    }

    void from_json( const nlohmann::json& j, LocationRecord& record )
    {
        record.id           = j.at( "id" ).get< core::String >();
        record.latitude     = j.at( "latitude" ).get< core::Double >();
        record.longitude    = j.at( "longitude" ).get< core::Double >();
        record.description  = j.at( "description" ).get< core::String >();
        record.timestamp    = j.at( "timestamp" ).get< core::Int64 >();

        auto mode = AnalysisModeFromString( j.at( "analysis_mode" ).get< core::String >() );
        auto source = RecordSourceFromString( j.at( "source" ).get< core::String >() );
        if ( !mode.HasValue() || !source.HasValue() ) {
            throw GeoException( MakeErrorCode( GeoErrc::kInvalidRecord, 0 ) );
        }
        record.analysisMode = mode.Value();
        record.source       = source.Value();

        auto image = j.find( "image_data" );
        if ( image != j.end() && image->is_string() ) {
            record.imageData = image->get< core::String >();
        } else {
            record.imageData.reset();
        }

        auto confidence = j.find( "confidence_score" );
        if ( confidence != j.end() && confidence->is_number() ) {
            record.confidenceScore = confidence->get< core::Double >();
        } else {
            record.confidenceScore.reset();
        }

        record.weatherData  = j.value( "weather_data", nlohmann::json::object() );
        record.nearbyPlaces = j.value( "nearby_places", nlohmann::json::array() );
        if ( record.weatherData.is_null() )  record.weatherData = nlohmann::json::object();
        if ( record.nearbyPlaces.is_null() ) record.nearbyPlaces = nlohmann::json::array();
    }

    void to_json( nlohmann::json& j, const LocationSummary& summary )
    {
        j = nlohmann::json{
            { "id",                 summary.id },
            { "latitude",           summary.latitude },
            { "longitude",          summary.longitude },
            { "description",        summary.description },
            { "timestamp",          summary.timestamp },
            { "analysis_mode",      ToString( summary.analysisMode ) },
            { "source",             ToString( summary.source ) }
        };
    }

    void to_json( nlohmann::json& j, const LocationStatistics& statistics )
    {
        j = nlohmann::json{
            { "totalLocations",     statistics.totalLocations },
            { "cameraLocations",    statistics.cameraLocations },
            { "uploadedLocations",  statistics.uploadedLocations },
            { "recentLocations",    statistics.recentLocations }
        };
    }

} // geo
} // lap
