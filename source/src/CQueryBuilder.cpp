#include "CQueryBuilder.hpp"

namespace lap
{
namespace geo
{
namespace
{
    constexpr const core::Char* kRecordColumns =
        "id, latitude, longitude, description, timestamp, image_data, "
        "analysis_mode, confidence_score, source, weather_data, nearby_places";

    constexpr const core::Char* kSummaryColumns =
        "id, latitude, longitude, description, timestamp, analysis_mode, source";

    core::Result< core::String > dumpPayload( const nlohmann::json& payload, const nlohmann::json& fallback ) noexcept
    {
        using result = core::Result< core::String >;

        try {
            return result::FromValue( payload.is_null() ? fallback.dump() : payload.dump() );
        } catch ( const nlohmann::json::exception& e ) {
            LAP_GEO_LOG_WARN << "Enrichment payload cannot be serialized: " << e.what();
            return result::FromError( GeoErrc::kUnsafeValue );
        }
    }
}

    // ==================== Schema ====================

    core::Vector< core::String > QueryBuilder::SchemaStatements() noexcept
    {
        return {
            "CREATE TABLE IF NOT EXISTS location_history ("
            "    id               TEXT PRIMARY KEY,"
            "    latitude         DECIMAL(10,8) NOT NULL,"
            "    longitude        DECIMAL(11,8) NOT NULL,"
            "    description      TEXT NOT NULL,"
            "    timestamp        TIMESTAMP NOT NULL,"
            "    image_data       TEXT NULL,"
            "    analysis_mode    TEXT NOT NULL,"
            "    confidence_score DECIMAL(3,2) NULL,"
            "    source           TEXT NOT NULL,"
            "    weather_data     JSON,"
            "    nearby_places    JSON"
            ");",
            "CREATE INDEX IF NOT EXISTS idx_location_history_timestamp ON location_history(timestamp DESC);",
            "CREATE INDEX IF NOT EXISTS idx_location_history_coordinates ON location_history(latitude, longitude);",
            "CREATE INDEX IF NOT EXISTS idx_location_history_source ON location_history(source);"
        };
    }

    // ==================== Mutations ====================

    core::Result< SqlStatement > QueryBuilder::Insert( const LocationRecord& record ) noexcept
    {
        using result = core::Result< SqlStatement >;

        for ( auto text : { core::StringView( record.id ), core::StringView( record.description ) } ) {
            auto check = CheckText( text );
            if ( !check.HasValue() ) return result::FromError( check.Error() );
        }

        if ( record.imageData.has_value() ) {
            auto check = CheckText( *record.imageData );
            if ( !check.HasValue() ) return result::FromError( check.Error() );
        }

        // payload columns carry NUMERIC affinity, only structured JSON text is stored unchanged
        if ( !record.weatherData.is_null() && !record.weatherData.is_object() ) {
            LAP_GEO_LOG_WARN << "Rejected record " << record.id << ": weather data is not an object";
            return result::FromError( GeoErrc::kInvalidRecord );
        }

        if ( !record.nearbyPlaces.is_null() && !record.nearbyPlaces.is_array() ) {
            LAP_GEO_LOG_WARN << "Rejected record " << record.id << ": nearby places is not an array";
            return result::FromError( GeoErrc::kInvalidRecord );
        }

        auto weather = dumpPayload( record.weatherData, nlohmann::json::object() );
        if ( !weather.HasValue() ) return result::FromError( weather.Error() );

        auto places = dumpPayload( record.nearbyPlaces, nlohmann::json::array() );
        if ( !places.HasValue() ) return result::FromError( places.Error() );

        SqlStatement statement;
        statement.text = core::String( "INSERT INTO location_history (" ) + kRecordColumns
                       + ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
        statement.params = {
            SqlValue( record.id ),
            SqlValue( record.latitude ),
            SqlValue( record.longitude ),
            SqlValue( record.description ),
            SqlValue( record.timestamp ),
            record.imageData.has_value() ? SqlValue( *record.imageData ) : SqlValue( SqlNull{} ),
            SqlValue( core::String( ToString( record.analysisMode ) ) ),
            record.confidenceScore.has_value() ? SqlValue( *record.confidenceScore ) : SqlValue( SqlNull{} ),
            SqlValue( core::String( ToString( record.source ) ) ),
            SqlValue( weather.Value() ),
            SqlValue( places.Value() )
        };

        return result::FromValue( ::std::move( statement ) );
    }

    core::Result< SqlStatement > QueryBuilder::DeleteById( core::StringView id ) noexcept
    {
        using result = core::Result< SqlStatement >;

        auto check = CheckText( id );
        if ( !check.HasValue() ) return result::FromError( check.Error() );

        return result::FromValue( SqlStatement{ "DELETE FROM location_history WHERE id = ?;",
                                                { SqlValue( core::String( id ) ) } } );
    }

    SqlStatement QueryBuilder::DeleteAll() noexcept
    {
        return { "DELETE FROM location_history;", {} };
    }

    // ==================== Queries ====================

    SqlStatement QueryBuilder::SelectSummaries( core::UInt32 limit ) noexcept
    {
        return { core::String( "SELECT " ) + kSummaryColumns
                    + " FROM location_history ORDER BY timestamp DESC LIMIT ?;",
                 { SqlValue( static_cast< core::Int64 >( limit ) ) } };
    }

    core::Result< SqlStatement > QueryBuilder::SelectById( core::StringView id ) noexcept
    {
        using result = core::Result< SqlStatement >;

        auto check = CheckText( id );
        if ( !check.HasValue() ) return result::FromError( check.Error() );

        return result::FromValue( SqlStatement{ core::String( "SELECT " ) + kRecordColumns
                                                    + " FROM location_history WHERE id = ?;",
                                                { SqlValue( core::String( id ) ) } } );
    }

    core::Result< SqlStatement > QueryBuilder::Search( core::StringView term, core::UInt32 limit ) noexcept
    {
        using result = core::Result< SqlStatement >;

        auto check = CheckText( term );
        if ( !check.HasValue() ) return result::FromError( check.Error() );

        core::String pattern = "%" + EscapeLikePattern( term ) + "%";

        return result::FromValue( SqlStatement{ core::String( "SELECT " ) + kSummaryColumns
                                                    + " FROM location_history WHERE " LAP_GEO_FOLD_FUNCTION "(description) LIKE "
                                                      LAP_GEO_FOLD_FUNCTION "(?) ESCAPE '\\'"
                                                      " ORDER BY timestamp DESC LIMIT ?;",
                                                { SqlValue( ::std::move( pattern ) ),
                                                  SqlValue( static_cast< core::Int64 >( limit ) ) } } );
    }

    SqlStatement QueryBuilder::SelectAll() noexcept
    {
        return { core::String( "SELECT " ) + kRecordColumns + " FROM location_history ORDER BY timestamp DESC;", {} };
    }

    SqlStatement QueryBuilder::CountAll() noexcept
    {
        return { "SELECT COUNT(*) FROM location_history;", {} };
    }

    SqlStatement QueryBuilder::CountBySource( RecordSource source ) noexcept
    {
        return { "SELECT COUNT(*) FROM location_history WHERE source = ?;",
                 { SqlValue( core::String( ToString( source ) ) ) } };
    }

    SqlStatement QueryBuilder::CountSince( core::Int64 timestampMs ) noexcept
    {
        return { "SELECT COUNT(*) FROM location_history WHERE timestamp > ?;",
                 { SqlValue( timestampMs ) } };
    }

    // ==================== Value Checks ====================

    core::Result< void > QueryBuilder::CheckText( core::StringView value ) noexcept
    {
        using result = core::Result< void >;

        const auto* bytes = reinterpret_cast< const core::UInt8* >( value.data() );
        const core::Size size = value.size();
        core::Size i = 0;

        while ( i < size ) {
            core::UInt8 lead = bytes[i];

            if ( lead == 0x00 ) {
                LAP_GEO_LOG_WARN << "Rejected text value: embedded NUL at offset " << static_cast< core::UInt64 >( i );
                return result::FromError( GeoErrc::kUnsafeValue );
            }

            if ( lead < 0x80 ) {
                ++i;
                continue;
            }

            core::Size length = 0;
            core::UInt32 codePoint = 0;
            core::UInt32 minimum = 0;

            if ( ( lead & 0xE0 ) == 0xC0 ) {
                length = 2; codePoint = lead & 0x1F; minimum = 0x80;
            } else if ( ( lead & 0xF0 ) == 0xE0 ) {
                length = 3; codePoint = lead & 0x0F; minimum = 0x800;
            } else if ( ( lead & 0xF8 ) == 0xF0 ) {
                length = 4; codePoint = lead & 0x07; minimum = 0x10000;
            } else {
                LAP_GEO_LOG_WARN << "Rejected text value: invalid UTF-8 lead byte at offset " << static_cast< core::UInt64 >( i );
                return result::FromError( GeoErrc::kUnsafeValue );
            }

            if ( i + length > size ) {
                LAP_GEO_LOG_WARN << "Rejected text value: truncated UTF-8 sequence";
                return result::FromError( GeoErrc::kUnsafeValue );
            }

            for ( core::Size k = 1; k < length; ++k ) {
                core::UInt8 next = bytes[i + k];
                if ( ( next & 0xC0 ) != 0x80 ) {
                    LAP_GEO_LOG_WARN << "Rejected text value: invalid UTF-8 continuation byte";
                    return result::FromError( GeoErrc::kUnsafeValue );
                }
                codePoint = ( codePoint << 6 ) | ( next & 0x3F );
            }

            // overlong forms, surrogates and values past U+10FFFF
            if ( codePoint < minimum || codePoint > 0x10FFFF || ( codePoint >= 0xD800 && codePoint <= 0xDFFF ) ) {
                LAP_GEO_LOG_WARN << "Rejected text value: invalid code point";
                return result::FromError( GeoErrc::kUnsafeValue );
            }

            i += length;
        }

        return result::FromValue();
    }

    core::String QueryBuilder::EscapeLikePattern( core::StringView term ) noexcept
    {
        core::String escaped;
        escaped.reserve( term.size() );

        for ( auto ch : term ) {
            if ( ch == '\\' || ch == '%' || ch == '_' ) {
                escaped.push_back( '\\' );
            }
            escaped.push_back( ch );
        }

        return escaped;
    }

    const core::Char* QueryBuilder::RecordColumns() noexcept
    {
        return kRecordColumns;
    }

    const core::Char* QueryBuilder::SummaryColumns() noexcept
    {
        return kSummaryColumns;
    }

} // geo
} // lap
