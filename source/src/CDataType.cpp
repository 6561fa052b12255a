#include <cerrno>
#include <cstdlib>
#include <limits>
#include "CDataType.hpp"

namespace lap
{
namespace geo
{
    const core::Char* ToString( AnalysisMode mode ) noexcept
    {
        switch( mode ) {
        case AnalysisMode::kBasic:
            return "basic";
        case AnalysisMode::kFunction:
            return "function";
        case AnalysisMode::kGrounding:
            return "grounding";
        case AnalysisMode::kImageSearch:
            return "image-search";
        }

        return "basic";
    }

    const core::Char* ToString( RecordSource source ) noexcept
    {
        switch( source ) {
        case RecordSource::kCamera:
            return "camera";
        case RecordSource::kUpload:
            return "upload";
        }

        return "camera";
    }

    core::Result< AnalysisMode > AnalysisModeFromString( core::StringView value ) noexcept
    {
        using result = core::Result< AnalysisMode >;

        if ( value == "basic" )         return result::FromValue( AnalysisMode::kBasic );
        if ( value == "function" )      return result::FromValue( AnalysisMode::kFunction );
        if ( value == "grounding" )     return result::FromValue( AnalysisMode::kGrounding );
        if ( value == "image-search" )  return result::FromValue( AnalysisMode::kImageSearch );

        return result::FromError( GeoErrc::kInvalidRecord );
    }

    core::Result< RecordSource > RecordSourceFromString( core::StringView value ) noexcept
    {
        using result = core::Result< RecordSource >;

        if ( value == "camera" )        return result::FromValue( RecordSource::kCamera );
        if ( value == "upload" )        return result::FromValue( RecordSource::kUpload );

        return result::FromError( GeoErrc::kInvalidRecord );
    }

    core::Result< core::UInt32 > LimitFromString( core::StringView value ) noexcept
    {
        using result = core::Result< core::UInt32 >;

        if ( value.empty() || value[0] < '0' || value[0] > '9' ) return result::FromError( GeoErrc::kInvalidArgument );

        core::String text( value );
        core::Char* end = nullptr;
        errno = 0;
        unsigned long long parsed = ::std::strtoull( text.c_str(), &end, 10 );

        if ( errno == ERANGE || end == nullptr || *end != '\0'
            || parsed > ::std::numeric_limits< core::UInt32 >::max() ) {
            return result::FromError( GeoErrc::kInvalidArgument );
        }

        return result::FromValue( static_cast< core::UInt32 >( parsed ) );
    }

    const core::Char* ToString( SessionState state ) noexcept
    {
        switch( state ) {
        case SessionState::kUninitialized:
            return "Uninitialized";
        case SessionState::kInitializing:
            return "Initializing";
        case SessionState::kReady:
            return "Ready";
        case SessionState::kClosed:
            return "Closed";
        case SessionState::kFailed:
            return "Failed";
        }

        return "Unknown";
    }

    const core::Char* ToString( StrategyType type ) noexcept
    {
        switch( type ) {
        case StrategyType::kNone:
            return "none";
        case StrategyType::kDurableFile:
            return "durable-file";
        case StrategyType::kVolatileBackup:
            return "volatile-backup";
        }

        return "none";
    }
} // geo
} // lap
