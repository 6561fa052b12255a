/**
 * @file CGeoErrorDomain.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Error domain of the location history store
 * @version 0.1
 * @date 2024-02-02
 *
 *
 */
#ifndef LAP_GEOHISTORY_GEOERRORDOMAIN_HPP
#define LAP_GEOHISTORY_GEOERRORDOMAIN_HPP

#include <exception>
#include <lap/core/CErrorCode.hpp>
#include <lap/core/CException.hpp>
#include <lap/core/CMemory.hpp>

namespace lap
{
namespace geo
{
    enum class GeoErrc : core::ErrorDomain::CodeType
    {
        kInitializationFailed       = 1,
        kQueryFailed                = 2,
        kBackupSyncFailed           = 3,
        kDuplicateKey               = 4,
        kInvalidRecord              = 5,
        kUnsafeValue                = 6,
        kNotInitialized             = 7,
        kStorageUnavailable         = 8,
        kKeyNotFound                = 9,
        kIntegrityCorrupted         = 10,
        kPhysicalStorageFailure     = 11,
        kInvalidArgument            = 12,
        kTimeout                    = 13
    };

    inline constexpr const core::Char* GeoErrMessage( GeoErrc errCode )
    {
        switch ( errCode ) {
        case GeoErrc::kInitializationFailed:
            return "The query engine could not be instantiated or the durable database could not be opened read/write.";
        case GeoErrc::kQueryFailed:
            return "A statement failed to execute against the query engine.";
        case GeoErrc::kBackupSyncFailed:
            return "The durability step (checkpoint or backup snapshot) failed.";
        case GeoErrc::kDuplicateKey:
            return "A location record with the same id already exists.";
        case GeoErrc::kInvalidRecord:
            return "The location record is malformed or out of range.";
        case GeoErrc::kUnsafeValue:
            return "The value contains characters that cannot be bound safely.";
        case GeoErrc::kNotInitialized:
            return "The location history store is not initialized.";
        case GeoErrc::kStorageUnavailable:
            return "The requested storage area is not available.";
        case GeoErrc::kKeyNotFound:
            return "The requested entry does not exist in the backup area.";
        case GeoErrc::kIntegrityCorrupted:
            return "Stored data cannot be read because the structural integrity is corrupted.";
        case GeoErrc::kPhysicalStorageFailure:
            return "Access to the storage fails.";
        case GeoErrc::kInvalidArgument:
            return "Invalid argument provided to the function.";
        case GeoErrc::kTimeout:
            return "The storage operation did not complete in time.";
        default:
            return "Unknown error";
        }
    }

    class GeoException : public core::Exception
    {
    public:
        IMP_OPERATOR_NEW(GeoException)

        explicit GeoException ( core::ErrorCode errorCode ) noexcept
            : core::Exception( errorCode )
        {
            ;
        }

        ~GeoException() noexcept
        {
            ;
        }

        const core::Char* what() const noexcept
        {
            return GeoErrMessage( static_cast< GeoErrc > ( Error().Value() ) );
        }
    };

    class GeoErrorDomain final : public core::ErrorDomain
    {
    public:
        IMP_OPERATOR_NEW(GeoErrorDomain)

        using Errc          = GeoErrc;
        using Exception     = GeoException;

    public:
        const core::Char*                       Name () const noexcept override                                             { return "GeoErrorDomain"; }
        const core::Char*                       Message ( CodeType errorCode ) const noexcept override                      { return GeoErrMessage( static_cast< Errc >( errorCode ) ); }
        void                                    ThrowAsException ( const core::ErrorCode &errorCode ) const override        { throw GeoException( errorCode ); }

        constexpr GeoErrorDomain () noexcept
            : core::ErrorDomain( 0x8000000000000201 )
        {
            ;
        }
    };

    static constexpr GeoErrorDomain g_geoErrorDomain;

    constexpr const core::ErrorDomain& GetGeoDomain () noexcept
    {
        return g_geoErrorDomain;
    }

    constexpr core::ErrorCode MakeErrorCode ( GeoErrc code, core::ErrorDomain::SupportDataType data ) noexcept
    {
        return { static_cast< core::ErrorDomain::CodeType >( code ), GetGeoDomain(), data };
    }

    inline core::Bool IsGeoError ( const core::ErrorCode &errorCode, GeoErrc code ) noexcept
    {
        return errorCode == MakeErrorCode( code, 0 );
    }
} // geo
} // lap

#endif
