/**
 * @file IBackupArea.hpp
 * @brief Asynchronous durable key-value area interface
 * @version 0.1
 * @date 2024-02-02
 *
 * Entries are addressed by (collection, key). Every operation completes
 * through a std::future; implementations keep any callback or event style
 * of the underlying storage behind this interface.
 *
 * Error Handling:
 * - Futures resolve to core::Result<T>, they never carry exceptions
 * - A missing entry resolves to GeoErrc::kKeyNotFound
 */

#ifndef LAP_GEOHISTORY_IBACKUPAREA_HPP
#define LAP_GEOHISTORY_IBACKUPAREA_HPP

#include <chrono>
#include <future>
#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace geo
{
    class IBackupArea
    {
    public:
        IMP_OPERATOR_NEW(IBackupArea)

        virtual ~IBackupArea() noexcept = default;

        virtual core::Bool                                          available() const noexcept = 0;

        virtual ::std::future< core::Result< core::String > >       GetAsync( core::StringView collection, core::StringView key ) noexcept = 0;
        virtual ::std::future< core::Result< void > >               PutAsync( core::StringView collection, core::StringView key, core::String value ) noexcept = 0;

    protected:
        IBackupArea() noexcept = default;
        IBackupArea( const IBackupArea& ) = delete;
        IBackupArea& operator=( const IBackupArea& ) = delete;
    };

    /**
     * @brief Wait for a backup future within a bound
     * @return the future's result, or kTimeout
     */
    template< typename T >
    core::Result< T > AwaitBackup( ::std::future< core::Result< T > > future, core::UInt32 timeoutMs ) noexcept
    {
        if ( !future.valid() ) {
            return core::Result< T >::FromError( GeoErrc::kStorageUnavailable );
        }

        if ( future.wait_for( ::std::chrono::milliseconds( timeoutMs ) ) != ::std::future_status::ready ) {
            LAP_GEO_LOG_WARN << "Backup area operation timed out after " << timeoutMs << " ms";
            return core::Result< T >::FromError( GeoErrc::kTimeout );
        }

        try {
            return future.get();
        } catch ( const ::std::future_error& e ) {
            LAP_GEO_LOG_WARN << "Backup area operation abandoned: " << e.what();
            return core::Result< T >::FromError( GeoErrc::kStorageUnavailable );
        }
    }

} // geo
} // lap

#endif
