/**
 * @file CFileBackupArea.cpp
 * @brief File based asynchronous key-value backup area
 * @version 0.1
 * @date 2024-02-02
 */

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <lap/core/CFile.hpp>
#include <lap/core/CPath.hpp>
#include <lap/core/CTime.hpp>
#include <lap/core/CCrypto.hpp>
#include "CFileBackupArea.hpp"
#include "CStoragePathManager.hpp"

namespace lap
{
namespace geo
{
    namespace
    {
        constexpr core::UInt32 kEnvelopeVersion = 1;
        constexpr const core::Char* kEntrySuffix = ".json";
    }

    // ==================== Constructor & Destructor ====================

    FileBackupArea::FileBackupArea( core::StringView root ) noexcept
        : m_strRoot( root )
    {
        if ( m_strRoot.empty() || !core::Path::createDirectory( m_strRoot ) ) {
            LAP_GEO_LOG_WARN << "Backup area root not usable: " << m_strRoot;
            return;
        }

        try {
            m_worker = ::std::thread( &FileBackupArea::workerLoop, this );
        } catch ( const ::std::system_error& e ) {
            LAP_GEO_LOG_ERROR << "Failed to start backup area worker: " << e.what();
            return;
        }

        m_bAvailable = true;
        LAP_GEO_LOG_INFO << "FileBackupArea initialized at: " << m_strRoot;
    }

    FileBackupArea::~FileBackupArea() noexcept
    {
        {
            ::std::unique_lock< core::Mutex > lock( m_queueMutex );
            m_bStopping = true;
        }
        m_queueCond.notify_all();

        if ( m_worker.joinable() ) {
            m_worker.join();
        }
        m_bAvailable = false;
    }

    // ==================== Worker ====================

    core::Bool FileBackupArea::post( ::std::function< void() > task ) noexcept
    {
        {
            ::std::unique_lock< core::Mutex > lock( m_queueMutex );
            if ( !m_bAvailable || m_bStopping ) return false;

            m_queue.emplace_back( ::std::move( task ) );
        }
        m_queueCond.notify_one();

        return true;
    }

    void FileBackupArea::workerLoop() noexcept
    {
        for ( ;; ) {
            ::std::function< void() > task;
            {
                ::std::unique_lock< core::Mutex > lock( m_queueMutex );
                m_queueCond.wait( lock, [this] { return m_bStopping || !m_queue.empty(); } );

                // drain pending requests before stopping
                if ( m_queue.empty() ) return;

                task = ::std::move( m_queue.front() );
                m_queue.pop_front();
            }

            try {
                task();
            } catch ( const ::std::exception& e ) {
                LAP_GEO_LOG_ERROR << "Backup area request failed with exception: " << e.what();
            }
        }
    }

    // ==================== Callback Requests ====================

    void FileBackupArea::Get( core::StringView collection, core::StringView key, GetCallback callback ) noexcept
    {
        if ( !isValidName( collection ) || !isValidName( key ) ) {
            callback( core::Result< core::String >::FromError( GeoErrc::kInvalidArgument ) );
            return;
        }

        core::String strCollection( collection );
        core::String strKey( key );

        auto posted = post( [this, strCollection, strKey, callback]() {
            callback( readEntry( strCollection, strKey ) );
        } );

        if ( !posted ) {
            callback( core::Result< core::String >::FromError( GeoErrc::kStorageUnavailable ) );
        }
    }

    void FileBackupArea::Put( core::StringView collection, core::StringView key, core::String value, PutCallback callback ) noexcept
    {
        if ( !isValidName( collection ) || !isValidName( key ) ) {
            callback( core::Result< void >::FromError( GeoErrc::kInvalidArgument ) );
            return;
        }

        core::String strCollection( collection );
        core::String strKey( key );
        auto payload = ::std::make_shared< core::String >( ::std::move( value ) );

        auto posted = post( [this, strCollection, strKey, payload, callback]() {
            callback( writeEntry( strCollection, strKey, *payload ) );
        } );

        if ( !posted ) {
            callback( core::Result< void >::FromError( GeoErrc::kStorageUnavailable ) );
        }
    }

    // ==================== Awaitable Requests ====================

    ::std::future< core::Result< core::String > > FileBackupArea::GetAsync( core::StringView collection, core::StringView key ) noexcept
    {
        auto promise = ::std::make_shared< ::std::promise< core::Result< core::String > > >();
        auto future = promise->get_future();

        Get( collection, key, [promise]( core::Result< core::String > result ) {
            promise->set_value( ::std::move( result ) );
        } );

        return future;
    }

    ::std::future< core::Result< void > > FileBackupArea::PutAsync( core::StringView collection, core::StringView key, core::String value ) noexcept
    {
        auto promise = ::std::make_shared< ::std::promise< core::Result< void > > >();
        auto future = promise->get_future();

        Put( collection, key, ::std::move( value ), [promise]( core::Result< void > result ) {
            promise->set_value( ::std::move( result ) );
        } );

        return future;
    }

    // ==================== Entry I/O (worker thread) ====================

    core::Result< core::String > FileBackupArea::readEntry( const core::String &collection, const core::String &key ) noexcept
    {
        using result = core::Result< core::String >;

        core::String currentPath = entryPath( collection, LAP_GEO_CATEGORY_CURRENT, key );
        auto current = loadEnvelope( currentPath );
        if ( current.HasValue() ) return current;

        if ( IsGeoError( current.Error(), GeoErrc::kKeyNotFound ) ) {
            return current;
        }

        // current/ is damaged: fall back to the previous version
        LAP_GEO_LOG_WARN << "Backup entry corrupted, trying redundancy copy: " << currentPath;
        core::String redundancyPath = entryPath( collection, LAP_GEO_CATEGORY_REDUNDANCY, key );
        auto redundancy = loadEnvelope( redundancyPath );
        if ( redundancy.HasValue() ) {
            LAP_GEO_LOG_WARN << "Recovered backup entry from redundancy: " << redundancyPath;
            return redundancy;
        }

        LAP_GEO_LOG_ERROR << "Backup entry and its redundancy copy are unreadable: " << key;
        return result::FromError( GeoErrc::kIntegrityCorrupted );
    }

    core::Result< void > FileBackupArea::writeEntry( const core::String &collection, const core::String &key, const core::String &value ) noexcept
    {
        using result = core::Result< void >;

        auto structure = CStoragePathManager::createCollectionStructure( m_strRoot, collection );
        if ( !structure.HasValue() ) return structure;

        core::String updatePath = entryPath( collection, LAP_GEO_CATEGORY_UPDATE, key );
        core::String currentPath = entryPath( collection, LAP_GEO_CATEGORY_CURRENT, key );
        core::String redundancyPath = entryPath( collection, LAP_GEO_CATEGORY_REDUNDANCY, key );

        // Phase 1: write the envelope to update/
        core::String content;
        try {
            nlohmann::json envelope;
            envelope["version"] = kEnvelopeVersion;
            envelope["savedAt"] = core::Time::GetCurrentTimeISO();
            envelope["crc32"] = checksum( value );
            envelope["payload"] = value;
            content = envelope.dump();
        } catch ( const nlohmann::json::exception& e ) {
            LAP_GEO_LOG_WARN << "Backup entry cannot be serialized: " << e.what();
            return result::FromError( GeoErrc::kInvalidArgument );
        }

        if ( !core::File::Util::WriteBinary( updatePath.data(),
                                             reinterpret_cast< const core::UInt8* >( content.data() ),
                                             content.size(),
                                             true ) ) {
            LAP_GEO_LOG_ERROR << "Failed to write update entry: " << updatePath;
            return result::FromError( GeoErrc::kPhysicalStorageFailure );
        }

        // Phase 2: validate what landed on disk
        auto validateResult = validateEnvelope( updatePath );
        if ( !validateResult.HasValue() ) {
            core::File::Util::remove( updatePath.data() );
            return validateResult;
        }

        // Phase 3: keep the previous version in redundancy/
        auto backupResult = backupToRedundancy( currentPath, redundancyPath );
        if ( !backupResult.HasValue() ) {
            core::File::Util::remove( updatePath.data() );
            return backupResult;
        }

        // Phase 4: atomic commit update/ -> current/
        auto replaceResult = atomicReplace( updatePath, currentPath );
        if ( !replaceResult.HasValue() ) {
            core::File::Util::remove( updatePath.data() );
            return replaceResult;
        }

        LAP_GEO_LOG_DEBUG << "Backup entry committed: " << currentPath;
        return result::FromValue();
    }

    core::Result< core::String > FileBackupArea::loadEnvelope( core::StringView filePath ) noexcept
    {
        using result = core::Result< core::String >;

        if ( !core::File::Util::exists( filePath.data() ) ) {
            return result::FromError( GeoErrc::kKeyNotFound );
        }

        core::Vector< core::UInt8 > fileData;
        if ( !core::File::Util::ReadBinary( filePath.data(), fileData ) ) {
            LAP_GEO_LOG_WARN << "Failed to read backup entry: " << filePath;
            return result::FromError( GeoErrc::kPhysicalStorageFailure );
        }

        core::String content( fileData.begin(), fileData.end() );
        auto envelope = nlohmann::json::parse( content, nullptr, false );
        if ( envelope.is_discarded() || !envelope.is_object() ) {
            LAP_GEO_LOG_WARN << "Backup entry is not valid JSON: " << filePath;
            return result::FromError( GeoErrc::kIntegrityCorrupted );
        }

        auto payload = envelope.find( "payload" );
        auto crc = envelope.find( "crc32" );
        if ( payload == envelope.end() || !payload->is_string() || crc == envelope.end() || !crc->is_string() ) {
            LAP_GEO_LOG_WARN << "Backup entry is missing payload or checksum: " << filePath;
            return result::FromError( GeoErrc::kIntegrityCorrupted );
        }

        core::String value = payload->get< core::String >();
        if ( checksum( value ) != crc->get< core::String >() ) {
            LAP_GEO_LOG_WARN << "Backup entry checksum mismatch: " << filePath;
            return result::FromError( GeoErrc::kIntegrityCorrupted );
        }

        return result::FromValue( ::std::move( value ) );
    }

    core::Result< void > FileBackupArea::validateEnvelope( core::StringView filePath ) noexcept
    {
        auto loaded = loadEnvelope( filePath );
        if ( !loaded.HasValue() ) {
            LAP_GEO_LOG_ERROR << "Integrity validation failed, aborting commit: " << filePath;
            return core::Result< void >::FromError( GeoErrc::kIntegrityCorrupted );
        }

        return core::Result< void >::FromValue();
    }

    core::Result< void > FileBackupArea::backupToRedundancy( core::StringView currentPath, core::StringView redundancyPath ) noexcept
    {
        using result = core::Result< void >;

        if ( !core::File::Util::exists( currentPath.data() ) ) {
            return result::FromValue();
        }

        // a damaged current/ must not replace a good redundancy copy
        if ( !loadEnvelope( currentPath ).HasValue() ) {
            LAP_GEO_LOG_WARN << "Current backup entry invalid, keeping existing redundancy copy";
            return result::FromValue();
        }

        core::Vector< core::UInt8 > fileData;
        if ( !core::File::Util::ReadBinary( currentPath.data(), fileData ) ) {
            LAP_GEO_LOG_ERROR << "Failed to read current entry for backup: " << currentPath;
            return result::FromError( GeoErrc::kPhysicalStorageFailure );
        }

        if ( !core::File::Util::WriteBinary( redundancyPath.data(), fileData.data(), fileData.size(), true ) ) {
            LAP_GEO_LOG_ERROR << "Failed to write redundancy entry: " << redundancyPath;
            return result::FromError( GeoErrc::kPhysicalStorageFailure );
        }

        return result::FromValue();
    }

    core::Result< void > FileBackupArea::atomicReplace( core::StringView updatePath, core::StringView currentPath ) noexcept
    {
        core::String from( updatePath );
        core::String to( currentPath );

        // update/ and current/ are siblings on one filesystem, POSIX rename is atomic
        if ( ::rename( from.c_str(), to.c_str() ) != 0 ) {
            LAP_GEO_LOG_ERROR << "Atomic rename failed: " << ::strerror( errno );
            return core::Result< void >::FromError( GeoErrc::kPhysicalStorageFailure );
        }

        return core::Result< void >::FromValue();
    }

    // ==================== Helpers ====================

    core::String FileBackupArea::entryPath( core::StringView collection, core::StringView category, core::StringView key ) const noexcept
    {
        core::String fileName( key );
        fileName += kEntrySuffix;

        return core::Path::appendString( CStoragePathManager::getCollectionCategoryPath( m_strRoot, collection, category ), fileName );
    }

    core::Bool FileBackupArea::isValidName( core::StringView name ) noexcept
    {
        if ( name.empty() || name == "." || name == ".." ) return false;

        for ( auto ch : name ) {
            if ( ch == '/' || ch == '\\' || ch == '\0' ) return false;
        }

        return true;
    }

    core::String FileBackupArea::checksum( const core::String &payload ) noexcept
    {
        core::UInt32 crc32 = core::Crypto::Util::computeCrc32( reinterpret_cast< const core::UInt8* >( payload.data() ), payload.size() );

        core::UInt8 bytes[4] = {
            static_cast< core::UInt8 >( ( crc32 >> 24 ) & 0xFF ),
            static_cast< core::UInt8 >( ( crc32 >> 16 ) & 0xFF ),
            static_cast< core::UInt8 >( ( crc32 >> 8 ) & 0xFF ),
            static_cast< core::UInt8 >( crc32 & 0xFF )
        };
        return core::Crypto::Util::bytesToHex( bytes, 4 );
    }

} // geo
} // lap
