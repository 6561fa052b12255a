/**
 * @file CFileBackupArea.hpp
 * @brief File based asynchronous key-value backup area
 * @version 0.1
 * @date 2024-02-02
 *
 * Each entry is one JSON envelope file:
 * ```json
 * {
 *   "version": 1,
 *   "savedAt": "2024-02-02T10:00:00Z",
 *   "crc32": "1A2B3C4D",
 *   "payload": "..."
 * }
 * ```
 *
 * Requests run on a single worker thread and complete through callbacks;
 * GetAsync/PutAsync turn those callbacks into futures.
 *
 * @note Follows Core module constraints:
 * - Uses core::File for all file I/O (no std::fstream)
 * - Uses core::Path for path operations
 */
#ifndef LAP_GEOHISTORY_FILEBACKUPAREA_HPP
#define LAP_GEOHISTORY_FILEBACKUPAREA_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <thread>
#include <nlohmann/json.hpp>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"
#include "IBackupArea.hpp"

namespace lap
{
namespace geo
{
    class FileBackupArea final : public IBackupArea
    {
    public:
        IMP_OPERATOR_NEW(FileBackupArea)

        using GetCallback = ::std::function< void( core::Result< core::String > ) >;
        using PutCallback = ::std::function< void( core::Result< void > ) >;

    public:
        core::Bool                                              available() const noexcept override { return m_bAvailable; }

        ::std::future< core::Result< core::String > >           GetAsync( core::StringView collection, core::StringView key ) noexcept override;
        ::std::future< core::Result< void > >                   PutAsync( core::StringView collection, core::StringView key, core::String value ) noexcept override;

        /**
         * @brief Callback form of the requests, invoked on the worker thread
         */
        void                                                    Get( core::StringView collection, core::StringView key, GetCallback callback ) noexcept;
        void                                                    Put( core::StringView collection, core::StringView key, core::String value, PutCallback callback ) noexcept;

        explicit FileBackupArea( core::StringView root ) noexcept;
        ~FileBackupArea() noexcept;

    protected:
        FileBackupArea() = delete;
        FileBackupArea( const FileBackupArea& ) = delete;
        FileBackupArea& operator=( const FileBackupArea& ) = delete;

    private:
        core::Bool                                              post( ::std::function< void() > task ) noexcept;
        void                                                    workerLoop() noexcept;

        core::Result< core::String >                            readEntry( const core::String &collection, const core::String &key ) noexcept;
        core::Result< void >                                    writeEntry( const core::String &collection, const core::String &key, const core::String &value ) noexcept;

        core::Result< core::String >                            loadEnvelope( core::StringView filePath ) noexcept;
        core::Result< void >                                    validateEnvelope( core::StringView filePath ) noexcept;
        core::Result< void >                                    backupToRedundancy( core::StringView currentPath, core::StringView redundancyPath ) noexcept;
        core::Result< void >                                    atomicReplace( core::StringView updatePath, core::StringView currentPath ) noexcept;

        core::String                                            entryPath( core::StringView collection, core::StringView category, core::StringView key ) const noexcept;
        static core::Bool                                       isValidName( core::StringView name ) noexcept;
        static core::String                                     checksum( const core::String &payload ) noexcept;

    private:
        core::String                                            m_strRoot;
        core::Bool                                              m_bAvailable{ false };

        core::Mutex                                             m_queueMutex;
        ::std::condition_variable_any                           m_queueCond;
        ::std::deque< ::std::function< void() > >               m_queue;
        core::Bool                                              m_bStopping{ false };
        ::std::thread                                           m_worker;
    };

} // geo
} // lap

#endif
