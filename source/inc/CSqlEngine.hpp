/**
 * @file CSqlEngine.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Embedded query engine connection (SQLite)
 * @version 0.1
 * @date 2024-02-02
 *
 *
 */
#ifndef LAP_GEOHISTORY_SQLENGINE_HPP
#define LAP_GEOHISTORY_SQLENGINE_HPP

#include <sqlite3.h>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>
#include <lap/core/CResult.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace geo
{
    class SqlEngine final
    {
    public:
        IMP_OPERATOR_NEW(SqlEngine)

    public:
        /**
         * @brief Open a connection against a database file or LAP_GEO_MEMORY_DATABASE
         *
         * File databases are created when absent and run in WAL mode. A file that
         * can only be opened read-only is rejected.
         *
         * @return kInitializationFailed if the engine cannot be instantiated
         */
        static core::Result< core::UniqueHandle< SqlEngine > >  Open( core::StringView file, const EngineOptions &options ) noexcept;

        core::Result< core::Int64 >                             Execute( const SqlStatement &statement ) noexcept;
        core::Result< void >                                    ExecuteScript( core::StringView sql ) noexcept;
        core::Result< core::Vector< SqlRow > >                  Query( const SqlStatement &statement ) noexcept;
        core::Result< core::Bool >                              HasTable( core::StringView table ) noexcept;

        /**
         * @brief Flush the write-ahead log into the database file
         *
         * No-op for an in-memory connection.
         */
        core::Result< void >                                    Checkpoint() noexcept;

        core::Result< void >                                    BeginTransaction() noexcept;
        core::Result< void >                                    Commit() noexcept;
        core::Result< void >                                    Rollback() noexcept;

        core::Bool                                              IsMemory() const noexcept   { return m_bMemory; }
        const core::String&                                     GetFile() const noexcept    { return m_strFile; }

        ~SqlEngine() noexcept;

    protected:
        explicit SqlEngine( core::StringView file ) noexcept;
        SqlEngine() = delete;
        SqlEngine( const SqlEngine& ) = delete;
        SqlEngine( SqlEngine&& ) = delete;
        SqlEngine& operator=( const SqlEngine& ) = delete;

    private:
        core::Result< void >                                    openDatabase( const EngineOptions &options ) noexcept;
        core::Result< sqlite3_stmt* >                           prepare( const SqlStatement &statement ) noexcept;
        core::Result< void >                                    execRaw( const core::Char* sql ) noexcept;
        SqlValue                                                readColumn( sqlite3_stmt* stmt, core::Int32 column ) const noexcept;

        core::ErrorCode                                         makeErrorCode( core::Int32 sqliteCode ) const noexcept;

    private:
        core::String                                            m_strFile;
        core::Bool                                              m_bMemory{ false };
        core::Bool                                              m_bInTransaction{ false };
        sqlite3*                                                m_pDB{ nullptr };
        core::Mutex                                             m_mutex;
    };

} // geo
} // lap

#endif
