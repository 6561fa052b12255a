/**
 * @file CVolatileBackupStrategy.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Strategy running the engine in memory, mirrored into a backup snapshot
 * @version 0.1
 * @date 2024-02-02
 *
 * The whole record set is kept as one JSON array under a single
 * (collection, key) entry of the backup area. The snapshot is replayed into
 * the in-memory engine on startup and rewritten after every mutation.
 *
 * Durability is weaker than the file strategy: a mutation whose snapshot
 * rewrite fails is lost on the next load.
 */
#ifndef LAP_GEOHISTORY_VOLATILEBACKUPSTRATEGY_HPP
#define LAP_GEOHISTORY_VOLATILEBACKUPSTRATEGY_HPP

#include <lap/core/CMemory.hpp>

#include "IRecordStrategy.hpp"
#include "IBackupArea.hpp"

namespace lap
{
namespace geo
{
    struct ReplayReport
    {
        core::UInt32                            replayed{ 0 };
        core::UInt32                            skipped{ 0 };
    };

    class VolatileBackupStrategy final : public IRecordStrategy
    {
    public:
        IMP_OPERATOR_NEW(VolatileBackupStrategy)

    public:
        StrategyType                            Type() const noexcept override          { return StrategyType::kVolatileBackup; }
        core::Result< void >                    Open() noexcept override;
        core::Result< void >                    EnsureSchema() noexcept override;
        MutationOutcome                         AfterMutation() noexcept override;
        SqlEngine*                              Engine() noexcept override              { return m_pEngine.get(); }
        void                                    Close() noexcept override;

        const ReplayReport&                     GetReplayReport() const noexcept        { return m_replay; }

        /**
         * @brief true when the stored snapshot could not be read at startup
         *
         * Snapshot rewrites are suspended so the unreadable snapshot is never
         * replaced by a partial record set.
         */
        core::Bool                              IsBackupSuspended() const noexcept      { return m_bBackupSuspended; }

        VolatileBackupStrategy( core::SharedHandle< IBackupArea > backupArea,
                                core::StringView collection,
                                core::StringView key,
                                const EngineOptions &options,
                                core::UInt32 backupTimeoutMs ) noexcept;
        ~VolatileBackupStrategy() noexcept;

    private:
        core::Result< void >                    replaySnapshot( const core::String &snapshot ) noexcept;
        core::Result< core::String >            buildSnapshot() noexcept;

    private:
        core::SharedHandle< IBackupArea >       m_pBackupArea;
        core::String                            m_strCollection;
        core::String                            m_strKey;
        EngineOptions                           m_options;
        core::UInt32                            m_uBackupTimeoutMs;
        core::UniqueHandle< SqlEngine >         m_pEngine;
        ReplayReport                            m_replay;
        core::Bool                              m_bBackupSuspended{ false };
    };

} // geo
} // lap

#endif
