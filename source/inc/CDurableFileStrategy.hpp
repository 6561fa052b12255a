/**
 * @file CDurableFileStrategy.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Strategy binding the engine to one durable database file
 * @version 0.1
 * @date 2024-02-02
 *
 *
 */
#ifndef LAP_GEOHISTORY_DURABLEFILESTRATEGY_HPP
#define LAP_GEOHISTORY_DURABLEFILESTRATEGY_HPP

#include <lap/core/CMemory.hpp>

#include "IRecordStrategy.hpp"

namespace lap
{
namespace geo
{
    /**
     * @brief A mutation is durable once the checkpoint after it succeeds
     *
     * A failed checkpoint is reported, the applied mutation stays in place.
     */
    class DurableFileStrategy final : public IRecordStrategy
    {
    public:
        IMP_OPERATOR_NEW(DurableFileStrategy)

    public:
        StrategyType                            Type() const noexcept override          { return StrategyType::kDurableFile; }
        core::Result< void >                    Open() noexcept override;
        core::Result< void >                    EnsureSchema() noexcept override;
        MutationOutcome                         AfterMutation() noexcept override;
        SqlEngine*                              Engine() noexcept override              { return m_pEngine.get(); }
        void                                    Close() noexcept override;

        const core::String&                     GetDatabasePath() const noexcept        { return m_strDatabasePath; }

        DurableFileStrategy( core::StringView databasePath, const EngineOptions &options ) noexcept;
        ~DurableFileStrategy() noexcept;

    private:
        core::String                            m_strDatabasePath;
        EngineOptions                           m_options;
        core::UniqueHandle< SqlEngine >         m_pEngine;
    };

} // geo
} // lap

#endif
