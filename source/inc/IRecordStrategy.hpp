/**
 * @file IRecordStrategy.hpp
 * @brief Persistence strategy interface of the location history store
 * @version 0.1
 * @date 2024-02-02
 *
 * A strategy owns the query engine connection for one session and decides
 * what makes a committed mutation durable. The store binds exactly one
 * strategy per session and never inspects which one it holds.
 */

#ifndef LAP_GEOHISTORY_IRECORDSTRATEGY_HPP
#define LAP_GEOHISTORY_IRECORDSTRATEGY_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "CSqlEngine.hpp"

namespace lap
{
namespace geo
{
    class IRecordStrategy
    {
    public:
        IMP_OPERATOR_NEW(IRecordStrategy)

        virtual ~IRecordStrategy() noexcept = default;

        virtual StrategyType                    Type() const noexcept = 0;

        /**
         * @brief Instantiate the engine connection
         * @return kInitializationFailed if the engine cannot be opened
         */
        virtual core::Result< void >            Open() noexcept = 0;

        /**
         * @brief Create the schema if needed and load any persisted state
         *
         * Safe to call on an engine that already holds the schema.
         */
        virtual core::Result< void >            EnsureSchema() noexcept = 0;

        /**
         * @brief Durability step run after every insert or delete
         *
         * Never fails the mutation; a failed step is reported through the status.
         */
        virtual MutationOutcome                 AfterMutation() noexcept = 0;

        virtual SqlEngine*                      Engine() noexcept = 0;
        virtual void                            Close() noexcept = 0;

    protected:
        IRecordStrategy() noexcept = default;
        IRecordStrategy( const IRecordStrategy& ) = delete;
        IRecordStrategy& operator=( const IRecordStrategy& ) = delete;
    };

    /**
     * @brief Execute the schema DDL on an engine
     */
    core::Result< void >                        ApplySchema( SqlEngine &engine ) noexcept;

} // geo
} // lap

#endif
