/**
 * @file CLocationHistoryStore.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Session object fronting the location history record store
 * @version 0.1
 * @date 2024-02-02
 *
 * Lifecycle: Uninitialized -> Initializing -> Ready -> Closed, with Failed
 * reached from Initializing when neither strategy can bootstrap. Closed
 * behaves like Uninitialized; Failed holds until Close().
 *
 * Every operation initializes the session on demand. Concurrent callers
 * share one bootstrap attempt and are serialized against the single engine
 * connection afterwards.
 */
#ifndef LAP_GEOHISTORY_LOCATIONHISTORYSTORE_HPP
#define LAP_GEOHISTORY_LOCATIONHISTORYSTORE_HPP

#include <atomic>
#include <future>
#include <optional>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"
#include "CLocationRecord.hpp"
#include "CCapabilityDetector.hpp"
#include "IBackupArea.hpp"
#include "IRecordStrategy.hpp"
#include "CRecordStrategyFactory.hpp"

namespace lap
{
namespace geo
{
    class LocationHistoryStore final
    {
    public:
        IMP_OPERATOR_NEW(LocationHistoryStore)

    public:
        /**
         * @brief Bootstrap the session, or join the bootstrap already running
         * @return kInitializationFailed if no strategy could be bound
         */
        core::Result< void >                                    Initialize() noexcept;

        /**
         * @brief Insert a new record; an existing id is never overwritten
         * @return kInvalidRecord, kUnsafeValue, kDuplicateKey or kQueryFailed on failure.
         *         A failed durability step is reported in the outcome only.
         */
        core::Result< MutationOutcome >                         Save( const LocationRecord &record ) noexcept;

        core::Result< core::Vector< LocationSummary > >         List( core::UInt32 limit = LAP_GEO_DEFAULT_LIST_LIMIT ) noexcept;
        core::Result< ::std::optional< LocationRecord > >       GetById( core::StringView id ) noexcept;

        /**
         * @brief Case-insensitive substring match over the description
         */
        core::Result< core::Vector< LocationSummary > >         Search( core::StringView term, core::UInt32 limit = LAP_GEO_DEFAULT_SEARCH_LIMIT ) noexcept;

        /**
         * @brief Remove one record; an absent id succeeds with affectedRows 0
         */
        core::Result< MutationOutcome >                         Delete( core::StringView id ) noexcept;
        core::Result< MutationOutcome >                         ClearAll() noexcept;

        core::Result< LocationStatistics >                      GetStatistics() noexcept;
        core::Result< core::Vector< LocationRecord > >          ExportAll() noexcept;

        /**
         * @brief Release the engine and return to a state that allows re-initialization
         *
         * Waits for a bootstrap in flight.
         */
        void                                                    Close() noexcept;

        SessionState                                            GetState() const noexcept                   { return m_state.load(); }
        StrategyType                                            GetActiveStrategy() const noexcept          { return m_activeStrategy.load(); }
        core::UInt32                                            GetEngineInstantiationCount() const noexcept{ return m_uEngineInstantiations.load(); }
        core::UInt64                                            GetDurabilityFailureCount() const noexcept  { return m_uDurabilityFailures.load(); }
        const StoreConfig&                                      GetConfig() const noexcept                  { return m_config; }

        explicit LocationHistoryStore( const StoreConfig &config ) noexcept;
        LocationHistoryStore( const StoreConfig &config,
                              core::SharedHandle< CapabilityDetector > detector,
                              core::SharedHandle< IBackupArea > backupArea,
                              core::SharedHandle< RecordStrategyFactory > factory = nullptr ) noexcept;
        ~LocationHistoryStore() noexcept;

    private:
        LocationHistoryStore() = delete;
        LocationHistoryStore( const LocationHistoryStore& ) = delete;
        LocationHistoryStore& operator=( const LocationHistoryStore& ) = delete;

        core::Result< void >                                    bootstrap() noexcept;
        core::Result< void >                                    startStrategy( IRecordStrategy *strategy ) noexcept;
        SqlEngine*                                              activeEngine() noexcept;
        MutationOutcome                                         completeMutation( core::Int64 affectedRows ) noexcept;
        core::Result< core::UInt64 >                            count( SqlEngine &engine, const SqlStatement &statement ) noexcept;

    private:
        StoreConfig                                             m_config;
        core::SharedHandle< CapabilityDetector >                m_pDetector;
        core::SharedHandle< IBackupArea >                       m_pBackupArea;
        core::SharedHandle< RecordStrategyFactory >             m_pFactory;

        core::Mutex                                             m_initMutex;
        ::std::shared_future< core::Result< void > >            m_initFuture;
        ::std::atomic< SessionState >                           m_state{ SessionState::kUninitialized };

        core::Mutex                                             m_opMutex;
        core::UniqueHandle< IRecordStrategy >                   m_pStrategy;
        ::std::atomic< StrategyType >                           m_activeStrategy{ StrategyType::kNone };

        ::std::atomic< core::UInt32 >                           m_uEngineInstantiations{ 0 };
        ::std::atomic< core::UInt64 >                           m_uDurabilityFailures{ 0 };
    };

} // geo
} // lap

#endif
