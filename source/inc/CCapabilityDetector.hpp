/**
 * @file CCapabilityDetector.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Durable storage area feature detection
 * @version 0.1
 * @date 2024-02-02
 *
 *
 */
#ifndef LAP_GEOHISTORY_CAPABILITYDETECTOR_HPP
#define LAP_GEOHISTORY_CAPABILITYDETECTOR_HPP

#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace geo
{
    /**
     * @brief Answers once per session whether the durable file area is usable
     *
     * The probe inspects the storage root without creating or writing anything.
     * An unavailable area is a normal outcome, not an error.
     */
    class CapabilityDetector
    {
    public:
        IMP_OPERATOR_NEW(CapabilityDetector)

    public:
        explicit CapabilityDetector( const StoreConfig &config ) noexcept;
        virtual ~CapabilityDetector() noexcept = default;

        core::Bool                          IsDurableAreaAvailable() noexcept;
        void                                Reset() noexcept;

    protected:
        virtual core::Bool                  ProbeDurableArea() const noexcept;

        CapabilityDetector( const CapabilityDetector& ) = delete;
        CapabilityDetector& operator=( const CapabilityDetector& ) = delete;

    protected:
        StoreConfig                         m_config;

    private:
        core::Mutex                         m_mutex;
        core::Bool                          m_bProbed{ false };
        core::Bool                          m_bAvailable{ false };
    };

} // geo
} // lap

#endif
