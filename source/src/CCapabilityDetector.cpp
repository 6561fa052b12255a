#include <unistd.h>
#include <lap/core/CPath.hpp>
#include "CCapabilityDetector.hpp"

namespace lap
{
namespace geo
{
    CapabilityDetector::CapabilityDetector( const StoreConfig &config ) noexcept
        : m_config( config )
    {
        ;
    }

    core::Bool CapabilityDetector::IsDurableAreaAvailable() noexcept
    {
        core::LockGuard lock( m_mutex );

        if ( !m_bProbed ) {
            m_bAvailable = ProbeDurableArea();
            m_bProbed = true;

            LAP_GEO_LOG_INFO << "Durable storage area " << ( m_bAvailable ? "available" : "unavailable" )
                             << " at " << m_config.storageRoot;
        }

        return m_bAvailable;
    }

    void CapabilityDetector::Reset() noexcept
    {
        core::LockGuard lock( m_mutex );

        m_bProbed = false;
        m_bAvailable = false;
    }

    core::Bool CapabilityDetector::ProbeDurableArea() const noexcept
    {
        if ( !m_config.durableAreaEnabled ) {
            LAP_GEO_LOG_DEBUG << "Durable storage area disabled by configuration";
            return false;
        }

        // nearest existing ancestor decides, the root itself is created on open
        core::String candidate = m_config.storageRoot;
        while ( !candidate.empty() && !core::Path::isDirectory( candidate ) ) {
            auto pos = candidate.find_last_of( '/' );
            if ( pos == core::String::npos ) {
                candidate = ".";
            } else if ( pos == 0 ) {
                candidate = "/";
            } else {
                candidate.erase( pos );
            }
        }

        if ( candidate.empty() ) {
            LAP_GEO_LOG_DEBUG << "No existing directory above " << m_config.storageRoot;
            return false;
        }

        return ::access( candidate.c_str(), R_OK | W_OK | X_OK ) == 0;
    }

} // geo
} // lap
