/**
 * @file TestDoubles.hpp
 * @brief Detector and backup area doubles shared by the store tests
 * @date 2025-10-27
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <lap/core/CCore.hpp>
#include "CCapabilityDetector.hpp"
#include "IBackupArea.hpp"
#include "CLocationRecord.hpp"
#include "CRecordStrategyFactory.hpp"

namespace geotest
{
    using namespace ::lap::core;
    using namespace ::lap::geo;

    // Reports the durable area as missing whatever the configuration says
    class UnavailableDetector : public CapabilityDetector
    {
    public:
        explicit UnavailableDetector( const StoreConfig &config ) noexcept
            : CapabilityDetector( config ) {}

        mutable std::atomic< int > probes{ 0 };

    protected:
        Bool ProbeDurableArea() const noexcept override
        {
            ++probes;
            return false;
        }
    };

    // Real probe, slowed down so concurrent initializers overlap
    class SlowDetector : public CapabilityDetector
    {
    public:
        explicit SlowDetector( const StoreConfig &config ) noexcept
            : CapabilityDetector( config ) {}

    protected:
        Bool ProbeDurableArea() const noexcept override
        {
            std::this_thread::sleep_for( std::chrono::milliseconds( 100 ) );
            return CapabilityDetector::ProbeDurableArea();
        }
    };

    template< typename T >
    std::future< Result< T > > readyFuture( Result< T > value )
    {
        std::promise< Result< T > > promise;
        promise.set_value( std::move( value ) );
        return promise.get_future();
    }

    // In-process backup area on the future API
    class MemoryBackupArea : public IBackupArea
    {
    public:
        Bool available() const noexcept override { return true; }

        std::future< Result< String > > GetAsync( StringView collection, StringView key ) noexcept override
        {
            std::lock_guard< std::mutex > lock( m_mutex );
            ++gets;

            auto it = m_entries.find( entryName( collection, key ) );
            if ( it == m_entries.end() ) {
                return readyFuture( Result< String >::FromError( GeoErrc::kKeyNotFound ) );
            }
            return readyFuture( Result< String >::FromValue( it->second ) );
        }

        std::future< Result< void > > PutAsync( StringView collection, StringView key, String value ) noexcept override
        {
            std::lock_guard< std::mutex > lock( m_mutex );
            ++puts;

            m_entries[ entryName( collection, key ) ] = std::move( value );
            return readyFuture( Result< void >::FromValue() );
        }

        void Set( StringView collection, StringView key, String value )
        {
            std::lock_guard< std::mutex > lock( m_mutex );
            m_entries[ entryName( collection, key ) ] = std::move( value );
        }

        bool Has( StringView collection, StringView key )
        {
            std::lock_guard< std::mutex > lock( m_mutex );
            return m_entries.count( entryName( collection, key ) ) != 0;
        }

        String Entry( StringView collection, StringView key )
        {
            std::lock_guard< std::mutex > lock( m_mutex );
            return m_entries[ entryName( collection, key ) ];
        }

        std::atomic< int > gets{ 0 };
        std::atomic< int > puts{ 0 };

    private:
        static String entryName( StringView collection, StringView key )
        {
            return String( collection ) + "/" + String( key );
        }

        std::mutex m_mutex;
        std::map< String, String > m_entries;
    };

    // Reads succeed with "no entry", every write fails
    class FailingBackupArea : public IBackupArea
    {
    public:
        Bool available() const noexcept override { return true; }

        std::future< Result< String > > GetAsync( StringView, StringView ) noexcept override
        {
            return readyFuture( Result< String >::FromError( GeoErrc::kKeyNotFound ) );
        }

        std::future< Result< void > > PutAsync( StringView, StringView, String ) noexcept override
        {
            ++puts;
            return readyFuture( Result< void >::FromError( GeoErrc::kPhysicalStorageFailure ) );
        }

        std::atomic< int > puts{ 0 };
    };

    // Never completes a request
    class HangingBackupArea : public IBackupArea
    {
    public:
        Bool available() const noexcept override { return true; }

        std::future< Result< String > > GetAsync( StringView, StringView ) noexcept override
        {
            std::promise< Result< String > > pending;
            auto future = pending.get_future();
            m_gets.push_back( std::move( pending ) );
            return future;
        }

        std::future< Result< void > > PutAsync( StringView, StringView, String ) noexcept override
        {
            std::promise< Result< void > > pending;
            auto future = pending.get_future();
            m_puts.push_back( std::move( pending ) );
            return future;
        }

    private:
        std::vector< std::promise< Result< String > > > m_gets;
        std::vector< std::promise< Result< void > > > m_puts;
    };

    // Strategy whose engine never opens
    class BrokenStrategy : public IRecordStrategy
    {
    public:
        explicit BrokenStrategy( StrategyType type ) noexcept : m_type( type ) {}

        StrategyType Type() const noexcept override { return m_type; }
        Result< void > Open() noexcept override { return Result< void >::FromError( GeoErrc::kInitializationFailed ); }
        Result< void > EnsureSchema() noexcept override { return Result< void >::FromError( GeoErrc::kNotInitialized ); }
        MutationOutcome AfterMutation() noexcept override { return MutationOutcome{}; }
        SqlEngine* Engine() noexcept override { return nullptr; }
        void Close() noexcept override {}

    private:
        StrategyType m_type;
    };

    // Hands out broken strategies while `broken` is set, real ones otherwise
    class SwitchableStrategyFactory : public RecordStrategyFactory
    {
    public:
        UniqueHandle< IRecordStrategy > Create( StrategyType type,
                                                const StoreConfig &config,
                                                const EngineOptions &options,
                                                SharedHandle< IBackupArea > backupArea ) noexcept override
        {
            ++created;
            if ( broken.load() ) {
                return std::make_unique< BrokenStrategy >( type );
            }
            return RecordStrategyFactory::Create( type, config, options, std::move( backupArea ) );
        }

        std::atomic< bool > broken{ true };
        std::atomic< int > created{ 0 };
    };

    inline LocationRecord makeRecord( const String &id, Int64 timestamp, const String &description )
    {
        LocationRecord record;
        record.id = id;
        record.latitude = 35.681236;
        record.longitude = 139.767125;
        record.description = description;
        record.timestamp = timestamp;
        return record;
    }

    inline Int64 nowMs()
    {
        return std::chrono::duration_cast< std::chrono::milliseconds >(
                   std::chrono::system_clock::now().time_since_epoch() ).count();
    }

    inline void removeTree( const String &path )
    {
        String cmd = "rm -rf " + path;
        (void)system( cmd.c_str() );
    }
} // geotest
