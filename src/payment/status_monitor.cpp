#include "payment/status_monitor.hpp"

#include "base/logger.hpp"

namespace masumi::payment
{
    MonitorHandle::MonitorHandle( std::shared_ptr<MonitorState> shared ) : shared_m( std::move( shared ) ) {}

    MonitorHandle::~MonitorHandle()
    {
        Stop();
        if ( thread_m.joinable() )
        {
            // Released from its own callback, the loop winds down by itself
            thread_m.detach();
        }
    }

    void MonitorHandle::Stop()
    {
        {
            std::lock_guard<std::mutex> lock( shared_m->mutex );
            shared_m->stop_requested = true;
            if ( shared_m->thread_id == boost::this_thread::get_id() )
            {
                return;
            }
        }

        std::lock_guard<std::mutex> lock( stop_mutex_m );
        if ( thread_m.joinable() )
        {
            thread_m.interrupt();
            thread_m.join();
        }
    }

    bool MonitorHandle::IsActive() const
    {
        std::lock_guard<std::mutex> lock( shared_m->mutex );
        return shared_m->active && !shared_m->stop_requested;
    }

    std::optional<StatusSnapshot> MonitorHandle::LatestSnapshot() const
    {
        std::lock_guard<std::mutex> lock( shared_m->mutex );
        return shared_m->latest;
    }

    uint64_t MonitorHandle::PollCount() const
    {
        std::lock_guard<std::mutex> lock( shared_m->mutex );
        return shared_m->polls;
    }

    MonitorTarget::~MonitorTarget()
    {
        StopActiveMonitor();
    }

    void MonitorTarget::StopActiveMonitor()
    {
        auto previous = TakeActiveMonitor();
        if ( previous )
        {
            previous->Stop();
        }
    }

    std::shared_ptr<MonitorHandle> MonitorTarget::TakeActiveMonitor()
    {
        std::lock_guard<std::mutex> lock( monitor_mutex_m );
        return std::move( active_monitor_m );
    }

    std::shared_ptr<MonitorHandle> MonitorTarget::InstallMonitor( std::shared_ptr<MonitorHandle> handle )
    {
        std::lock_guard<std::mutex> lock( monitor_mutex_m );
        std::swap( active_monitor_m, handle );
        return handle;
    }

    std::shared_ptr<MonitorHandle> StatusMonitor::Start( const std::shared_ptr<MonitorTarget> &target,
                                                         std::chrono::milliseconds             interval,
                                                         MonitorCallback                       callback )
    {
        target->StopActiveMonitor();

        auto shared = std::make_shared<MonitorState>();
        // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
        std::shared_ptr<MonitorHandle> handle( new MonitorHandle( shared ) );
        handle->thread_m = boost::thread( &StatusMonitor::Run,
                                          std::weak_ptr<MonitorTarget>( target ),
                                          target->MonitorName(),
                                          interval,
                                          std::move( callback ),
                                          shared );

        // A concurrent Start may have installed its own loop in the meantime
        auto displaced = target->InstallMonitor( handle );
        if ( displaced )
        {
            displaced->Stop();
        }
        return handle;
    }

    namespace
    {
        /// Interruption point that also honours a stop requested from the loop's own callback
        bool StopRequested( MonitorState &shared )
        {
            boost::this_thread::interruption_point();
            std::lock_guard<std::mutex> lock( shared.mutex );
            return shared.stop_requested;
        }
    }

    void StatusMonitor::Run( std::weak_ptr<MonitorTarget>           target,
                             std::string                            name,
                             std::chrono::milliseconds              interval,
                             MonitorCallback                        callback,
                             std::shared_ptr<MonitorState>          shared )
    {
        {
            std::lock_guard<std::mutex> lock( shared->mutex );
            shared->thread_id = boost::this_thread::get_id();
        }
        auto logger = base::createLogger( "StatusMonitor" );
        logger->info( "{}: monitoring every {} ms", name, interval.count() );

        try
        {
            while ( !StopRequested( *shared ) )
            {
                {
                    auto instance = target.lock();
                    if ( !instance )
                    {
                        logger->debug( "{}: target released", name );
                        break;
                    }

                    auto snapshots = instance->PollStatus();

                    // In-flight polls are allowed to finish, their results are dropped once stopped
                    if ( StopRequested( *shared ) )
                    {
                        break;
                    }
                    if ( !snapshots )
                    {
                        logger->warn( "{}: status poll failed: {}", name, Describe( snapshots.error() ) );
                    }
                    else
                    {
                        for ( const auto &snapshot : snapshots.value() )
                        {
                            if ( StopRequested( *shared ) )
                            {
                                break;
                            }
                            {
                                std::lock_guard<std::mutex> lock( shared->mutex );
                                shared->latest = snapshot;
                            }
                            try
                            {
                                callback( snapshot );
                            }
                            catch ( const boost::thread_interrupted & )
                            {
                                throw;
                            }
                            catch ( const std::exception &e )
                            {
                                logger->error( "{}: status callback threw: {}", name, e.what() );
                            }
                            catch ( ... )
                            {
                                logger->error( "{}: status callback threw a non-standard exception", name );
                            }
                        }
                    }

                    std::lock_guard<std::mutex> lock( shared->mutex );
                    ++shared->polls;
                }

                if ( StopRequested( *shared ) )
                {
                    break;
                }
                boost::this_thread::sleep_for( boost::chrono::milliseconds( interval.count() ) );
            }
        }
        catch ( const boost::thread_interrupted & )
        {
            logger->debug( "{}: interrupted", name );
        }
        logger->info( "{}: monitoring stopped", name );

        std::lock_guard<std::mutex> lock( shared->mutex );
        shared->active = false;
    }
}
