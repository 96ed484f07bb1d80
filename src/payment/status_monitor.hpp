/**
 * @file       status_monitor.hpp
 * @brief      Background status polling for payments and purchases
 */
#ifndef _MASUMI_STATUS_MONITOR_HPP_
#define _MASUMI_STATUS_MONITOR_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/thread.hpp>

#include "payment/types.hpp"

namespace masumi::payment
{
    using MonitorCallback = std::function<void( const StatusSnapshot & )>;

    /**
     * @brief      State shared between a MonitorHandle and its polling task
     */
    struct MonitorState
    {
        mutable std::mutex            mutex;
        std::optional<StatusSnapshot> latest;
        uint64_t                      polls          = 0;
        bool                          active         = true;
        bool                          stop_requested = false;
        boost::thread::id             thread_id;
    };

    /**
     * @brief      Owns one polling task. Stopping is idempotent and, when called from any
     *             thread other than the task itself, returns only after the task has ended, so
     *             no callback runs after Stop() returns.
     */
    class MonitorHandle
    {
    public:
        ~MonitorHandle();

        MonitorHandle( const MonitorHandle & )            = delete;
        MonitorHandle &operator=( const MonitorHandle & ) = delete;

        void Stop();

        bool IsActive() const;

        /// Last snapshot handed to the callback, for pull-style consumers
        std::optional<StatusSnapshot> LatestSnapshot() const;

        /// Completed polls, failed ones included
        uint64_t PollCount() const;

    private:
        friend class StatusMonitor;

        explicit MonitorHandle( std::shared_ptr<MonitorState> shared );

        std::shared_ptr<MonitorState> shared_m;
        std::mutex                    stop_mutex_m;
        boost::thread                 thread_m;
    };

    /**
     * @brief      Something a StatusMonitor can poll. Keeps track of its active monitor so that
     *             at most one loop runs per target.
     */
    class MonitorTarget
    {
    public:
        virtual ~MonitorTarget();

        /**
         * @brief       One status round trip
         * @return      Snapshots of every record this target tracks
         */
        virtual Result<std::vector<StatusSnapshot>> PollStatus() = 0;

        /// Name used in log lines
        virtual std::string MonitorName() const = 0;

    protected:
        void StopActiveMonitor();

    private:
        friend class StatusMonitor;

        std::shared_ptr<MonitorHandle> TakeActiveMonitor();
        std::shared_ptr<MonitorHandle> InstallMonitor( std::shared_ptr<MonitorHandle> handle );

        std::mutex                     monitor_mutex_m;
        std::shared_ptr<MonitorHandle> active_monitor_m;
    };

    class StatusMonitor
    {
    public:
        /**
         * @brief       Starts polling @param target every @param interval, stopping any loop
         *              already running on it first. Poll errors are logged and never end the
         *              loop. The first poll happens immediately.
         * @param[in]   target Polled through a weak reference; the loop ends once it is gone
         * @param[in]   interval Sleep between the end of one poll and the start of the next
         * @param[in]   callback Invoked once per snapshot, on the monitor thread
         */
        static std::shared_ptr<MonitorHandle> Start( const std::shared_ptr<MonitorTarget> &target,
                                                     std::chrono::milliseconds             interval,
                                                     MonitorCallback                       callback );

    private:
        static void Run( std::weak_ptr<MonitorTarget>           target,
                         std::string                            name,
                         std::chrono::milliseconds              interval,
                         MonitorCallback                        callback,
                         std::shared_ptr<MonitorState>          shared );
    };
}

#endif
