#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>

#include <rapidjson/document.h>

#include "mock/src/api/transport/http_client_mock.hpp"
#include "payment/payment_request.hpp"
#include "payment/status_monitor.hpp"
#include "testutil/wait_condition.hpp"

using namespace masumi;
using namespace masumi::payment;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

namespace
{
    class FakeTarget : public MonitorTarget
    {
    public:
        ~FakeTarget() override
        {
            StopActiveMonitor();
        }

        Result<std::vector<StatusSnapshot>> PollStatus() override
        {
            const int poll = ++polls;
            if ( poll == fail_on_poll )
            {
                return Fail( PaymentError::SERVER, "service unavailable", 503 );
            }
            StatusSnapshot snapshot;
            snapshot.blockchain_identifier = "bc_1";
            snapshot.on_chain_state        = poll >= 3 ? "FundsLocked" : "";
            snapshot.requested_action      = "WaitingForExternalAction";
            return std::vector<StatusSnapshot>{ snapshot };
        }

        std::string MonitorName() const override
        {
            return "FakeTarget";
        }

        std::atomic<int> polls{ 0 };
        int              fail_on_poll = 0;
    };
}

class StatusMonitorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        target_ = std::make_shared<FakeTarget>();
    }

    MonitorCallback Counting()
    {
        return [this]( const StatusSnapshot & ) { ++callbacks_; };
    }

    std::shared_ptr<FakeTarget> target_;
    std::atomic<int>            callbacks_{ 0 };
};

/**
 * @given A monitor with a 100 ms interval
 * @when it runs for about 550 ms
 * @then the target is polled immediately and then once per interval
 */
TEST_F( StatusMonitorTest, PollsAtFixedInterval )
{
    auto handle = StatusMonitor::Start( target_, 100ms, Counting() );
    std::this_thread::sleep_for( 550ms );
    handle->Stop();

    // polls at 0, 100, ..., 500 ms: floor(550 / 100) plus the immediate one, give or take one
    EXPECT_GE( target_->polls.load(), 4 );
    EXPECT_LE( target_->polls.load(), 6 );
    // a poll in flight at stop time is dropped
    EXPECT_GE( callbacks_.load(), target_->polls.load() - 1 );
    EXPECT_LE( handle->PollCount(), static_cast<uint64_t>( target_->polls.load() ) );
}

/**
 * @given A target whose first poll fails
 * @when the monitor runs
 * @then later polls still happen and deliver snapshots
 */
TEST_F( StatusMonitorTest, PollErrorDoesNotEndLoop )
{
    target_->fail_on_poll = 1;
    auto handle           = StatusMonitor::Start( target_, 10ms, Counting() );

    ASSERT_WAIT_FOR_CONDITION( [this] { return callbacks_.load() >= 2; }, 2000ms, "callbacks after a failed poll", nullptr );
    EXPECT_TRUE( handle->IsActive() );
    handle->Stop();
    EXPECT_LE( callbacks_.load(), target_->polls.load() - 1 );
}

/**
 * @given A callback that throws
 * @when the monitor runs
 * @then the loop keeps polling
 */
TEST_F( StatusMonitorTest, CallbackExceptionDoesNotEndLoop )
{
    auto handle = StatusMonitor::Start( target_,
                                        10ms,
                                        [this]( const StatusSnapshot & )
                                        {
                                            ++callbacks_;
                                            throw std::runtime_error( "consumer failed" );
                                        } );

    ASSERT_WAIT_FOR_CONDITION( [this] { return callbacks_.load() >= 3; }, 2000ms, "three throwing callbacks", nullptr );
    EXPECT_TRUE( handle->IsActive() );
    handle->Stop();
}

/**
 * @given A callback that throws something other than std::exception
 * @when the monitor runs
 * @then the loop keeps polling
 */
TEST_F( StatusMonitorTest, NonStandardCallbackExceptionDoesNotEndLoop )
{
    auto handle = StatusMonitor::Start( target_,
                                        10ms,
                                        [this]( const StatusSnapshot & )
                                        {
                                            ++callbacks_;
                                            throw 42;
                                        } );

    ASSERT_WAIT_FOR_CONDITION( [this] { return callbacks_.load() >= 3; }, 2000ms, "three throwing callbacks", nullptr );
    EXPECT_TRUE( handle->IsActive() );
    handle->Stop();
}

/**
 * @given A running monitor
 * @when it is stopped, twice
 * @then no callback runs afterwards and the second stop is a no-op
 */
TEST_F( StatusMonitorTest, NoCallbackAfterStop )
{
    auto handle = StatusMonitor::Start( target_, 5ms, Counting() );
    ASSERT_WAIT_FOR_CONDITION( [this] { return callbacks_.load() >= 2; }, 2000ms, "first callbacks", nullptr );

    handle->Stop();
    EXPECT_FALSE( handle->IsActive() );
    const int seen = callbacks_.load();

    std::this_thread::sleep_for( 100ms );
    EXPECT_EQ( callbacks_.load(), seen );

    handle->Stop();
    EXPECT_FALSE( handle->IsActive() );
    EXPECT_EQ( callbacks_.load(), seen );
}

/**
 * @given A target with a running monitor
 * @when a second monitor is started on it
 * @then the first one is stopped and only the second delivers
 */
TEST_F( StatusMonitorTest, StartReplacesRunningMonitor )
{
    std::atomic<int> first_calls{ 0 };
    auto first = StatusMonitor::Start( target_, 5ms, [&first_calls]( const StatusSnapshot & ) { ++first_calls; } );
    ASSERT_WAIT_FOR_CONDITION( [&first_calls] { return first_calls.load() >= 1; }, 2000ms, "first monitor", nullptr );

    auto second = StatusMonitor::Start( target_, 5ms, Counting() );
    EXPECT_FALSE( first->IsActive() );
    const int first_seen = first_calls.load();

    ASSERT_WAIT_FOR_CONDITION( [this] { return callbacks_.load() >= 2; }, 2000ms, "second monitor", nullptr );
    EXPECT_TRUE( second->IsActive() );
    EXPECT_EQ( first_calls.load(), first_seen );
    second->Stop();
}

/**
 * @given A callback that stops its own monitor
 * @when the monitor runs
 * @then the loop ends without further callbacks
 */
TEST_F( StatusMonitorTest, StopFromOwnCallback )
{
    std::mutex                     handle_mutex;
    std::shared_ptr<MonitorHandle> handle;

    auto started = StatusMonitor::Start( target_,
                                         20ms,
                                         [&]( const StatusSnapshot & )
                                         {
                                             ++callbacks_;
                                             std::shared_ptr<MonitorHandle> self;
                                             {
                                                 std::lock_guard<std::mutex> lock( handle_mutex );
                                                 self = handle;
                                             }
                                             if ( self )
                                             {
                                                 self->Stop();
                                             }
                                         } );
    {
        std::lock_guard<std::mutex> lock( handle_mutex );
        handle = started;
    }

    ASSERT_WAIT_FOR_CONDITION( [&started] { return !started->IsActive(); }, 2000ms, "self stop", nullptr );
    const int seen = callbacks_.load();
    std::this_thread::sleep_for( 100ms );
    EXPECT_EQ( callbacks_.load(), seen );

    started->Stop();
    std::lock_guard<std::mutex> lock( handle_mutex );
    handle.reset();
}

/**
 * @given A running monitor
 * @when the target reaches FundsLocked
 * @then the latest snapshot can be pulled from the handle
 */
TEST_F( StatusMonitorTest, LatestSnapshotCanBePulled )
{
    auto handle = StatusMonitor::Start( target_, 5ms, MonitorCallback( []( const StatusSnapshot & ) {} ) );
    EXPECT_WAIT_FOR_CONDITION(
        [&handle]
        {
            auto latest = handle->LatestSnapshot();
            return latest && latest->State() == PaymentState::FUNDS_LOCKED;
        },
        2000ms,
        "FundsLocked snapshot",
        nullptr );
    handle->Stop();
}

/**
 * @given A running monitor
 * @when its target is released
 * @then the loop ends
 */
TEST_F( StatusMonitorTest, ReleasedTargetEndsLoop )
{
    auto handle = StatusMonitor::Start( target_, 5ms, Counting() );
    ASSERT_WAIT_FOR_CONDITION( [this] { return callbacks_.load() >= 1; }, 2000ms, "first callback", nullptr );

    target_.reset();
    ASSERT_WAIT_FOR_CONDITION( [&handle] { return !handle->IsActive(); }, 2000ms, "loop end", nullptr );
    const int seen = callbacks_.load();
    std::this_thread::sleep_for( 50ms );
    EXPECT_EQ( callbacks_.load(), seen );
}

/**
 * @given A tracked payment and a service reporting it
 * @when its status monitoring is started and stopped
 * @then snapshots arrive on the callback and the handle ends inactive
 */
TEST( PaymentMonitoringTest, PaymentRequestMonitorsTrackedPayment )
{
    auto http   = std::make_shared<::testing::NiceMock<api::HttpClientMock>>();
    auto client = std::make_shared<ServiceClient>( http, "key" );
    ON_CALL( *http, send( _ ) )
        .WillByDefault( Return( api::HttpResponse{
            200,
            R"({"status":"success","data":{"Payments":[{"blockchainIdentifier":"bc_9","onChainState":"FundsLocked"}]}})" } ) );

    rapidjson::Document input;
    input.Parse( "{}" );
    PaymentRequest::Params params;
    params.agent_identifier = "agent-9";
    auto request            = PaymentRequest::New( client, params, input );
    request->Track( "bc_9" );

    std::atomic<int> seen{ 0 };
    auto             handle = request->StartStatusMonitoring(
        [&seen]( const StatusSnapshot &snapshot )
        {
            if ( snapshot.blockchain_identifier == "bc_9" )
            {
                ++seen;
            }
        },
        10ms );

    ASSERT_WAIT_FOR_CONDITION( [&seen] { return seen.load() >= 2; }, 2000ms, "payment snapshots", nullptr );
    request->StopStatusMonitoring();
    EXPECT_FALSE( handle->IsActive() );
}
