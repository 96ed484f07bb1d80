#include "payment/payment_request.hpp"

#include <algorithm>

#include "payment/content_hasher.hpp"

namespace masumi::payment
{
    std::shared_ptr<PaymentRequest> PaymentRequest::New( std::shared_ptr<ServiceClient> client,
                                                         Params                         params,
                                                         const rapidjson::Value        &input_data )
    {
        // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
        return std::shared_ptr<PaymentRequest>( new PaymentRequest( std::move( client ), std::move( params ), input_data ) );
    }

    PaymentRequest::PaymentRequest( std::shared_ptr<ServiceClient> client,
                                    Params                         params,
                                    const rapidjson::Value        &input_data ) :
        client_m( std::move( client ) ), //
        params_m( std::move( params ) )
    {
        input_data_m.CopyFrom( input_data, input_data_m.GetAllocator() );
    }

    PaymentRequest::~PaymentRequest()
    {
        StopActiveMonitor();
    }

    Result<std::string> PaymentRequest::Create( const TimeWindows &windows, const std::vector<Amount> &amounts )
    {
        if ( params_m.agent_identifier.empty() )
        {
            return Fail( PaymentError::VALIDATION, "agentIdentifier must not be empty" );
        }
        BOOST_OUTCOME_TRY( ValidatePurchaserIdentifier( params_m.identifier_from_purchaser ) );
        BOOST_OUTCOME_TRY( ValidateTimeWindows( windows ) );
        BOOST_OUTCOME_TRY( ValidateAmounts( amounts ) );

        const auto input_hash = ContentHasher::Digest( input_data_m );
        {
            std::lock_guard<std::mutex> lock( mutex_m );
            if ( input_hash_m.empty() )
            {
                input_hash_m = input_hash;
            }
        }

        CreatePaymentBody body;
        body.agent_identifier          = params_m.agent_identifier;
        body.network                   = params_m.network;
        body.payment_contract_address  = params_m.payment_contract_address;
        body.amounts                   = amounts;
        body.payment_type              = params_m.payment_type;
        body.time_windows              = windows;
        body.input_hash                = input_hash;
        body.identifier_from_purchaser = params_m.identifier_from_purchaser;

        BOOST_OUTCOME_TRY( response, client_m->CreatePayment( body ) );
        if ( !response.input_hash.empty() && response.input_hash != input_hash )
        {
            logger_m->warn( "Service echoed input hash {} for {}, expected {}",
                            response.input_hash,
                            response.blockchain_identifier,
                            input_hash );
        }

        auto agreed = windows;
        if ( response.submit_result_time != 0 )
        {
            agreed.submit_result_time = response.submit_result_time;
        }
        if ( response.unlock_time != 0 )
        {
            agreed.unlock_time = response.unlock_time;
        }
        if ( response.external_dispute_unlock_time != 0 )
        {
            agreed.external_dispute_unlock_time = response.external_dispute_unlock_time;
        }

        {
            std::lock_guard<std::mutex> lock( mutex_m );
            payments_m.emplace( response.blockchain_identifier, PaymentState::REQUESTED );
            windows_m[response.blockchain_identifier] = agreed;
        }
        logger_m->info( "Payment request created: {}", response.blockchain_identifier );
        return response.blockchain_identifier;
    }

    Result<StatusSnapshot> PaymentRequest::CheckStatus( const std::string &blockchain_identifier ) const
    {
        BOOST_OUTCOME_TRY( RequireTracked( blockchain_identifier ) );
        BOOST_OUTCOME_TRY( snapshots, client_m->GetPayment( blockchain_identifier ) );

        auto found = std::find_if( snapshots.begin(),
                                   snapshots.end(),
                                   [&blockchain_identifier]( const StatusSnapshot &snapshot )
                                   { return snapshot.blockchain_identifier == blockchain_identifier; } );
        if ( found == snapshots.end() )
        {
            return Fail( PaymentError::PROTOCOL, "payment " + blockchain_identifier + " not found in status response" );
        }
        Observe( *found );
        return *found;
    }

    Result<std::vector<StatusSnapshot>> PaymentRequest::CheckAllStatuses() const
    {
        const auto tracked = TrackedIds();
        if ( tracked.empty() )
        {
            return Fail( PaymentError::STATE, "no payment is tracked" );
        }

        const auto limit = std::max<uint32_t>( params_m.status_page_limit, static_cast<uint32_t>( tracked.size() ) );
        BOOST_OUTCOME_TRY( snapshots, client_m->ListPayments( params_m.network, limit ) );

        std::vector<StatusSnapshot> result;
        for ( auto &snapshot : snapshots )
        {
            if ( tracked.count( snapshot.blockchain_identifier ) != 0 )
            {
                Observe( snapshot );
                result.push_back( std::move( snapshot ) );
            }
        }
        return result;
    }

    Result<Receipt> PaymentRequest::Complete( const std::string &blockchain_identifier, const std::string &output_hash )
    {
        BOOST_OUTCOME_TRY( RequireTracked( blockchain_identifier ) );
        BOOST_OUTCOME_TRY( ValidateHash( output_hash, "outputHash" ) );
        {
            std::lock_guard<std::mutex> lock( mutex_m );
            const auto                  state = payments_m.at( blockchain_identifier );
            if ( !IsForwardTransition( state, PaymentState::RESULT_SUBMITTED ) )
            {
                return Fail( PaymentError::STATE,
                             "payment " + blockchain_identifier + " is already " + std::string( ToString( state ) ) );
            }
        }
        BOOST_OUTCOME_TRY( RequireFundsLocked( blockchain_identifier ) );

        CompletePaymentBody body;
        body.network                  = params_m.network;
        body.payment_contract_address = params_m.payment_contract_address;
        body.hash                     = output_hash;
        body.identifier               = blockchain_identifier;

        BOOST_OUTCOME_TRY( receipt, client_m->CompletePayment( body ) );
        BOOST_OUTCOME_TRY( Advance( blockchain_identifier, PaymentState::RESULT_SUBMITTED ) );
        logger_m->info( "Result submitted for {}", blockchain_identifier );
        return std::move( receipt );
    }

    void PaymentRequest::Track( const std::string &blockchain_identifier )
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        payments_m.emplace( blockchain_identifier, PaymentState::REQUESTED );
    }

    std::set<std::string> PaymentRequest::TrackedIds() const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        std::set<std::string>       ids;
        for ( const auto &[id, state] : payments_m )
        {
            ids.insert( id );
        }
        return ids;
    }

    std::optional<PaymentState> PaymentRequest::GetState( const std::string &blockchain_identifier ) const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        auto                        it = payments_m.find( blockchain_identifier );
        if ( it == payments_m.end() )
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<PaymentState> PaymentRequest::ObservedState( const std::string &blockchain_identifier ) const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        auto                        it = observed_m.find( blockchain_identifier );
        if ( it == observed_m.end() )
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<TimeWindows> PaymentRequest::GetTimeWindows( const std::string &blockchain_identifier ) const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        auto                        it = windows_m.find( blockchain_identifier );
        if ( it == windows_m.end() )
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string PaymentRequest::InputHash() const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        return input_hash_m;
    }

    std::shared_ptr<MonitorHandle> PaymentRequest::StartStatusMonitoring( MonitorCallback           callback,
                                                                          std::chrono::milliseconds interval )
    {
        return StatusMonitor::Start( shared_from_this(), interval, std::move( callback ) );
    }

    void PaymentRequest::StopStatusMonitoring()
    {
        StopActiveMonitor();
    }

    Result<std::vector<StatusSnapshot>> PaymentRequest::PollStatus()
    {
        const auto tracked = TrackedIds();
        if ( tracked.size() == 1 )
        {
            BOOST_OUTCOME_TRY( snapshot, CheckStatus( *tracked.begin() ) );
            return std::vector<StatusSnapshot>{ std::move( snapshot ) };
        }
        return CheckAllStatuses();
    }

    std::string PaymentRequest::MonitorName() const
    {
        return "Payment(" + params_m.agent_identifier + ")";
    }

    Result<void> PaymentRequest::RequireTracked( const std::string &blockchain_identifier ) const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        if ( payments_m.count( blockchain_identifier ) == 0 )
        {
            return Fail( PaymentError::STATE, "payment " + blockchain_identifier + " is not tracked" );
        }
        return outcome::success();
    }

    Result<void> PaymentRequest::Advance( const std::string &blockchain_identifier, PaymentState next )
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        auto                        it = payments_m.find( blockchain_identifier );
        if ( it == payments_m.end() )
        {
            return Fail( PaymentError::STATE, "payment " + blockchain_identifier + " is not tracked" );
        }
        if ( !IsForwardTransition( it->second, next ) )
        {
            return Fail( PaymentError::STATE,
                         "payment " + blockchain_identifier + " cannot move from " + std::string( ToString( it->second ) ) +
                             " to " + std::string( ToString( next ) ) );
        }
        it->second = next;
        return outcome::success();
    }

    Result<void> PaymentRequest::RequireFundsLocked( const std::string &blockchain_identifier ) const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        auto                        it = observed_m.find( blockchain_identifier );
        if ( it == observed_m.end() )
        {
            return Fail( PaymentError::STATE, "payment " + blockchain_identifier + " has no observed status yet" );
        }
        if ( it->second != PaymentState::FUNDS_LOCKED && it->second != PaymentState::RESULT_SUBMITTED )
        {
            return Fail( PaymentError::STATE,
                         "payment " + blockchain_identifier + " is " + std::string( ToString( it->second ) ) +
                             " on chain, funds are not locked" );
        }
        return outcome::success();
    }

    void PaymentRequest::Observe( const StatusSnapshot &snapshot ) const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        if ( payments_m.count( snapshot.blockchain_identifier ) != 0 )
        {
            observed_m[snapshot.blockchain_identifier] = snapshot.State();
        }
    }
}
