#include "payment/purchase_request.hpp"

#include <algorithm>

#include "payment/content_hasher.hpp"

namespace masumi::payment
{
    std::shared_ptr<PurchaseRequest> PurchaseRequest::New( std::shared_ptr<ServiceClient> client,
                                                           Params                         params,
                                                           const rapidjson::Value        &input_data )
    {
        // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
        return std::shared_ptr<PurchaseRequest>(
            new PurchaseRequest( std::move( client ), std::move( params ), input_data ) );
    }

    PurchaseRequest::PurchaseRequest( std::shared_ptr<ServiceClient> client,
                                      Params                         params,
                                      const rapidjson::Value        &input_data ) :
        client_m( std::move( client ) ), //
        params_m( std::move( params ) )
    {
        input_data_m.CopyFrom( input_data, input_data_m.GetAllocator() );
    }

    PurchaseRequest::~PurchaseRequest()
    {
        StopActiveMonitor();
    }

    Result<void> PurchaseRequest::Validate() const
    {
        if ( params_m.blockchain_identifier.empty() )
        {
            return Fail( PaymentError::VALIDATION, "blockchainIdentifier must not be empty" );
        }
        if ( params_m.seller_vkey.empty() )
        {
            return Fail( PaymentError::VALIDATION, "sellerVkey must not be empty" );
        }
        if ( params_m.agent_identifier.empty() )
        {
            return Fail( PaymentError::VALIDATION, "agentIdentifier must not be empty" );
        }
        BOOST_OUTCOME_TRY( ValidatePurchaserIdentifier( params_m.identifier_from_purchaser ) );
        BOOST_OUTCOME_TRY( ValidateTimeWindows( params_m.time_windows ) );
        return ValidateAmounts( params_m.amounts );
    }

    Result<PurchaseReceipt> PurchaseRequest::Create()
    {
        BOOST_OUTCOME_TRY( Validate() );

        const auto input_hash = ContentHasher::Digest( input_data_m );
        {
            std::lock_guard<std::mutex> lock( mutex_m );
            if ( purchase_id_m )
            {
                return Fail( PaymentError::STATE, "purchase " + *purchase_id_m + " was already created" );
            }
            input_hash_m = input_hash;
        }

        CreatePurchaseBody body;
        body.blockchain_identifier     = params_m.blockchain_identifier;
        body.network                   = params_m.network;
        body.seller_vkey               = params_m.seller_vkey;
        body.agent_identifier          = params_m.agent_identifier;
        body.payment_type              = params_m.payment_type;
        body.amounts                   = params_m.amounts;
        body.time_windows              = params_m.time_windows;
        body.identifier_from_purchaser = params_m.identifier_from_purchaser;
        body.input_hash                = input_hash;

        BOOST_OUTCOME_TRY( receipt, client_m->CreatePurchase( body ) );
        if ( receipt.requested_action != FUNDS_LOCKING_REQUESTED )
        {
            logger_m->error( "Purchase {} answered with next action '{}'", receipt.id, receipt.requested_action );
            return Fail( PaymentError::PROTOCOL,
                         "expected next action " + std::string( FUNDS_LOCKING_REQUESTED ) + ", got '" +
                             receipt.requested_action + "'" );
        }

        {
            std::lock_guard<std::mutex> lock( mutex_m );
            purchase_id_m = receipt.id;
            state_m       = PaymentState::REQUESTED;
        }
        logger_m->info( "Purchase {} created for payment {}", receipt.id, params_m.blockchain_identifier );
        return std::move( receipt );
    }

    Result<RefundReceipt> PurchaseRequest::RequestRefund()
    {
        {
            std::lock_guard<std::mutex> lock( mutex_m );
            if ( !purchase_id_m )
            {
                return Fail( PaymentError::STATE, "no purchase was created for " + params_m.blockchain_identifier );
            }
            if ( refund_requested_m )
            {
                return Fail( PaymentError::STATE, "refund already requested for " + params_m.blockchain_identifier );
            }
            if ( IsTerminal( state_m ) )
            {
                return Fail( PaymentError::STATE,
                             "purchase for " + params_m.blockchain_identifier + " is already " +
                                 std::string( ToString( state_m ) ) );
            }
        }

        RefundBody body;
        body.blockchain_identifier = params_m.blockchain_identifier;
        body.network               = params_m.network;

        BOOST_OUTCOME_TRY( receipt, client_m->RequestRefund( body ) );
        {
            std::lock_guard<std::mutex> lock( mutex_m );
            refund_requested_m = true;
            state_m            = PaymentState::DISPUTED;
        }
        logger_m->info( "Refund requested for {}", params_m.blockchain_identifier );
        return std::move( receipt );
    }

    Result<StatusSnapshot> PurchaseRequest::CheckStatus() const
    {
        {
            std::lock_guard<std::mutex> lock( mutex_m );
            if ( !purchase_id_m )
            {
                return Fail( PaymentError::STATE, "no purchase was created for " + params_m.blockchain_identifier );
            }
        }

        BOOST_OUTCOME_TRY( snapshots, client_m->ListPurchases( params_m.network, params_m.status_page_limit ) );
        auto found = std::find_if( snapshots.begin(),
                                   snapshots.end(),
                                   [this]( const StatusSnapshot &snapshot )
                                   { return snapshot.blockchain_identifier == params_m.blockchain_identifier; } );
        if ( found == snapshots.end() )
        {
            return Fail( PaymentError::PROTOCOL,
                         "purchase for " + params_m.blockchain_identifier + " not found in status response" );
        }
        return *found;
    }

    bool PurchaseRequest::RefundEligible( int64_t now_ms ) const
    {
        return now_ms >= params_m.time_windows.submit_result_time;
    }

    PaymentState PurchaseRequest::GetState() const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        return state_m;
    }

    std::set<std::string> PurchaseRequest::TrackedIds() const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        if ( !purchase_id_m )
        {
            return {};
        }
        return { params_m.blockchain_identifier };
    }

    std::optional<std::string> PurchaseRequest::PurchaseId() const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        return purchase_id_m;
    }

    std::string PurchaseRequest::InputHash() const
    {
        std::lock_guard<std::mutex> lock( mutex_m );
        return input_hash_m;
    }

    std::shared_ptr<MonitorHandle> PurchaseRequest::StartStatusMonitoring( MonitorCallback           callback,
                                                                           std::chrono::milliseconds interval )
    {
        return StatusMonitor::Start( shared_from_this(), interval, std::move( callback ) );
    }

    void PurchaseRequest::StopStatusMonitoring()
    {
        StopActiveMonitor();
    }

    Result<std::vector<StatusSnapshot>> PurchaseRequest::PollStatus()
    {
        BOOST_OUTCOME_TRY( snapshot, CheckStatus() );
        return std::vector<StatusSnapshot>{ std::move( snapshot ) };
    }

    std::string PurchaseRequest::MonitorName() const
    {
        return "Purchase(" + params_m.blockchain_identifier + ")";
    }
}
