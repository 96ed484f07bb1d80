#include "payment/types.hpp"

#include "base/hexutil.hpp"

namespace masumi::payment
{
    std::string_view ToString( PaymentState state )
    {
        switch ( state )
        {
            case PaymentState::CREATED:
                return "Created";
            case PaymentState::REQUESTED:
                return "Requested";
            case PaymentState::FUNDS_LOCKED:
                return "FundsLocked";
            case PaymentState::RESULT_SUBMITTED:
                return "ResultSubmitted";
            case PaymentState::COMPLETED:
                return "Completed";
            case PaymentState::DISPUTED:
                return "Disputed";
            case PaymentState::EXPIRED:
                return "Expired";
        }
        return "Unknown";
    }

    bool IsTerminal( PaymentState state )
    {
        return state == PaymentState::COMPLETED || state == PaymentState::DISPUTED || state == PaymentState::EXPIRED;
    }

    bool IsForwardTransition( PaymentState from, PaymentState to )
    {
        if ( IsTerminal( from ) )
        {
            return false;
        }
        if ( IsTerminal( to ) )
        {
            return true;
        }
        return static_cast<int>( to ) > static_cast<int>( from );
    }

    PaymentState StateFromOnChain( std::string_view on_chain_state )
    {
        if ( on_chain_state.empty() )
        {
            return PaymentState::REQUESTED;
        }
        if ( on_chain_state == "FundsLocked" )
        {
            return PaymentState::FUNDS_LOCKED;
        }
        if ( on_chain_state == "ResultSubmitted" )
        {
            return PaymentState::RESULT_SUBMITTED;
        }
        if ( on_chain_state == "Withdrawn" || on_chain_state == "Complete" )
        {
            return PaymentState::COMPLETED;
        }
        if ( on_chain_state == "RefundRequested" || on_chain_state == "Disputed" ||
             on_chain_state == "DisputedWithdrawn" )
        {
            return PaymentState::DISPUTED;
        }
        if ( on_chain_state == "RefundWithdrawn" || on_chain_state == "FundsOrDatumInvalid" )
        {
            return PaymentState::EXPIRED;
        }
        return PaymentState::REQUESTED;
    }

    bool StatusSnapshot::IsComplete() const
    {
        return requested_action == "None" || requested_action == "PaymentComplete" ||
               State() == PaymentState::COMPLETED;
    }

    Result<void> ValidateTimeWindows( const TimeWindows &windows )
    {
        if ( !windows.IsStrictlyOrdered() )
        {
            return Fail( PaymentError::VALIDATION,
                         "time windows must satisfy payByTime < submitResultTime < unlockTime < "
                         "externalDisputeUnlockTime, got " +
                             std::to_string( windows.pay_by_time ) + ", " +
                             std::to_string( windows.submit_result_time ) + ", " +
                             std::to_string( windows.unlock_time ) + ", " +
                             std::to_string( windows.external_dispute_unlock_time ) );
        }
        return outcome::success();
    }

    Result<void> ValidateAmounts( const std::vector<Amount> &amounts )
    {
        if ( amounts.empty() )
        {
            return Fail( PaymentError::VALIDATION, "at least one amount is required" );
        }
        for ( const auto &amount : amounts )
        {
            if ( amount.unit.empty() )
            {
                return Fail( PaymentError::VALIDATION, "amount unit must not be empty" );
            }
        }
        return outcome::success();
    }

    Result<void> ValidatePurchaserIdentifier( std::string_view identifier )
    {
        if ( identifier.size() < PURCHASER_ID_MIN_LENGTH || identifier.size() > PURCHASER_ID_MAX_LENGTH )
        {
            return Fail( PaymentError::VALIDATION,
                         "identifierFromPurchaser must be 15 to 26 characters, got " +
                             std::to_string( identifier.size() ) );
        }
        if ( !base::isHex( identifier ) )
        {
            return Fail( PaymentError::VALIDATION, "identifierFromPurchaser must be hexadecimal" );
        }
        return outcome::success();
    }

    Result<void> ValidateHash( std::string_view hash, std::string_view what )
    {
        if ( hash.size() != HASH_HEX_LENGTH || !base::unhex( hash ) )
        {
            return Fail( PaymentError::VALIDATION, std::string( what ) + " must be 64 hex characters" );
        }
        return outcome::success();
    }
}
