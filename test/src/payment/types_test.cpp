#include <gtest/gtest.h>

#include "payment/types.hpp"

using namespace masumi::payment;

/**
 * @given onChainState values reported by the service
 * @when mapped to local states
 * @then each lands on its lifecycle state
 */
TEST( PaymentTypesTest, OnChainStateMapping )
{
    EXPECT_EQ( StateFromOnChain( "" ), PaymentState::REQUESTED );
    EXPECT_EQ( StateFromOnChain( "FundsLocked" ), PaymentState::FUNDS_LOCKED );
    EXPECT_EQ( StateFromOnChain( "ResultSubmitted" ), PaymentState::RESULT_SUBMITTED );
    EXPECT_EQ( StateFromOnChain( "Withdrawn" ), PaymentState::COMPLETED );
    EXPECT_EQ( StateFromOnChain( "RefundRequested" ), PaymentState::DISPUTED );
    EXPECT_EQ( StateFromOnChain( "Disputed" ), PaymentState::DISPUTED );
    EXPECT_EQ( StateFromOnChain( "RefundWithdrawn" ), PaymentState::EXPIRED );
    EXPECT_EQ( StateFromOnChain( "FundsOrDatumInvalid" ), PaymentState::EXPIRED );
}

/**
 * @given Pairs of lifecycle states
 * @when transitions are checked
 * @then only forward moves and moves into a terminal state pass
 */
TEST( PaymentTypesTest, TransitionsAreMonotonic )
{
    EXPECT_TRUE( IsForwardTransition( PaymentState::REQUESTED, PaymentState::FUNDS_LOCKED ) );
    EXPECT_TRUE( IsForwardTransition( PaymentState::REQUESTED, PaymentState::RESULT_SUBMITTED ) );
    EXPECT_TRUE( IsForwardTransition( PaymentState::FUNDS_LOCKED, PaymentState::EXPIRED ) );
    EXPECT_FALSE( IsForwardTransition( PaymentState::RESULT_SUBMITTED, PaymentState::FUNDS_LOCKED ) );
    EXPECT_FALSE( IsForwardTransition( PaymentState::RESULT_SUBMITTED, PaymentState::RESULT_SUBMITTED ) );
    EXPECT_FALSE( IsForwardTransition( PaymentState::COMPLETED, PaymentState::DISPUTED ) );
    EXPECT_TRUE( IsTerminal( PaymentState::EXPIRED ) );
    EXPECT_FALSE( IsTerminal( PaymentState::RESULT_SUBMITTED ) );
}

/**
 * @given Purchaser identifiers around the length limits
 * @when validated
 * @then 15 to 26 hex characters pass
 */
TEST( PaymentTypesTest, PurchaserIdentifierBounds )
{
    EXPECT_FALSE( ValidatePurchaserIdentifier( std::string( 14, 'a' ) ) );
    EXPECT_TRUE( ValidatePurchaserIdentifier( std::string( 15, 'a' ) ) );
    EXPECT_TRUE( ValidatePurchaserIdentifier( std::string( 26, 'F' ) ) );
    EXPECT_FALSE( ValidatePurchaserIdentifier( std::string( 27, 'a' ) ) );
    EXPECT_FALSE( ValidatePurchaserIdentifier( "0123456789abcdefxyz" ) );
}

/**
 * @given Snapshots with various next actions
 * @when completion is asked
 * @then settled records report complete
 */
TEST( PaymentTypesTest, SnapshotCompletion )
{
    StatusSnapshot snapshot;
    snapshot.requested_action = "WaitingForExternalAction";
    EXPECT_FALSE( snapshot.IsComplete() );

    snapshot.on_chain_state = "Withdrawn";
    EXPECT_TRUE( snapshot.IsComplete() );

    snapshot.on_chain_state   = "FundsLocked";
    snapshot.requested_action = "None";
    EXPECT_TRUE( snapshot.IsComplete() );

    EXPECT_EQ( ToString( PaymentState::RESULT_SUBMITTED ), "ResultSubmitted" );
}
