/**
 * @file       types.hpp
 * @brief      Escrow terms, lifecycle states and status snapshots
 */
#ifndef _MASUMI_PAYMENT_TYPES_HPP_
#define _MASUMI_PAYMENT_TYPES_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "payment/error.hpp"

namespace masumi::payment
{
    static constexpr std::string_view DEFAULT_NETWORK                  = "Preprod";
    static constexpr std::string_view DEFAULT_PAYMENT_CONTRACT_ADDRESS =
        "addr_test1wrm4l7k9qgw9878ymvw223u45fje48tnhqsxk2tewe47z7se03mca";
    static constexpr std::string_view DEFAULT_PAYMENT_TYPE    = "WEB3_CARDANO_V1";
    static constexpr std::string_view FUNDS_LOCKING_REQUESTED = "FundsLockingRequested";

    static constexpr std::chrono::milliseconds DEFAULT_MONITOR_INTERVAL{ 60000 };
    static constexpr uint32_t                  DEFAULT_STATUS_PAGE_LIMIT = 10;

    static constexpr size_t PURCHASER_ID_MIN_LENGTH = 15;
    static constexpr size_t PURCHASER_ID_MAX_LENGTH = 26;
    static constexpr size_t HASH_HEX_LENGTH         = 64;

    struct Amount
    {
        uint64_t    quantity = 0;
        std::string unit;
    };

    /**
     * @brief      Escrow deadlines as Unix time in milliseconds
     */
    struct TimeWindows
    {
        int64_t pay_by_time                  = 0;
        int64_t submit_result_time           = 0;
        int64_t unlock_time                  = 0;
        int64_t external_dispute_unlock_time = 0;

        bool IsStrictlyOrdered() const
        {
            return pay_by_time < submit_result_time && submit_result_time < unlock_time &&
                   unlock_time < external_dispute_unlock_time;
        }
    };

    /**
     * @brief      Local lifecycle of one payment. Values only ever increase, except that any
     *             state may move to one of the terminal ones.
     */
    enum class PaymentState
    {
        CREATED          = 0,
        REQUESTED        = 1,
        FUNDS_LOCKED     = 2,
        RESULT_SUBMITTED = 3,
        COMPLETED        = 4,
        DISPUTED         = 5,
        EXPIRED          = 6,
    };

    std::string_view ToString( PaymentState state );

    bool IsTerminal( PaymentState state );

    /**
     * @brief      Whether moving from @param from to @param to keeps the lifecycle monotonic
     */
    bool IsForwardTransition( PaymentState from, PaymentState to );

    /**
     * @brief      Maps a service onChainState (empty when nothing is on chain yet)
     */
    PaymentState StateFromOnChain( std::string_view on_chain_state );

    /**
     * @brief      One observed projection of a payment or purchase record
     */
    struct StatusSnapshot
    {
        std::string                blockchain_identifier;
        std::string                on_chain_state;   ///< empty while nothing is on chain
        std::string                requested_action; ///< NextAction.requestedAction
        std::string                input_hash;
        std::optional<std::string> result_hash;

        PaymentState State() const
        {
            return StateFromOnChain( on_chain_state );
        }

        bool IsComplete() const;
    };

    Result<void> ValidateTimeWindows( const TimeWindows &windows );
    Result<void> ValidateAmounts( const std::vector<Amount> &amounts );
    Result<void> ValidatePurchaserIdentifier( std::string_view identifier );
    /// 64 hex characters, either case
    Result<void> ValidateHash( std::string_view hash, std::string_view what );
}

#endif
