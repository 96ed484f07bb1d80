/**
 * @file       schema.hpp
 * @brief      Request and response bodies of the payment service endpoints
 */
#ifndef _MASUMI_PAYMENT_SCHEMA_HPP_
#define _MASUMI_PAYMENT_SCHEMA_HPP_

#include <string>
#include <vector>

#include "payment/types.hpp"

namespace masumi::payment
{
    /// POST /payment/
    struct CreatePaymentBody
    {
        std::string         agent_identifier;
        std::string         network;
        std::string         payment_contract_address;
        std::vector<Amount> amounts;
        std::string         payment_type;
        TimeWindows         time_windows;
        std::string         input_hash;
        std::string         identifier_from_purchaser;

        std::string ToJson() const;
    };

    struct CreatePaymentResponse
    {
        std::string blockchain_identifier;
        std::string input_hash;
        int64_t     submit_result_time           = 0;
        int64_t     unlock_time                  = 0;
        int64_t     external_dispute_unlock_time = 0;

        static Result<CreatePaymentResponse> FromJson( const std::string &body );
    };

    /// PATCH /payment/
    struct CompletePaymentBody
    {
        std::string network;
        std::string payment_contract_address;
        std::string hash;
        std::string identifier;

        std::string ToJson() const;
    };

    struct Receipt
    {
        std::string blockchain_identifier;
        std::string requested_action;
        std::string result_hash;

        static Result<Receipt> FromJson( const std::string &body );
    };

    /// POST /purchase/
    struct CreatePurchaseBody
    {
        std::string         blockchain_identifier;
        std::string         network;
        std::string         seller_vkey;
        std::string         agent_identifier;
        std::string         payment_type;
        std::vector<Amount> amounts;
        TimeWindows         time_windows;
        std::string         identifier_from_purchaser;
        std::string         input_hash;

        std::string ToJson() const;
    };

    struct PurchaseReceipt
    {
        std::string id;
        std::string blockchain_identifier;
        std::string requested_action;

        static Result<PurchaseReceipt> FromJson( const std::string &body );
    };

    /// POST /purchase/request-refund
    struct RefundBody
    {
        std::string blockchain_identifier;
        std::string network;

        std::string ToJson() const;
    };

    struct RefundReceipt
    {
        std::string id;
        std::string requested_action;
        std::string on_chain_state;

        static Result<RefundReceipt> FromJson( const std::string &body );
    };

    /**
     * @brief       Parses data.<list_key>[] of a status listing
     * @param[in]   body Response body
     * @param[in]   list_key "Payments" or "Purchases"
     */
    Result<std::vector<StatusSnapshot>> ParseStatusList( const std::string &body, const char *list_key );
}

#endif
