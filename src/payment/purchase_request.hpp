/**
 * @file       purchase_request.hpp
 * @brief      Buyer side of an escrow payment
 */
#ifndef _MASUMI_PURCHASE_REQUEST_HPP_
#define _MASUMI_PURCHASE_REQUEST_HPP_

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "base/logger.hpp"
#include "payment/service_client.hpp"
#include "payment/status_monitor.hpp"

namespace masumi::payment
{
    /**
     * @brief      Locks funds against a payment a seller published, and asks for a refund when
     *             the seller does not deliver in time.
     */
    class PurchaseRequest : public MonitorTarget, public std::enable_shared_from_this<PurchaseRequest>
    {
    public:
        struct Params
        {
            std::string         blockchain_identifier; ///< Published by the seller
            std::string         seller_vkey;
            std::string         agent_identifier;
            std::string         identifier_from_purchaser;
            TimeWindows         time_windows;
            std::vector<Amount> amounts;
            std::string         network           = std::string( DEFAULT_NETWORK );
            std::string         payment_type      = std::string( DEFAULT_PAYMENT_TYPE );
            uint32_t            status_page_limit = DEFAULT_STATUS_PAGE_LIMIT;
        };

        static std::shared_ptr<PurchaseRequest> New( std::shared_ptr<ServiceClient> client,
                                                     Params                         params,
                                                     const rapidjson::Value        &input_data );

        ~PurchaseRequest() override;

        /**
         * @brief       Locks funds. The service must answer with FundsLockingRequested.
         */
        Result<PurchaseReceipt> Create();

        /**
         * @brief       Asks for the locked funds back. Only valid after Create; whether the
         *              submission deadline has passed is for the caller to decide, see
         *              RefundEligible().
         */
        Result<RefundReceipt> RequestRefund();

        /**
         * @brief       Latest service view of the purchase
         */
        Result<StatusSnapshot> CheckStatus() const;

        /// True once @param now_ms (Unix ms) reached the result submission deadline
        bool RefundEligible( int64_t now_ms ) const;

        PaymentState               GetState() const;
        std::set<std::string>      TrackedIds() const;
        std::optional<std::string> PurchaseId() const;

        /// Empty until the first Create attempt that passed validation
        std::string InputHash() const;

        const Params &GetParams() const
        {
            return params_m;
        }

        std::shared_ptr<MonitorHandle> StartStatusMonitoring( MonitorCallback           callback,
                                                              std::chrono::milliseconds interval =
                                                                  DEFAULT_MONITOR_INTERVAL );
        void                           StopStatusMonitoring();

        Result<std::vector<StatusSnapshot>> PollStatus() override;
        std::string                         MonitorName() const override;

    private:
        PurchaseRequest( std::shared_ptr<ServiceClient> client, Params params, const rapidjson::Value &input_data );

        Result<void> Validate() const;

        std::shared_ptr<ServiceClient> client_m;
        Params                         params_m;
        rapidjson::Document            input_data_m;

        mutable std::mutex         mutex_m;
        std::string                input_hash_m;
        PaymentState               state_m = PaymentState::CREATED;
        std::optional<std::string> purchase_id_m;
        bool                       refund_requested_m = false;

        base::Logger logger_m = base::createLogger( "PurchaseRequest" );
    };
}

#endif
