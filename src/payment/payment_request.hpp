/**
 * @file       payment_request.hpp
 * @brief      Seller side of an escrow payment
 */
#ifndef _MASUMI_PAYMENT_REQUEST_HPP_
#define _MASUMI_PAYMENT_REQUEST_HPP_

#include <map>
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
     * @brief      Creates escrow payment requests for one agent and one input payload, tracks
     *             every blockchain identifier it created or adopted, and submits result hashes.
     *             Safe to use from the monitor thread and the caller at once.
     */
    class PaymentRequest : public MonitorTarget, public std::enable_shared_from_this<PaymentRequest>
    {
    public:
        struct Params
        {
            std::string agent_identifier;
            std::string identifier_from_purchaser;
            std::string network                  = std::string( DEFAULT_NETWORK );
            std::string payment_contract_address = std::string( DEFAULT_PAYMENT_CONTRACT_ADDRESS );
            std::string payment_type             = std::string( DEFAULT_PAYMENT_TYPE );
            uint32_t    status_page_limit        = DEFAULT_STATUS_PAGE_LIMIT;
        };

        static std::shared_ptr<PaymentRequest> New( std::shared_ptr<ServiceClient> client,
                                                    Params                         params,
                                                    const rapidjson::Value        &input_data );

        ~PaymentRequest() override;

        /**
         * @brief       Registers escrow terms with the service
         * @param[in]   windows Deadlines, must be strictly increasing
         * @param[in]   amounts Non-empty price list
         * @return      The blockchain identifier, now tracked in Requested state
         */
        Result<std::string> Create( const TimeWindows &windows, const std::vector<Amount> &amounts );

        /**
         * @brief       Latest service view of one tracked payment. Local state is left alone; the
         *              snapshot's lifecycle state is recorded as the observed state of the id.
         */
        Result<StatusSnapshot> CheckStatus( const std::string &blockchain_identifier ) const;

        /**
         * @brief       Batch listing, filtered down to the tracked payments
         */
        Result<std::vector<StatusSnapshot>> CheckAllStatuses() const;

        /**
         * @brief       Submits the hash of the delivered result
         * @param[in]   blockchain_identifier A tracked payment that has no result yet and was last
         *              observed in FundsLocked or ResultSubmitted
         * @param[in]   output_hash 64 hex characters
         */
        Result<Receipt> Complete( const std::string &blockchain_identifier, const std::string &output_hash );

        /**
         * @brief       Adopts a payment created elsewhere, in Requested state
         */
        void Track( const std::string &blockchain_identifier );

        std::set<std::string>       TrackedIds() const;
        std::optional<PaymentState> GetState( const std::string &blockchain_identifier ) const;

        /// State of the last snapshot seen for the id, empty until a status check returned one
        std::optional<PaymentState> ObservedState( const std::string &blockchain_identifier ) const;

        /// Escrow deadlines of a payment created here, with the service's echoed values applied
        std::optional<TimeWindows> GetTimeWindows( const std::string &blockchain_identifier ) const;

        /// Empty until a Create call passed validation
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
        PaymentRequest( std::shared_ptr<ServiceClient> client, Params params, const rapidjson::Value &input_data );

        Result<void> RequireTracked( const std::string &blockchain_identifier ) const;
        Result<void> Advance( const std::string &blockchain_identifier, PaymentState next );
        Result<void> RequireFundsLocked( const std::string &blockchain_identifier ) const;
        void         Observe( const StatusSnapshot &snapshot ) const;

        std::shared_ptr<ServiceClient> client_m;
        Params                         params_m;
        rapidjson::Document            input_data_m;

        mutable std::mutex                  mutex_m;
        std::string                         input_hash_m;
        std::map<std::string, PaymentState> payments_m;
        std::map<std::string, TimeWindows>  windows_m;

        mutable std::map<std::string, PaymentState> observed_m;

        base::Logger logger_m = base::createLogger( "PaymentRequest" );
    };
}

#endif
