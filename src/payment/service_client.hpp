/**
 * @file       service_client.hpp
 * @brief      Typed access to the payment service REST surface
 */
#ifndef _MASUMI_SERVICE_CLIENT_HPP_
#define _MASUMI_SERVICE_CLIENT_HPP_

#include <memory>
#include <string>
#include <vector>

#include "api/transport/http_client.hpp"
#include "base/logger.hpp"
#include "payment/schema.hpp"

namespace masumi::payment
{
    /**
     * @brief      Sends the payment and purchase calls with the API key in the `token` header and
     *             maps HTTP statuses onto PaymentError kinds. Holds no lifecycle state.
     */
    class ServiceClient
    {
    public:
        ServiceClient( std::shared_ptr<api::HttpClient> http, std::string api_key );

        Result<CreatePaymentResponse>       CreatePayment( const CreatePaymentBody &body );
        Result<std::vector<StatusSnapshot>> GetPayment( const std::string &blockchain_identifier );
        Result<std::vector<StatusSnapshot>> ListPayments( const std::string &network, uint32_t limit );
        Result<Receipt>                     CompletePayment( const CompletePaymentBody &body );

        Result<PurchaseReceipt>             CreatePurchase( const CreatePurchaseBody &body );
        Result<std::vector<StatusSnapshot>> ListPurchases( const std::string &network, uint32_t limit );
        Result<RefundReceipt>               RequestRefund( const RefundBody &body );

        /**
         * @brief       Maps a response status: 2xx succeeds, 401/403 AUTH, other 4xx CLIENT,
         *              5xx SERVER, anything else PROTOCOL
         * @param[in]   status HTTP status code
         * @param[in]   body Response body, kept as the failure message
         */
        static Result<void> CheckHttpStatus( unsigned status, const std::string &body );

        /**
         * @brief       Percent-encodes everything except RFC 3986 unreserved characters
         */
        static std::string EncodeComponent( const std::string &value );

    private:
        Result<std::string> Exchange( boost::beast::http::verb method, const std::string &target, std::string body );

        std::shared_ptr<api::HttpClient> http_m;
        std::string                      api_key_m;
        base::Logger                     logger_m = base::createLogger( "ServiceClient" );
    };
}

#endif
