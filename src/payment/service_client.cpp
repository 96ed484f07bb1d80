#include "payment/service_client.hpp"

#include <cctype>
#include <cstdio>

namespace masumi::payment
{
    namespace http = boost::beast::http;

    ServiceClient::ServiceClient( std::shared_ptr<api::HttpClient> http, std::string api_key ) :
        http_m( std::move( http ) ), //
        api_key_m( std::move( api_key ) )
    {
    }

    Result<CreatePaymentResponse> ServiceClient::CreatePayment( const CreatePaymentBody &body )
    {
        BOOST_OUTCOME_TRY( response, Exchange( http::verb::post, "/payment/", body.ToJson() ) );
        return CreatePaymentResponse::FromJson( response );
    }

    Result<std::vector<StatusSnapshot>> ServiceClient::GetPayment( const std::string &blockchain_identifier )
    {
        BOOST_OUTCOME_TRY( response,
                           Exchange( http::verb::get, "/payment/" + EncodeComponent( blockchain_identifier ), {} ) );
        return ParseStatusList( response, "Payments" );
    }

    Result<std::vector<StatusSnapshot>> ServiceClient::ListPayments( const std::string &network, uint32_t limit )
    {
        BOOST_OUTCOME_TRY( response,
                           Exchange( http::verb::get,
                                     "/payment/?network=" + EncodeComponent( network ) +
                                         "&limit=" + std::to_string( limit ),
                                     {} ) );
        return ParseStatusList( response, "Payments" );
    }

    Result<Receipt> ServiceClient::CompletePayment( const CompletePaymentBody &body )
    {
        BOOST_OUTCOME_TRY( response, Exchange( http::verb::patch, "/payment/", body.ToJson() ) );
        return Receipt::FromJson( response );
    }

    Result<PurchaseReceipt> ServiceClient::CreatePurchase( const CreatePurchaseBody &body )
    {
        BOOST_OUTCOME_TRY( response, Exchange( http::verb::post, "/purchase/", body.ToJson() ) );
        return PurchaseReceipt::FromJson( response );
    }

    Result<std::vector<StatusSnapshot>> ServiceClient::ListPurchases( const std::string &network, uint32_t limit )
    {
        BOOST_OUTCOME_TRY( response,
                           Exchange( http::verb::get,
                                     "/purchase/?network=" + EncodeComponent( network ) +
                                         "&limit=" + std::to_string( limit ),
                                     {} ) );
        return ParseStatusList( response, "Purchases" );
    }

    Result<RefundReceipt> ServiceClient::RequestRefund( const RefundBody &body )
    {
        BOOST_OUTCOME_TRY( response, Exchange( http::verb::post, "/purchase/request-refund", body.ToJson() ) );
        return RefundReceipt::FromJson( response );
    }

    Result<void> ServiceClient::CheckHttpStatus( unsigned status, const std::string &body )
    {
        if ( status >= 200 && status < 300 )
        {
            return outcome::success();
        }
        if ( status == 401 || status == 403 )
        {
            return Fail( PaymentError::AUTH, "Unauthorized: invalid API key", status );
        }
        if ( status >= 400 && status < 500 )
        {
            return Fail( PaymentError::CLIENT, "Bad request: " + body, status );
        }
        if ( status >= 500 && status < 600 )
        {
            return Fail( PaymentError::SERVER, "Internal server error: " + body, status );
        }
        return Fail( PaymentError::PROTOCOL, "Unexpected HTTP status", status );
    }

    std::string ServiceClient::EncodeComponent( const std::string &value )
    {
        std::string encoded;
        encoded.reserve( value.size() );
        for ( unsigned char c : value )
        {
            if ( std::isalnum( c ) || c == '-' || c == '_' || c == '.' || c == '~' )
            {
                encoded.push_back( static_cast<char>( c ) );
            }
            else
            {
                char escaped[4];
                std::snprintf( escaped, sizeof( escaped ), "%%%02X", c );
                encoded.append( escaped, 3 );
            }
        }
        return encoded;
    }

    Result<std::string> ServiceClient::Exchange( http::verb method, const std::string &target, std::string body )
    {
        api::HttpRequest request;
        request.method  = method;
        request.target  = target;
        request.headers = { { "token", api_key_m },
                            { "Content-Type", "application/json" },
                            { "Accept", "application/json" } };
        request.body    = std::move( body );

        auto response = http_m->send( request );
        if ( !response )
        {
            logger_m->warn( "{} {} failed: {}", std::string( http::to_string( method ) ), target,
                            response.error().message() );
            return Fail( PaymentError::TRANSPORT, response.error().message() );
        }

        auto checked = CheckHttpStatus( response.value().status, response.value().body );
        if ( !checked )
        {
            logger_m->warn( "{} {} rejected: {}", std::string( http::to_string( method ) ), target,
                            Describe( checked.error() ) );
            return checked.as_failure();
        }
        logger_m->debug( "{} {} -> {}", std::string( http::to_string( method ) ), target, response.value().status );
        return std::move( response.value().body );
    }
}
