#include "payment/error.hpp"

MASUMI_OUTCOME_DEFINE_CATEGORY( masumi::payment, PaymentError, e )
{
    switch ( e )
    {
        case masumi::payment::PaymentError::VALIDATION:
            return "validation error";
        case masumi::payment::PaymentError::AUTH:
            return "authentication error";
        case masumi::payment::PaymentError::CLIENT:
            return "client error";
        case masumi::payment::PaymentError::SERVER:
            return "server error";
        case masumi::payment::PaymentError::PROTOCOL:
            return "protocol error";
        case masumi::payment::PaymentError::STATE:
            return "state error";
        case masumi::payment::PaymentError::TRANSPORT:
            return "transport error";
    }
    return "Unknown error";
}

namespace masumi::payment
{
    void outcome_throw_as_system_error_with_payload( const Failure &failure )
    {
        throw std::system_error( failure.code, failure.message );
    }

    std::string Describe( const Failure &failure )
    {
        std::string text = failure.code.message();
        if ( failure.http_status != 0 )
        {
            text += " (HTTP " + std::to_string( failure.http_status ) + ")";
        }
        if ( !failure.message.empty() )
        {
            text += ": " + failure.message;
        }
        return text;
    }
}
