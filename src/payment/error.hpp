/**
 * @file       error.hpp
 * @brief      Error kinds of payment and purchase operations
 */
#ifndef _MASUMI_PAYMENT_ERROR_HPP_
#define _MASUMI_PAYMENT_ERROR_HPP_

#include <string>
#include <system_error>

#include "outcome/outcome.hpp"

namespace masumi::payment
{
    /**
     * @brief      Kind of a failed payment service operation
     */
    enum class PaymentError
    {
        VALIDATION = 1, ///< Detected locally, the request never reached the network
        AUTH       = 2, ///< Service rejected the API key (401/403)
        CLIENT     = 3, ///< Service rejected the request (400 and other 4xx)
        SERVER     = 4, ///< Service failed (5xx), may be retried by the caller
        PROTOCOL   = 5, ///< Unexpected response shape or next action
        STATE      = 6, ///< Operation invoked out of lifecycle order
        TRANSPORT  = 7, ///< Resolve/connect/TLS/read/write failure
    };
}

MASUMI_OUTCOME_DECLARE_ERROR( masumi::payment, PaymentError )

namespace masumi::payment
{
    /**
     * @brief      Error payload carried by Result: the kind, the HTTP status when one was
     *             received, and the service body or local reason.
     */
    struct Failure
    {
        std::error_code code;
        unsigned        http_status = 0;
        std::string     message;
    };

    /// Lets Boost.Outcome treat Failure as an error code
    inline const std::error_code &make_error_code( const Failure &failure )
    {
        return failure.code;
    }

    /// Called by Result::value() on failure
    [[noreturn]] void outcome_throw_as_system_error_with_payload( const Failure &failure );

    template <typename T>
    using Result = outcome::result<T, Failure>;

    inline auto Fail( PaymentError kind, std::string message, unsigned http_status = 0 )
    {
        return outcome::failure( Failure{ kind, http_status, std::move( message ) } );
    }

    /**
     * @brief      Human readable form, e.g. "client error (HTTP 400): bad amount"
     */
    std::string Describe( const Failure &failure );
}

#endif
