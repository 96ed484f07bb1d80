/**
 * @file       content_hasher.hpp
 * @brief      Deterministic content addressing of JSON payloads
 */
#ifndef _MASUMI_CONTENT_HASHER_HPP_
#define _MASUMI_CONTENT_HASHER_HPP_

#include <string>
#include <string_view>

#include <rapidjson/document.h>

#include "payment/error.hpp"

namespace masumi::payment
{
    /**
     * @brief      Commits to the content of a payload: object keys are sorted recursively, the
     *             value is written as compact UTF-8 JSON and hashed with SHA-256. Payloads that
     *             differ only in key order get the same digest.
     */
    class ContentHasher
    {
    public:
        /**
         * @brief       Canonical text of a payload
         * @param[in]   payload Any JSON value
         * @return      Compact JSON with sorted object keys
         */
        static std::string Canonicalize( const rapidjson::Value &payload );

        /**
         * @brief       Digest of a payload
         * @param[in]   payload Any JSON value
         * @return      64 lowercase hex characters
         */
        static std::string Digest( const rapidjson::Value &payload );

        /**
         * @brief       Parses JSON text then digests it
         * @param[in]   json_text JSON document
         * @return      64 lowercase hex characters, or PaymentError::VALIDATION on malformed text
         */
        static Result<std::string> DigestJson( std::string_view json_text );
    };
}

#endif
