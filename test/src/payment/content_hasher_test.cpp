#include <gtest/gtest.h>

#include <rapidjson/document.h>

#include "payment/content_hasher.hpp"

using masumi::payment::ContentHasher;
using masumi::payment::PaymentError;

namespace
{
    rapidjson::Document ParseJson( const char *text )
    {
        rapidjson::Document document;
        document.Parse( text );
        EXPECT_FALSE( document.HasParseError() ) << text;
        return document;
    }
}

/**
 * @given Two objects with the same members inserted in different orders
 * @when both are digested
 * @then the digests are equal at every nesting depth
 */
TEST( ContentHasherTest, DigestIgnoresKeyOrder )
{
    auto first  = ParseJson( R"({"b":1,"a":{"y":[1,{"q":true,"p":null}],"x":"s"}})" );
    auto second = ParseJson( R"({"a":{"x":"s","y":[1,{"p":null,"q":true}]},"b":1})" );

    EXPECT_EQ( ContentHasher::Digest( first ), ContentHasher::Digest( second ) );
}

/**
 * @given An object repeating a member name among others
 * @when canonicalized
 * @then the name is written once with its last value
 */
TEST( ContentHasherTest, CanonicalizeKeepsLastDuplicateMember )
{
    auto document = ParseJson( R"({"k":1,"a":0,"k":2,"z":{"k":"x","k":"y"},"k":3})" );

    EXPECT_EQ( ContentHasher::Canonicalize( document ), R"({"a":0,"k":3,"z":{"k":"y"}})" );
    EXPECT_EQ( ContentHasher::Digest( document ), ContentHasher::Digest( ParseJson( R"({"z":{"k":"y"},"k":3,"a":0})" ) ) );
}

/**
 * @given An object with nested members and whitespace
 * @when canonicalized
 * @then keys are sorted, arrays keep their order and no whitespace is written
 */
TEST( ContentHasherTest, CanonicalizeSortsKeysCompactly )
{
    auto payload = ParseJson( R"({ "z" : [3, 1, 2], "a" : { "d" : "v", "c" : 1.5 } })" );

    EXPECT_EQ( ContentHasher::Canonicalize( payload ), R"({"a":{"c":1.5,"d":"v"},"z":[3,1,2]})" );
}

/**
 * @given Keys differing in case
 * @when canonicalized
 * @then byte order puts uppercase before lowercase
 */
TEST( ContentHasherTest, CanonicalizeUsesByteOrder )
{
    auto payload = ParseJson( R"({"b":0,"B":0,"a":0,"_":0})" );

    EXPECT_EQ( ContentHasher::Canonicalize( payload ), R"({"B":0,"_":0,"a":0,"b":0})" );
}

/**
 * @given A known payload
 * @when digested
 * @then the digest is the SHA-256 of the canonical text in lowercase hex
 */
TEST( ContentHasherTest, DigestMatchesKnownVector )
{
    // sha256("{}")
    auto empty = ParseJson( "{}" );
    EXPECT_EQ( ContentHasher::Digest( empty ), "44136fa355b3678a1146ad16f7e8649e94fb4fc21fe77e8310c060f61caaff8a" );

    // scalars are hashed as their JSON text
    auto text   = ParseJson( R"("abc")" );
    auto digest = ContentHasher::Digest( text );
    EXPECT_EQ( digest.size(), 64u );
    EXPECT_EQ( digest.find_first_not_of( "0123456789abcdef" ), std::string::npos );
}

/**
 * @given Payloads differing in one value
 * @when digested
 * @then the digests differ
 */
TEST( ContentHasherTest, DigestChangesWithContent )
{
    auto first  = ParseJson( R"({"input":"hello"})" );
    auto second = ParseJson( R"({"input":"hellp"})" );

    EXPECT_NE( ContentHasher::Digest( first ), ContentHasher::Digest( second ) );
}

/**
 * @given JSON text, valid and malformed
 * @when DigestJson is called
 * @then valid text digests like the parsed value and malformed text is a validation error
 */
TEST( ContentHasherTest, DigestJsonParsesText )
{
    auto digest = ContentHasher::DigestJson( R"({"b":2,"a":1})" );
    ASSERT_TRUE( digest );
    auto parsed = ParseJson( R"({"a":1,"b":2})" );
    EXPECT_EQ( digest.value(), ContentHasher::Digest( parsed ) );

    auto broken = ContentHasher::DigestJson( R"({"a":)" );
    ASSERT_FALSE( broken );
    EXPECT_EQ( broken.error().code, PaymentError::VALIDATION );
}
