#include "crypto/sha/sha256.hpp"

#include <openssl/evp.h>

namespace masumi::crypto
{
    Hash256 sha256( std::string_view input )
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto *bytes_ptr = reinterpret_cast<const uint8_t *>( input.data() );
        return sha256( bytes_ptr, input.length() );
    }

    Hash256 sha256( const uint8_t *data, size_t size )
    {
        Hash256      out{};
        unsigned int digest_len = 0;

        EVP_MD_CTX *ctx = EVP_MD_CTX_new();
        EVP_DigestInit_ex( ctx, EVP_sha256(), nullptr );
        EVP_DigestUpdate( ctx, data, size );
        EVP_DigestFinal_ex( ctx, out.data(), &digest_len );
        EVP_MD_CTX_free( ctx );

        return out;
    }
} // namespace masumi::crypto
