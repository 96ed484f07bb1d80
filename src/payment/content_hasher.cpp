#include "payment/content_hasher.hpp"

#include <algorithm>
#include <cstring>
#include <vector>

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "base/hexutil.hpp"
#include "crypto/sha/sha256.hpp"

namespace masumi::payment
{
    namespace
    {
        using CanonicalWriter = rapidjson::Writer<rapidjson::StringBuffer>;

        bool MemberNameLess( const rapidjson::Value::ConstMemberIterator &lhs,
                             const rapidjson::Value::ConstMemberIterator &rhs )
        {
            const auto lhs_len = lhs->name.GetStringLength();
            const auto rhs_len = rhs->name.GetStringLength();
            const int  cmp     = std::memcmp( lhs->name.GetString(), rhs->name.GetString(), std::min( lhs_len, rhs_len ) );
            return cmp != 0 ? cmp < 0 : lhs_len < rhs_len;
        }

        void WriteCanonical( const rapidjson::Value &value, CanonicalWriter &writer )
        {
            if ( value.IsObject() )
            {
                std::vector<rapidjson::Value::ConstMemberIterator> members;
                members.reserve( value.MemberCount() );
                for ( auto it = value.MemberBegin(); it != value.MemberEnd(); ++it )
                {
                    members.push_back( it );
                }
                std::stable_sort( members.begin(), members.end(), MemberNameLess );

                // Duplicate names keep only their last occurrence
                writer.StartObject();
                for ( size_t i = 0; i < members.size(); ++i )
                {
                    if ( i + 1 < members.size() && !MemberNameLess( members[i], members[i + 1] ) )
                    {
                        continue;
                    }
                    const auto &member = members[i];
                    writer.Key( member->name.GetString(), member->name.GetStringLength() );
                    WriteCanonical( member->value, writer );
                }
                writer.EndObject();
            }
            else if ( value.IsArray() )
            {
                writer.StartArray();
                for ( const auto &element : value.GetArray() )
                {
                    WriteCanonical( element, writer );
                }
                writer.EndArray();
            }
            else
            {
                value.Accept( writer );
            }
        }
    }

    std::string ContentHasher::Canonicalize( const rapidjson::Value &payload )
    {
        rapidjson::StringBuffer buffer;
        CanonicalWriter         writer( buffer );
        WriteCanonical( payload, writer );
        return std::string( buffer.GetString(), buffer.GetSize() );
    }

    std::string ContentHasher::Digest( const rapidjson::Value &payload )
    {
        return base::hex_lower( crypto::sha256( Canonicalize( payload ) ) );
    }

    Result<std::string> ContentHasher::DigestJson( std::string_view json_text )
    {
        rapidjson::Document document;
        document.Parse( json_text.data(), json_text.size() );
        if ( document.HasParseError() )
        {
            return Fail( PaymentError::VALIDATION,
                         std::string( "payload is not valid JSON: " ) +
                             rapidjson::GetParseError_En( document.GetParseError() ) + " at offset " +
                             std::to_string( document.GetErrorOffset() ) );
        }
        return Digest( document );
    }
}
