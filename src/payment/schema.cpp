#include "payment/schema.hpp"

#include <cstdlib>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace masumi::payment
{
    namespace
    {
        using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

        void WriteString( JsonWriter &writer, const char *key, const std::string &value )
        {
            writer.Key( key );
            writer.String( value.c_str(), static_cast<rapidjson::SizeType>( value.size() ) );
        }

        void WriteAmounts( JsonWriter &writer, const std::vector<Amount> &amounts )
        {
            writer.Key( "amounts" );
            writer.StartArray();
            for ( const auto &amount : amounts )
            {
                writer.StartObject();
                WriteString( writer, "amount", std::to_string( amount.quantity ) );
                WriteString( writer, "unit", amount.unit );
                writer.EndObject();
            }
            writer.EndArray();
        }

        void WriteTimeWindows( JsonWriter &writer, const TimeWindows &windows )
        {
            WriteString( writer, "payByTime", std::to_string( windows.pay_by_time ) );
            WriteString( writer, "submitResultTime", std::to_string( windows.submit_result_time ) );
            WriteString( writer, "unlockTime", std::to_string( windows.unlock_time ) );
            WriteString( writer, "externalDisputeUnlockTime", std::to_string( windows.external_dispute_unlock_time ) );
        }

        std::string Finish( const rapidjson::StringBuffer &buffer )
        {
            return std::string( buffer.GetString(), buffer.GetSize() );
        }

        /// Parses the {"status":..., "data":{...}} envelope, leaving data in @param document
        Result<void> ParseEnvelope( const std::string &body, rapidjson::Document &document )
        {
            document.Parse( body.c_str(), body.size() );
            if ( document.HasParseError() )
            {
                return Fail( PaymentError::PROTOCOL,
                             std::string( "response is not valid JSON: " ) +
                                 rapidjson::GetParseError_En( document.GetParseError() ) );
            }
            if ( !document.IsObject() )
            {
                return Fail( PaymentError::PROTOCOL, "response is not a JSON object" );
            }
            if ( document.HasMember( "status" ) && document["status"].IsString() &&
                 std::string( document["status"].GetString() ) != "success" )
            {
                return Fail( PaymentError::PROTOCOL,
                             std::string( "response status is " ) + document["status"].GetString() );
            }
            if ( !document.HasMember( "data" ) || !document["data"].IsObject() )
            {
                return Fail( PaymentError::PROTOCOL, "response is missing the data object" );
            }
            return outcome::success();
        }

        std::string GetString( const rapidjson::Value &object, const char *key )
        {
            auto member = object.FindMember( key );
            if ( member == object.MemberEnd() || !member->value.IsString() )
            {
                return {};
            }
            return std::string( member->value.GetString(), member->value.GetStringLength() );
        }

        /// Times arrive either as numbers or as decimal strings; anything else reads as 0
        int64_t GetTime( const rapidjson::Value &object, const char *key )
        {
            auto member = object.FindMember( key );
            if ( member == object.MemberEnd() )
            {
                return 0;
            }
            if ( member->value.IsInt64() )
            {
                return member->value.GetInt64();
            }
            if ( member->value.IsString() )
            {
                const char *text = member->value.GetString();
                char       *end  = nullptr;
                const auto  time = std::strtoll( text, &end, 10 );
                return ( end != text && *end == '\0' ) ? time : 0;
            }
            return 0;
        }

        std::string GetRequestedAction( const rapidjson::Value &object )
        {
            auto next_action = object.FindMember( "NextAction" );
            if ( next_action == object.MemberEnd() || !next_action->value.IsObject() )
            {
                return {};
            }
            return GetString( next_action->value, "requestedAction" );
        }
    }

    std::string CreatePaymentBody::ToJson() const
    {
        rapidjson::StringBuffer buffer;
        JsonWriter              writer( buffer );
        writer.StartObject();
        WriteString( writer, "agentIdentifier", agent_identifier );
        WriteString( writer, "network", network );
        WriteString( writer, "paymentContractAddress", payment_contract_address );
        WriteAmounts( writer, amounts );
        WriteString( writer, "paymentType", payment_type );
        WriteTimeWindows( writer, time_windows );
        WriteString( writer, "inputHash", input_hash );
        WriteString( writer, "identifierFromPurchaser", identifier_from_purchaser );
        writer.EndObject();
        return Finish( buffer );
    }

    Result<CreatePaymentResponse> CreatePaymentResponse::FromJson( const std::string &body )
    {
        rapidjson::Document document;
        BOOST_OUTCOME_TRY( ParseEnvelope( body, document ) );
        const auto &data = document["data"];

        CreatePaymentResponse response;
        response.blockchain_identifier = GetString( data, "blockchainIdentifier" );
        if ( response.blockchain_identifier.empty() )
        {
            return Fail( PaymentError::PROTOCOL, "response is missing data.blockchainIdentifier" );
        }
        response.input_hash                   = GetString( data, "inputHash" );
        response.submit_result_time           = GetTime( data, "submitResultTime" );
        response.unlock_time                  = GetTime( data, "unlockTime" );
        response.external_dispute_unlock_time = GetTime( data, "externalDisputeUnlockTime" );
        return response;
    }

    std::string CompletePaymentBody::ToJson() const
    {
        rapidjson::StringBuffer buffer;
        JsonWriter              writer( buffer );
        writer.StartObject();
        WriteString( writer, "network", network );
        WriteString( writer, "paymentContractAddress", payment_contract_address );
        WriteString( writer, "hash", hash );
        WriteString( writer, "identifier", identifier );
        writer.EndObject();
        return Finish( buffer );
    }

    Result<Receipt> Receipt::FromJson( const std::string &body )
    {
        rapidjson::Document document;
        BOOST_OUTCOME_TRY( ParseEnvelope( body, document ) );
        const auto &data = document["data"];

        Receipt receipt;
        receipt.blockchain_identifier = GetString( data, "blockchainIdentifier" );
        receipt.requested_action      = GetRequestedAction( data );
        receipt.result_hash           = GetString( data, "resultHash" );
        return receipt;
    }

    std::string CreatePurchaseBody::ToJson() const
    {
        rapidjson::StringBuffer buffer;
        JsonWriter              writer( buffer );
        writer.StartObject();
        WriteString( writer, "blockchainIdentifier", blockchain_identifier );
        WriteString( writer, "network", network );
        WriteString( writer, "sellerVkey", seller_vkey );
        WriteString( writer, "agentIdentifier", agent_identifier );
        WriteString( writer, "paymentType", payment_type );
        WriteAmounts( writer, amounts );
        WriteTimeWindows( writer, time_windows );
        WriteString( writer, "identifierFromPurchaser", identifier_from_purchaser );
        WriteString( writer, "inputHash", input_hash );
        writer.EndObject();
        return Finish( buffer );
    }

    Result<PurchaseReceipt> PurchaseReceipt::FromJson( const std::string &body )
    {
        rapidjson::Document document;
        BOOST_OUTCOME_TRY( ParseEnvelope( body, document ) );
        const auto &data = document["data"];

        PurchaseReceipt receipt;
        receipt.id = GetString( data, "id" );
        if ( receipt.id.empty() )
        {
            return Fail( PaymentError::PROTOCOL, "response is missing data.id" );
        }
        receipt.blockchain_identifier = GetString( data, "blockchainIdentifier" );
        receipt.requested_action      = GetRequestedAction( data );
        return receipt;
    }

    std::string RefundBody::ToJson() const
    {
        rapidjson::StringBuffer buffer;
        JsonWriter              writer( buffer );
        writer.StartObject();
        WriteString( writer, "blockchainIdentifier", blockchain_identifier );
        WriteString( writer, "network", network );
        writer.EndObject();
        return Finish( buffer );
    }

    Result<RefundReceipt> RefundReceipt::FromJson( const std::string &body )
    {
        rapidjson::Document document;
        BOOST_OUTCOME_TRY( ParseEnvelope( body, document ) );
        const auto &data = document["data"];

        RefundReceipt receipt;
        receipt.id               = GetString( data, "id" );
        receipt.requested_action = GetRequestedAction( data );
        receipt.on_chain_state   = GetString( data, "onChainState" );
        return receipt;
    }

    Result<std::vector<StatusSnapshot>> ParseStatusList( const std::string &body, const char *list_key )
    {
        rapidjson::Document document;
        BOOST_OUTCOME_TRY( ParseEnvelope( body, document ) );
        const auto &data = document["data"];

        auto list = data.FindMember( list_key );
        if ( list == data.MemberEnd() || !list->value.IsArray() )
        {
            return Fail( PaymentError::PROTOCOL, std::string( "response is missing data." ) + list_key );
        }

        std::vector<StatusSnapshot> snapshots;
        snapshots.reserve( list->value.Size() );
        for ( const auto &entry : list->value.GetArray() )
        {
            if ( !entry.IsObject() )
            {
                return Fail( PaymentError::PROTOCOL, std::string( "data." ) + list_key + " holds a non-object entry" );
            }
            StatusSnapshot snapshot;
            snapshot.blockchain_identifier = GetString( entry, "blockchainIdentifier" );
            if ( snapshot.blockchain_identifier.empty() )
            {
                return Fail( PaymentError::PROTOCOL, std::string( "data." ) + list_key +
                                                         " entry is missing blockchainIdentifier" );
            }
            snapshot.on_chain_state   = GetString( entry, "onChainState" );
            snapshot.requested_action = GetRequestedAction( entry );
            snapshot.input_hash       = GetString( entry, "inputHash" );
            auto result_hash          = GetString( entry, "resultHash" );
            if ( !result_hash.empty() )
            {
                snapshot.result_hash = std::move( result_hash );
            }
            snapshots.push_back( std::move( snapshot ) );
        }
        return snapshots;
    }
}
