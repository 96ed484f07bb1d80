#include "application/service_config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "api/transport/url.hpp"
#include "base/logger.hpp"
#include "payment/types.hpp"

namespace masumi::application
{
    namespace
    {
        base::Logger configLogger()
        {
            static base::Logger logger = base::createLogger( "Config" );
            return logger;
        }

        bool readString( const rapidjson::Value &root, const char *key, std::string &out )
        {
            auto member = root.FindMember( key );
            if ( member == root.MemberEnd() )
            {
                return true;
            }
            if ( !member->value.IsString() )
            {
                return false;
            }
            out.assign( member->value.GetString(), member->value.GetStringLength() );
            return true;
        }

        /// Numeric entries are positive, 0 means unset to overlay()
        template <typename T>
        bool readPositive( const rapidjson::Value &root, const char *key, T &out )
        {
            auto member = root.FindMember( key );
            if ( member == root.MemberEnd() )
            {
                return true;
            }
            if ( !member->value.IsUint64() )
            {
                return false;
            }
            auto value = member->value.GetUint64();
            if ( value == 0 || value > std::numeric_limits<T>::max() )
            {
                return false;
            }
            out = static_cast<T>( value );
            return true;
        }

        std::string environment( const char *name )
        {
            const char *value = std::getenv( name );
            return value ? std::string( value ) : std::string();
        }

        const std::string &pick( const std::string &base, const std::string &override_value )
        {
            return override_value.empty() ? base : override_value;
        }
    }

    ServiceConfig ServiceConfig::Defaults()
    {
        ServiceConfig config;
        config.network                  = std::string( payment::DEFAULT_NETWORK );
        config.payment_contract_address = std::string( payment::DEFAULT_PAYMENT_CONTRACT_ADDRESS );
        config.payment_type             = std::string( payment::DEFAULT_PAYMENT_TYPE );
        config.monitor_interval_ms      = static_cast<uint64_t>( payment::DEFAULT_MONITOR_INTERVAL.count() );
        config.status_page_limit        = payment::DEFAULT_STATUS_PAGE_LIMIT;
        config.log_level                = "info";
        return config;
    }

    outcome::result<ServiceConfig> loadConfigFile( const std::string &path )
    {
        std::ifstream file( path );
        if ( !file.is_open() )
        {
            configLogger()->error( "Cannot open config file {}", path );
            return ConfigReaderError::FILE_NOT_FOUND;
        }
        std::stringstream content;
        content << file.rdbuf();
        return parseConfig( content.str() );
    }

    outcome::result<ServiceConfig> parseConfig( const std::string &json )
    {
        rapidjson::Document document;
        document.Parse( json.c_str(), json.size() );
        if ( document.HasParseError() )
        {
            configLogger()->error( "Config parse error at offset {}: {}",
                                   document.GetErrorOffset(),
                                   rapidjson::GetParseError_En( document.GetParseError() ) );
            return ConfigReaderError::PARSER_ERROR;
        }
        if ( !document.IsObject() )
        {
            configLogger()->error( "Config root must be a JSON object" );
            return ConfigReaderError::PARSER_ERROR;
        }

        ServiceConfig config;
        const bool    ok = readString( document, "payment_service_url", config.payment_service_url ) &&
                        readString( document, "payment_api_key", config.payment_api_key ) &&
                        readString( document, "registry_service_url", config.registry_service_url ) &&
                        readString( document, "registry_api_key", config.registry_api_key ) &&
                        readString( document, "network", config.network ) &&
                        readString( document, "payment_contract_address", config.payment_contract_address ) &&
                        readString( document, "payment_type", config.payment_type ) &&
                        readPositive( document, "monitor_interval_ms", config.monitor_interval_ms ) &&
                        readPositive( document, "status_page_limit", config.status_page_limit ) &&
                        readString( document, "log_level", config.log_level );
        if ( !ok )
        {
            configLogger()->error( "Config entry has the wrong JSON type" );
            return ConfigReaderError::INVALID_VALUE;
        }
        return config;
    }

    ServiceConfig loadConfigFromEnvironment()
    {
        ServiceConfig config;
        config.payment_service_url  = environment( "MASUMI_PAYMENT_URL" );
        config.payment_api_key      = environment( "MASUMI_PAYMENT_KEY" );
        config.registry_service_url = environment( "MASUMI_REGISTRY_URL" );
        config.registry_api_key     = environment( "MASUMI_REGISTRY_KEY" );
        config.network              = environment( "MASUMI_NETWORK" );
        return config;
    }

    ServiceConfig overlay( const ServiceConfig &base, const ServiceConfig &override_cfg )
    {
        ServiceConfig merged;
        merged.payment_service_url      = pick( base.payment_service_url, override_cfg.payment_service_url );
        merged.payment_api_key          = pick( base.payment_api_key, override_cfg.payment_api_key );
        merged.registry_service_url     = pick( base.registry_service_url, override_cfg.registry_service_url );
        merged.registry_api_key         = pick( base.registry_api_key, override_cfg.registry_api_key );
        merged.network                  = pick( base.network, override_cfg.network );
        merged.payment_contract_address = pick( base.payment_contract_address,
                                                override_cfg.payment_contract_address );
        merged.payment_type             = pick( base.payment_type, override_cfg.payment_type );
        merged.monitor_interval_ms      = override_cfg.monitor_interval_ms != 0 ? override_cfg.monitor_interval_ms
                                                                                : base.monitor_interval_ms;
        merged.status_page_limit        = override_cfg.status_page_limit != 0 ? override_cfg.status_page_limit
                                                                              : base.status_page_limit;
        merged.log_level                = pick( base.log_level, override_cfg.log_level );
        return merged;
    }

    outcome::result<void> validateConfig( const ServiceConfig &config )
    {
        std::vector<std::string> missing;
        if ( config.payment_service_url.empty() )
        {
            missing.emplace_back( "payment_service_url" );
        }
        if ( config.payment_api_key.empty() )
        {
            missing.emplace_back( "payment_api_key" );
        }
        if ( !missing.empty() )
        {
            configLogger()->error( "Missing config entries: {}", boost::algorithm::join( missing, ", " ) );
            return ConfigReaderError::MISSING_ENTRY;
        }

        if ( !api::parseUrl( config.payment_service_url ) )
        {
            configLogger()->error( "payment_service_url is not an http(s) URL: {}", config.payment_service_url );
            return ConfigReaderError::INVALID_VALUE;
        }
        if ( !config.registry_service_url.empty() && !api::parseUrl( config.registry_service_url ) )
        {
            configLogger()->error( "registry_service_url is not an http(s) URL: {}", config.registry_service_url );
            return ConfigReaderError::INVALID_VALUE;
        }
        if ( config.monitor_interval_ms == 0 )
        {
            configLogger()->error( "monitor_interval_ms must be positive" );
            return ConfigReaderError::INVALID_VALUE;
        }
        if ( config.status_page_limit == 0 )
        {
            configLogger()->error( "status_page_limit must be positive" );
            return ConfigReaderError::INVALID_VALUE;
        }
        if ( config.network.empty() || config.payment_contract_address.empty() || config.payment_type.empty() )
        {
            configLogger()->error( "network, payment_contract_address and payment_type must not be empty" );
            return ConfigReaderError::INVALID_VALUE;
        }
        return outcome::success();
    }

}
