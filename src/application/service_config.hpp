#ifndef MASUMI_APPLICATION_SERVICE_CONFIG_HPP
#define MASUMI_APPLICATION_SERVICE_CONFIG_HPP

#include <cstdint>
#include <string>

#include "application/impl/config_reader/error.hpp"

namespace masumi::application
{
    /**
     * Settings of the payment service connection and of the monitors.
     * Keys of the JSON config file are the member names.
     */
    struct ServiceConfig
    {
        std::string payment_service_url;
        std::string payment_api_key;
        std::string registry_service_url;
        std::string registry_api_key;
        std::string network;
        std::string payment_contract_address;
        std::string payment_type;
        uint64_t    monitor_interval_ms = 0;
        uint32_t    status_page_limit   = 0;
        std::string log_level;

        /**
         * @return config holding only the defaults of the optional entries
         */
        static ServiceConfig Defaults();
    };

    /**
     * Read a JSON config file. Absent keys stay empty or zero, so the result
     * is meant to be overlaid on Defaults() before validation.
     */
    outcome::result<ServiceConfig> loadConfigFile(const std::string &path);

    /**
     * Parse the JSON text of a config file
     */
    outcome::result<ServiceConfig> parseConfig(const std::string &json);

    /**
     * Read MASUMI_PAYMENT_URL, MASUMI_PAYMENT_KEY, MASUMI_REGISTRY_URL,
     * MASUMI_REGISTRY_KEY and MASUMI_NETWORK
     */
    ServiceConfig loadConfigFromEnvironment();

    /**
     * @return copy of base where every non-empty (non-zero) entry of
     * override_cfg replaces the base entry
     */
    ServiceConfig overlay(const ServiceConfig &base, const ServiceConfig &override_cfg);

    /**
     * Check required entries and value ranges. Every missing key is reported
     * in one log line.
     */
    outcome::result<void> validateConfig(const ServiceConfig &config);

}  // namespace masumi::application

#endif  // MASUMI_APPLICATION_SERVICE_CONFIG_HPP
