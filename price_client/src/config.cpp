#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", "price_client");
    config.log_level = util::get_env_var("LOG_LEVEL", "info");

    // Quote source
    config.quote_api_url = util::get_env_var("QUOTE_API_URL", "https://api.hyperliquid.xyz/info");
    config.quote_request_type = util::get_env_var("QUOTE_REQUEST_TYPE", "metaAndAssetCtxs");
    config.request_timeout_ms = util::get_env_int("REQUEST_TIMEOUT_MS", 10000);

    // Fetch policy
    config.max_retries = util::get_env_int("MAX_RETRIES", 3);
    config.backoff_base_seconds = util::get_env_double("BACKOFF_BASE_SECONDS", 0.3);
    config.fail_fast_on_rate_limit = util::get_env_bool("FAIL_FAST_ON_RATE_LIMIT", false);
    config.default_rate_limit_wait_seconds = util::get_env_int("DEFAULT_RATE_LIMIT_WAIT_SECONDS", 60);

    // Symbols (comma-separated)
    config.symbols = util::split_string(util::get_env_var("SYMBOLS"), ',');

    return config;
}

void Config::validate() const {
    if (quote_api_url.empty()) {
        throw std::runtime_error("QUOTE_API_URL cannot be empty");
    }

    if (request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS must be positive");
    }

    try {
        client_config().validate();
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid fetch policy: ") + e.what());
    }

    spdlog::info("Configuration validated successfully");
}

ClientConfig Config::client_config() const {
    ClientConfig client;
    client.max_retries = max_retries;
    client.backoff_base_seconds = backoff_base_seconds;
    client.fail_fast_on_rate_limit = fail_fast_on_rate_limit;
    client.default_rate_limit_wait_seconds = default_rate_limit_wait_seconds;
    return client;
}
