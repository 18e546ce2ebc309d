#pragma once
#include "types.hpp"
#include <string>
#include <vector>

class Config {
public:
    // Service info
    std::string service_name = "price_client";
    std::string log_level = "info";

    // Quote source
    std::string quote_api_url = "https://api.hyperliquid.xyz/info";
    std::string quote_request_type = "metaAndAssetCtxs";
    int request_timeout_ms = 10000;

    // Fetch policy, handed to every fetch as a ClientConfig
    int max_retries = 3;
    double backoff_base_seconds = 0.3;
    bool fail_fast_on_rate_limit = false;
    int default_rate_limit_wait_seconds = 60;

    // Symbols the driver resolves when none are given on the command line
    std::vector<std::string> symbols;

    static Config from_env();
    void validate() const;

    ClientConfig client_config() const;
};
