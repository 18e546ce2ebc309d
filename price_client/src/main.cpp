#include "config.hpp"
#include "http_quote_transport.hpp"
#include "price_client.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <signal.h>
#include <memory>
#include <string>
#include <vector>

// Global token so the signal handler can abandon an in-flight wait
CancellationToken shutdown_token;

void signal_handler(int) {
    shutdown_token.request_cancel();
}

int main(int argc, char* argv[]) {
    try {
        // 1. Load configuration
        Config config = Config::from_env();
        config.validate();

        // 2. Setup logging
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
        spdlog::info("Starting {}...", config.service_name);

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        std::vector<std::string> symbols(argv + 1, argv + argc);
        if (symbols.empty()) {
            symbols = config.symbols;
        }
        if (symbols.empty()) {
            spdlog::error("No symbols given. Pass them as arguments or set SYMBOLS");
            return 1;
        }

        // 3. Wire the client
        auto transport = std::make_shared<HttpQuoteTransport>(config);
        auto cache = std::make_shared<PriceCache>();
        PriceClient client(transport, cache);

        // 4. Resolve every symbol; any failure makes the run fail
        int failures = 0;
        for (const auto& symbol : symbols) {
            if (shutdown_token.is_cancelled()) {
                spdlog::info("Shutdown requested, skipping remaining symbols");
                ++failures;
                break;
            }
            try {
                auto quote = client.fetch(symbol, config.client_config(), shutdown_token);
                fmt::print("{} {}{}\n", quote.symbol, quote.price, quote.degraded ? " degraded" : "");
            } catch (const ClientError& e) {
                spdlog::error("{}", e.what());
                ++failures;
                if (e.code() == ClientError::Code::Cancelled) {
                    spdlog::info("Shutdown requested, skipping remaining symbols");
                    break;
                }
            }
        }

        return failures == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }
}
