#include "price_cache.hpp"
#include <spdlog/spdlog.h>

std::optional<PriceRecord> PriceCache::get(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(symbol);
    if (it == records_.end()) {
        return std::nullopt;
    }

    // Keyed by record symbol on insert, so this only trips on a logic error
    if (it->second.symbol() != symbol) {
        spdlog::error("Price cache entry for {} holds record for {}, ignoring", symbol, it->second.symbol());
        return std::nullopt;
    }

    return it->second;
}

void PriceCache::put(const PriceRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(record.symbol());
    if (it != records_.end()) {
        it->second = record;
    } else {
        records_.emplace(record.symbol(), record);
    }

    spdlog::debug("Cached price for {}: {}", record.symbol(), record.price());
}

size_t PriceCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void PriceCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}
