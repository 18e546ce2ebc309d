#pragma once

#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Last-known-good price per symbol. Entries never expire; callers that care
// about staleness inspect PriceRecord::observed_at().
class PriceCache {
public:
    PriceCache() = default;

    // Get the last validated record for a symbol
    std::optional<PriceRecord> get(const std::string& symbol) const;

    // Replace the record for record.symbol(). Later completions win.
    void put(const PriceRecord& record);

    // Number of symbols with a cached record
    size_t size() const;

    // Drop every entry
    void clear();

    // Non-copyable
    PriceCache(const PriceCache&) = delete;
    PriceCache& operator=(const PriceCache&) = delete;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PriceRecord> records_;
};
