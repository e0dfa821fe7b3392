#pragma once

#include "types.hpp"
#include <chrono>
#include <deque>
#include <vector>

// Reports seen within the validity window, oldest first. Entries are only
// appended at the tail, so arrival order is time order.
class DedupCache {
public:
    using Clock = std::chrono::system_clock;

    explicit DedupCache(Clock::duration validity_window);

    // Returns true and appends when no structurally equal report is cached
    bool lookup_or_insert(const Report& report, Clock::time_point now);

    // Drops head entries older than the validity window, returns the count
    size_t evict_expired(Clock::time_point now);

    std::vector<CacheEntry> snapshot() const;
    void restore(std::vector<CacheEntry> entries);

    size_t size() const { return entries_.size(); }
    Clock::duration validity_window() const { return validity_window_; }

private:
    Clock::duration validity_window_;
    std::deque<CacheEntry> entries_;
};
