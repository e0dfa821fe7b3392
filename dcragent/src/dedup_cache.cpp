
#include "dedup_cache.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

DedupCache::DedupCache(Clock::duration validity_window) : validity_window_(validity_window) {}

bool DedupCache::lookup_or_insert(const Report& report, Clock::time_point now) {
    for (const auto& entry : entries_) {
        if (entry.report == report) {
            return false;
        }
    }
    entries_.push_back(CacheEntry{now, report});
    return true;
}

size_t DedupCache::evict_expired(Clock::time_point now) {
    size_t evicted = 0;
    while (!entries_.empty() && now - entries_.front().arrival > validity_window_) {
        entries_.pop_front();
        ++evicted;
    }
    return evicted;
}

std::vector<CacheEntry> DedupCache::snapshot() const {
    return std::vector<CacheEntry>(entries_.begin(), entries_.end());
}

void DedupCache::restore(std::vector<CacheEntry> entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const CacheEntry& a, const CacheEntry& b) {
        return a.arrival < b.arrival;
    });

    entries_.clear();
    size_t duplicates = 0;
    for (auto& entry : entries) {
        bool seen = std::any_of(entries_.begin(), entries_.end(), [&](const CacheEntry& existing) {
            return existing.report == entry.report;
        });
        if (seen) {
            ++duplicates;
            continue;
        }
        entries_.push_back(std::move(entry));
    }

    if (duplicates > 0) {
        spdlog::warn("Dropped {} duplicate entries while restoring the cache", duplicates);
    }
}
