#pragma once

#include "config.hpp"
#include "dedup_cache.hpp"
#include "shutdown.hpp"
#include <atomic>
#include <cstdint>

// Counters published to the health endpoint. Written by the pipeline
// thread, read from the health thread.
struct AgentStatus {
    std::atomic<bool> producer_running{false};
    std::atomic<int> producer_pid{0};
    std::atomic<uint64_t> sessions{0};
    std::atomic<uint64_t> restarts{0};
    std::atomic<uint64_t> decode_errors{0};

    std::atomic<uint64_t> received{0};
    std::atomic<uint64_t> duplicates{0};
    std::atomic<uint64_t> delivered{0};
    std::atomic<uint64_t> filtered{0};
    std::atomic<uint64_t> cache_entries{0};
};

// State built once at startup and handed to every component
struct AgentContext {
    const Config& config;
    DedupCache& cache;
    AgentStatus& status;
    ShutdownSignal& shutdown;
};
