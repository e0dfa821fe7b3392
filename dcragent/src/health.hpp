#pragma once

#include "agent_context.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

// Snapshot of the agent counters served on GET /health
nlohmann::json health_status_json(const std::string& service, const AgentStatus& status);

class HealthChecker {
public:
    HealthChecker(const std::string& host, int port, const std::string& service, const AgentStatus& status);
    ~HealthChecker();

    void start();
    void stop();
    bool is_running() const;

    // Non-copyable
    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
