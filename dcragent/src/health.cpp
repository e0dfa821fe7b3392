#include "health.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <httplib.h>
#include <atomic>
#include <thread>

nlohmann::json health_status_json(const std::string& service, const AgentStatus& status) {
    bool running = status.producer_running.load();
    return {
        {"service", service},
        {"status", running ? "healthy" : "unhealthy"},
        {"timestamp", util::current_iso8601()},
        {"producer", {
            {"running", running},
            {"pid", status.producer_pid.load()},
            {"sessions", status.sessions.load()},
            {"restarts", status.restarts.load()},
            {"decode_errors", status.decode_errors.load()}
        }},
        {"cache", {
            {"entries", status.cache_entries.load()}
        }},
        {"received", status.received.load()},
        {"duplicates", status.duplicates.load()},
        {"delivered", status.delivered.load()},
        {"filtered", status.filtered.load()}
    };
}

class HealthChecker::Impl {
public:
    Impl(const std::string& host, int port, const std::string& service, const AgentStatus& status)
        : host_(host), port_(port), service_(service), status_(status), running_(false) {
        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            res.status = status_.producer_running ? 200 : 503;
            res.set_content(health_status_json(service_, status_).dump(), "application/json");
        });
    }

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            spdlog::warn("Health checker already running");
            return;
        }

        if (!server_.bind_to_port(host_, port_)) {
            spdlog::error("Failed to start health server on {}:{}", host_, port_);
            return;
        }

        running_ = true;
        health_thread_ = std::thread([this]() {
            spdlog::info("Health server listening on {}:{}", host_, port_);
            if (!server_.listen_after_bind()) {
                spdlog::error("Health server on {}:{} stopped unexpectedly", host_, port_);
            }
        });
        // stop() is a no-op until the accept loop runs
        server_.wait_until_ready();
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        server_.stop();
        if (health_thread_.joinable()) {
            health_thread_.join();
        }

        spdlog::info("Health checker stopped");
    }

    bool is_running() const {
        return running_;
    }

private:
    std::string host_;
    int port_;
    std::string service_;
    const AgentStatus& status_;
    std::atomic<bool> running_;
    httplib::Server server_;
    std::thread health_thread_;
};

HealthChecker::HealthChecker(const std::string& host, int port, const std::string& service, const AgentStatus& status)
    : pImpl_(std::make_unique<Impl>(host, port, service, status)) {}

HealthChecker::~HealthChecker() = default;

void HealthChecker::start() {
    pImpl_->start();
}

void HealthChecker::stop() {
    pImpl_->stop();
}

bool HealthChecker::is_running() const {
    return pImpl_->is_running();
}
