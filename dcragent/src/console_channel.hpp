#pragma once

#include "notification_channel.hpp"
#include <memory>
#include <spdlog/logger.h>

class ConsoleChannel : public NotificationChannel {
public:
    ConsoleChannel(const ConsoleConfig& config, std::shared_ptr<spdlog::logger> stdout_logger);

    static std::shared_ptr<spdlog::logger> make_stdout_logger();

    std::string name() const override { return "Console"; }
    bool enabled() const override { return config_.use; }
    const ChannelPolicy& policy() const override { return config_.policy; }

    bool deliver(const Report& report, std::chrono::system_clock::time_point received) override;

private:
    const ConsoleConfig& config_;
    std::shared_ptr<spdlog::logger> logger_;
};
