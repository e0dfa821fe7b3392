#pragma once

#include "notification_channel.hpp"
#include <memory>
#include <spdlog/logger.h>

// Append-only report file, rotated daily by spdlog
class FileChannel : public NotificationChannel {
public:
    FileChannel(const FileSinkConfig& config, std::shared_ptr<spdlog::logger> report_logger);

    // Report logger writing to the configured rotating file
    static std::shared_ptr<spdlog::logger> make_report_logger(const FileSinkConfig& config);

    std::string name() const override { return "File"; }
    bool enabled() const override { return config_.use; }
    const ChannelPolicy& policy() const override { return config_.policy; }

    bool deliver(const Report& report, std::chrono::system_clock::time_point received) override;

private:
    const FileSinkConfig& config_;
    std::shared_ptr<spdlog::logger> logger_;
};
