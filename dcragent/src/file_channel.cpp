
#include "file_channel.hpp"
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/spdlog.h>
#include <cstdint>

FileChannel::FileChannel(const FileSinkConfig& config, std::shared_ptr<spdlog::logger> report_logger)
    : config_(config), logger_(std::move(report_logger)) {}

std::shared_ptr<spdlog::logger> FileChannel::make_report_logger(const FileSinkConfig& config) {
    auto sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        config.path, config.rotation_hour, config.rotation_minute, false,
        static_cast<uint16_t>(config.max_files));
    auto logger = std::make_shared<spdlog::logger>("report", sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::info);
    spdlog::info("Report file is {} (rotation {:02}:{:02}, keep {} files)",
                 config.path, config.rotation_hour, config.rotation_minute, config.max_files);
    return logger;
}

bool FileChannel::deliver(const Report& report, std::chrono::system_clock::time_point received) {
    if (!logger_) {
        return false;
    }
    logger_->info(render_report(report, received));
    return true;
}

