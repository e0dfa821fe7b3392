
#include "console_channel.hpp"
#include <spdlog/sinks/stdout_sinks.h>

ConsoleChannel::ConsoleChannel(const ConsoleConfig& config, std::shared_ptr<spdlog::logger> stdout_logger)
    : config_(config), logger_(std::move(stdout_logger)) {}

std::shared_ptr<spdlog::logger> ConsoleChannel::make_stdout_logger() {
    auto sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("console", sink);
    logger->set_pattern("%v");
    logger->flush_on(spdlog::level::info);
    return logger;
}

bool ConsoleChannel::deliver(const Report& report, std::chrono::system_clock::time_point received) {
    if (!logger_) {
        return false;
    }
    logger_->info(render_report(report, received));
    return true;
}
