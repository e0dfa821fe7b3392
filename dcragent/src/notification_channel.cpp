
#include "notification_channel.hpp"
#include "util.hpp"
#include <fmt/core.h>

std::optional<std::string> suppression_reason(const ChannelPolicy& policy, const Disposition& disposition) {
    if (disposition.incomplete && !policy.report_incomplete_info) {
        return "Incomplete";
    }
    if (disposition.training && !policy.report_training) {
        return "Training";
    }
    if (disposition.filtered && !policy.ignore_filter) {
        return "Filtered";
    }
    return std::nullopt;
}

std::string render_report(const Report& report, std::chrono::system_clock::time_point received) {
    return fmt::format("---- {} {} ----\n{}", util::format_local(received), report.kind(), report.text);
}
