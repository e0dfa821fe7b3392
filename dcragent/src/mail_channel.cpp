
#include "mail_channel.hpp"
#include "category_table.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

namespace {

constexpr const char* kTrainingMarker = "[Training] ";

}

MailChannel::MailChannel(const MailConfig& config, MailSender& sender)
    : config_(config), sender_(sender) {}

MailContent MailChannel::compose(const Report& report, std::chrono::system_clock::time_point received) const {
    MailContent content;

    const auto* traits = find_traits(report.category);
    if (traits && !traits->mail_label.empty()) {
        content.subject = std::string(traits->mail_label);
        if (is_training(report, *traits)) {
            content.subject = kTrainingMarker + content.subject;
        }
    } else {
        content.subject = report.header;
    }

    content.body = report.text;
    if (config_.suppress_header_from_text && !report.header.empty() &&
        content.body.compare(0, report.header.size(), report.header) == 0) {
        content.body.erase(0, report.header.size());
    }

    auto reported_at = report.timestamp.value_or(received);
    content.body += fmt::format("\n\nReceived at: {}\n", util::format_local(reported_at));
    return content;
}

bool MailChannel::deliver(const Report& report, std::chrono::system_clock::time_point received) {
    auto content = compose(report, received);
    if (sender_.send(content.subject, content.body)) {
        spdlog::info("Mail: {} send success.", report.kind());
        return true;
    }
    spdlog::warn("Mail: {} send failed.", report.kind());
    return false;
}
