
#include "notification_dispatcher.hpp"
#include <spdlog/spdlog.h>

void NotificationDispatcher::add_channel(std::unique_ptr<NotificationChannel> channel) {
    channels_.push_back(std::move(channel));
}

std::vector<ChannelOutcome> NotificationDispatcher::dispatch(const Report& report,
                                                             const Disposition& disposition,
                                                             std::chrono::system_clock::time_point received) {
    std::vector<ChannelOutcome> outcomes;
    outcomes.reserve(channels_.size());

    for (auto& channel : channels_) {
        ChannelOutcome outcome;
        outcome.channel = channel->name();

        if (!channel->enabled()) {
            outcome.reason = "Use=0";
            spdlog::debug("{}: {} skipped. (Use=0)", outcome.channel, report.kind());
            outcomes.push_back(std::move(outcome));
            continue;
        }

        if (auto reason = suppression_reason(channel->policy(), disposition)) {
            outcome.reason = *reason;
            spdlog::info("{}: {} skipped. ({})", outcome.channel, report.kind(), outcome.reason);
            outcomes.push_back(std::move(outcome));
            continue;
        }

        try {
            outcome.delivered = channel->deliver(report, received);
            if (!outcome.delivered) {
                outcome.reason = "Failed";
            }
        } catch (const std::exception& e) {
            spdlog::error("{}: delivery of {} failed: {}", outcome.channel, report.kind(), e.what());
            outcome.reason = "Failed";
        }
        outcomes.push_back(std::move(outcome));
    }

    return outcomes;
}
