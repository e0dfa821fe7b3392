#pragma once

#include "category_filter.hpp"
#include "notification_channel.hpp"
#include <memory>
#include <string>
#include <vector>

struct ChannelOutcome {
    std::string channel;
    bool delivered = false;
    // "Use=0", "Incomplete", "Training", "Filtered", "Failed" or empty
    std::string reason;
};

// Fans a report out to every channel. Each channel decides on its own, and
// a failing channel never stops the others.
class NotificationDispatcher {
public:
    NotificationDispatcher() = default;

    void add_channel(std::unique_ptr<NotificationChannel> channel);

    std::vector<ChannelOutcome> dispatch(const Report& report,
                                         const Disposition& disposition,
                                         std::chrono::system_clock::time_point received);

    size_t channel_count() const { return channels_.size(); }

private:
    std::vector<std::unique_ptr<NotificationChannel>> channels_;
};
