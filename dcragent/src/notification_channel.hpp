#pragma once

#include "category_filter.hpp"
#include "config.hpp"
#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>

// An independently configured notification sink
class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;

    virtual std::string name() const = 0;
    virtual bool enabled() const = 0;
    virtual const ChannelPolicy& policy() const = 0;

    // Returns false when the sink could not take the report
    virtual bool deliver(const Report& report, std::chrono::system_clock::time_point received) = 0;
};

// Reason this policy withholds a report with the given disposition,
// nullopt when it delivers
std::optional<std::string> suppression_reason(const ChannelPolicy& policy, const Disposition& disposition);

// Timestamped separator line followed by the report text
std::string render_report(const Report& report, std::chrono::system_clock::time_point received);
