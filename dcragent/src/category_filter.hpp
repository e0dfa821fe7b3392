#pragma once

#include "config.hpp"
#include "types.hpp"
#include <string>

// Outcome consumed identically by every channel. Each channel applies its
// own policy over the three flags.
struct Disposition {
    bool filtered = false;
    bool training = false;
    bool incomplete = false;
};

enum class FilterAction {
    Dispatch,
    DropNoise,   // Null reports
    DropUnknown  // categories this agent does not know
};

struct FilterResult {
    FilterAction action = FilterAction::Dispatch;
    Disposition disposition;
    // Why the report was filtered, empty otherwise
    std::string reason;
};

class CategoryFilter {
public:
    explicit CategoryFilter(const Config& config);

    FilterResult evaluate(const Report& report) const;

private:
    const Config& config_;
};
