#pragma once

#include "agent_context.hpp"
#include "category_filter.hpp"
#include "notification_dispatcher.hpp"
#include <chrono>
#include <vector>

enum class PipelineOutcome {
    Dispatched,
    Duplicate,
    Noise,
    Unknown
};

struct PipelineResult {
    PipelineOutcome outcome = PipelineOutcome::Dispatched;
    Disposition disposition;
    std::vector<ChannelOutcome> channels;
};

// dedup -> filter -> dispatch for one decoded report
class ReportPipeline {
public:
    ReportPipeline(AgentContext& context, NotificationDispatcher& dispatcher);

    PipelineResult process(const Report& report, std::chrono::system_clock::time_point now);

private:
    AgentContext& context_;
    CategoryFilter filter_;
    NotificationDispatcher& dispatcher_;
};
