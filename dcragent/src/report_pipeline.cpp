
#include "report_pipeline.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

ReportPipeline::ReportPipeline(AgentContext& context, NotificationDispatcher& dispatcher)
    : context_(context), filter_(context.config), dispatcher_(dispatcher) {}

PipelineResult ReportPipeline::process(const Report& report, std::chrono::system_clock::time_point now) {
    PipelineResult result;
    auto& status = context_.status;
    auto& cache = context_.cache;
    status.received++;

    if (report.category == Category::Null) {
        spdlog::debug("DCReport: Null message ignored");
        result.outcome = PipelineOutcome::Noise;
    } else if (!cache.lookup_or_insert(report, now)) {
        spdlog::debug("DCReport: {} already received", report.kind());
        status.duplicates++;
        result.outcome = PipelineOutcome::Duplicate;
    } else {
        auto verdict = filter_.evaluate(report);
        if (verdict.action == FilterAction::DropUnknown) {
            spdlog::warn("Unknown DCReport instance: {}", report.kind());
            result.outcome = PipelineOutcome::Unknown;
        } else if (verdict.action == FilterAction::DropNoise) {
            result.outcome = PipelineOutcome::Noise;
        } else {
            result.disposition = verdict.disposition;
            if (verdict.disposition.filtered) {
                spdlog::info("DCReport: {} filtered. ({})", report.kind(), verdict.reason);
                status.filtered++;
            }
            result.channels = dispatcher_.dispatch(report, verdict.disposition, now);
            bool any_delivered = std::any_of(result.channels.begin(), result.channels.end(),
                                             [](const ChannelOutcome& c) { return c.delivered; });
            if (any_delivered) {
                status.delivered++;
            }
        }
    }

    auto evicted = cache.evict_expired(now);
    if (evicted > 0) {
        spdlog::debug("Evicted {} expired cache entries", evicted);
    }
    status.cache_entries = cache.size();
    return result;
}
