
#include "category_filter.hpp"
#include "category_table.hpp"
#include "keyword_matcher.hpp"

CategoryFilter::CategoryFilter(const Config& config) : config_(config) {}

FilterResult CategoryFilter::evaluate(const Report& report) const {
    FilterResult result;

    if (report.category == Category::Null) {
        result.action = FilterAction::DropNoise;
        return result;
    }

    const auto* traits = find_traits(report.category);
    if (!traits) {
        result.action = FilterAction::DropUnknown;
        return result;
    }

    auto& disposition = result.disposition;
    const auto& settings = config_.category(report.category);

    if (!settings.use) {
        disposition.filtered = true;
        result.reason = "Use=0";
    } else if (traits->locality && !partial_match(settings.keywords, report.*(traits->locality))) {
        disposition.filtered = true;
        result.reason = std::string(traits->keyword_key) + " not matched";
    }

    disposition.training = is_training(report, *traits);

    if (traits->multi_part && report.completed.has_value() && !*report.completed) {
        disposition.incomplete = true;
    }

    if (disposition.training && disposition.filtered && config_.ignore_filter_when_training) {
        disposition.filtered = false;
        result.reason.clear();
    }

    return result;
}
