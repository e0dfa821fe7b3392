
#include "keyword_matcher.hpp"
#include "util.hpp"
#include <algorithm>

namespace {

bool matches_any_value(const std::string& keyword, const std::vector<std::string>& values) {
    return std::any_of(values.begin(), values.end(), [&](const std::string& value) {
        return value.find(keyword) != std::string::npos;
    });
}

std::vector<std::string> effective_keywords(const std::vector<std::string>& keywords) {
    std::vector<std::string> result;
    for (const auto& keyword : keywords) {
        auto trimmed = util::trim(keyword);
        if (!trimmed.empty()) {
            result.push_back(std::move(trimmed));
        }
    }
    return result;
}

}

std::vector<std::string> parse_keywords(const std::string& csv) {
    return effective_keywords(util::split_string(csv, ','));
}

bool partial_match(const std::vector<std::string>& keywords,
                   const std::vector<std::string>& values,
                   MatchMode mode) {
    auto effective = effective_keywords(keywords);
    if (effective.empty()) {
        return true;
    }

    if (mode == MatchMode::All) {
        return std::all_of(effective.begin(), effective.end(), [&](const std::string& keyword) {
            return matches_any_value(keyword, values);
        });
    }
    return std::any_of(effective.begin(), effective.end(), [&](const std::string& keyword) {
        return matches_any_value(keyword, values);
    });
}

std::vector<std::string> unmatched_keywords(const std::vector<std::string>& keywords,
                                            const std::vector<std::string>& values) {
    std::vector<std::string> missing;
    for (const auto& keyword : effective_keywords(keywords)) {
        if (!matches_any_value(keyword, values)) {
            missing.push_back(keyword);
        }
    }
    return missing;
}
