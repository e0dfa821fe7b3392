
#include "config_validator.hpp"
#include "category_table.hpp"
#include "keyword_matcher.hpp"
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

std::vector<KeywordValidationFailure> validate_keywords(const Config& config, const Vocabulary& vocabulary) {
    std::vector<KeywordValidationFailure> failures;

    for (const auto& traits : category_table()) {
        if (traits.keyword_key.empty()) {
            continue;
        }
        const auto& keywords = config.category(traits.category).keywords;
        const std::string field(traits.vocabulary);
        const auto* legal = vocabulary.find(field);

        if (legal && partial_match(keywords, *legal, MatchMode::All)) {
            continue;
        }
        // No vocabulary only fails when there is something to check
        if (!legal && partial_match(keywords, {}, MatchMode::All)) {
            continue;
        }

        KeywordValidationFailure failure;
        failure.category = traits.category;
        failure.keyword_key = std::string(traits.keyword_key);
        failure.vocabulary_field = field;
        if (legal) {
            failure.unmatched = unmatched_keywords(keywords, *legal);
            failure.legal_values = *legal;
        } else {
            failure.unmatched = keywords;
        }
        failures.push_back(std::move(failure));
    }

    return failures;
}

void log_validation_failures(const std::vector<KeywordValidationFailure>& failures) {
    for (const auto& failure : failures) {
        spdlog::error("conf: {}.{} have no valid keyword: {}",
                      category_name(failure.category), failure.keyword_key,
                      fmt::join(failure.unmatched, ", "));
        if (failure.legal_values.empty()) {
            spdlog::error(" No vocabulary loaded for {}", failure.vocabulary_field);
        } else {
            spdlog::error(" Valid {}: {}", failure.vocabulary_field, fmt::join(failure.legal_values, ", "));
        }
    }
}
