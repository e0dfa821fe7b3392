#pragma once

#include "config.hpp"
#include "vocabulary.hpp"
#include <string>
#include <vector>

struct KeywordValidationFailure {
    Category category;
    std::string keyword_key;
    std::string vocabulary_field;
    std::vector<std::string> unmatched;
    // Legal values, empty when the vocabulary has no such field
    std::vector<std::string> legal_values;
};

// Checks every configured keyword list against its vocabulary field.
// Every keyword must match some legal value.
std::vector<KeywordValidationFailure> validate_keywords(const Config& config, const Vocabulary& vocabulary);

// Logs each failure with the list of legal values
void log_validation_failures(const std::vector<KeywordValidationFailure>& failures);
