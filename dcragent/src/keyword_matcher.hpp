#pragma once

#include <string>
#include <vector>

enum class MatchMode {
    // Runtime relevance: at least one keyword is a substring of some value
    Any,
    // Config validation: every keyword is a substring of some value
    All
};

// Splits a comma-separated keyword list. Keywords are trimmed, blanks dropped.
std::vector<std::string> parse_keywords(const std::string& csv);

// Substring match of configured keywords against candidate values.
// A list with no non-blank keyword means "no filter" and always matches.
bool partial_match(const std::vector<std::string>& keywords,
                   const std::vector<std::string>& values,
                   MatchMode mode = MatchMode::Any);

// Keywords that match nothing in values
std::vector<std::string> unmatched_keywords(const std::vector<std::string>& keywords,
                                            const std::vector<std::string>& values);
