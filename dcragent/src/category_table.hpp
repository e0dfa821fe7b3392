#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>

// How a category marks a drill
enum class TrainingSource {
    Classification,  // JMA report classification number
    Indicator        // explicit flag of the extended messages
};

using LocalityField = std::vector<std::string> Report::*;

// One row per deliverable category. Null and Unknown have no row.
struct CategoryTraits {
    Category category;
    // Locality list on the report, nullptr when the category has no keyword filter
    LocalityField locality;
    // Config key for the keyword list: "regions", "prefectures" or "local_governments"
    std::string_view keyword_key;
    // Vocabulary field the keywords are validated against
    std::string_view vocabulary;
    TrainingSource training;
    // Report may arrive as a partial transmission
    bool multi_part;
    // Extended-message family: mail subject is a fixed label, not the header
    std::string_view mail_label;
};

const std::vector<CategoryTraits>& category_table();

// nullptr for Null, Unknown
const CategoryTraits* find_traits(Category category);

bool is_training(const Report& report, const CategoryTraits& traits);
