
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

// Closed set of report kinds produced by the decoder
enum class Category {
    EarthquakeEarlyWarning,
    Hypocenter,
    SeismicIntensity,
    NankaiTroughEarthquake,
    Tsunami,
    NorthwestPacificTsunami,
    Volcano,
    AshFall,
    Weather,
    Flood,
    Typhoon,
    Marine,
    // Extended messages
    JAlert,
    LAlert,
    Municipality,
    Overseas,
    Null,
    Unknown
};

std::string_view category_name(Category category);

// Unrecognised names map to Category::Unknown
Category category_from_name(std::string_view name);

// A decoded disaster report. Equality is structural and is the dedup key.
struct Report {
    Category category = Category::Unknown;
    // Decoder's own name for the report kind, kept only for Unknown reports
    std::string type_name;
    std::optional<std::chrono::system_clock::time_point> timestamp;
    int classification = 0;
    bool training_indicator = false;
    // Only meaningful for multi-part reports
    std::optional<bool> completed;
    std::string header;
    std::string text;

    // Locality fields used by keyword filters
    std::vector<std::string> regions;
    std::vector<std::string> prefectures;
    std::vector<std::string> local_governments;
    std::vector<std::string> coastal_regions;

    bool operator==(const Report& other) const = default;

    std::string kind() const;

    static Report from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct CacheEntry {
    std::chrono::system_clock::time_point arrival;
    Report report;

    bool operator==(const CacheEntry& other) const = default;
};

// JMA report classification number used for drills
constexpr int kTrainingClassification = 7;
