
#include "types.hpp"
#include <array>
#include <cstdint>
#include <utility>

namespace {

constexpr std::array<std::pair<Category, std::string_view>, 18> kCategoryNames{{
    {Category::EarthquakeEarlyWarning, "EarthquakeEarlyWarning"},
    {Category::Hypocenter, "Hypocenter"},
    {Category::SeismicIntensity, "SeismicIntensity"},
    {Category::NankaiTroughEarthquake, "NankaiTroughEarthquake"},
    {Category::Tsunami, "Tsunami"},
    {Category::NorthwestPacificTsunami, "NorthwestPacificTsunami"},
    {Category::Volcano, "Volcano"},
    {Category::AshFall, "AshFall"},
    {Category::Weather, "Weather"},
    {Category::Flood, "Flood"},
    {Category::Typhoon, "Typhoon"},
    {Category::Marine, "Marine"},
    {Category::JAlert, "JAlert"},
    {Category::LAlert, "LAlert"},
    {Category::Municipality, "Municipality"},
    {Category::Overseas, "Overseas"},
    {Category::Null, "Null"},
    {Category::Unknown, "Unknown"},
}};

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return {};
    }
    return j.at(key).get<std::vector<std::string>>();
}

}

std::string_view category_name(Category category) {
    for (const auto& [cat, name] : kCategoryNames) {
        if (cat == category) {
            return name;
        }
    }
    return "Unknown";
}

Category category_from_name(std::string_view name) {
    for (const auto& [cat, cat_name] : kCategoryNames) {
        if (cat_name == name) {
            return cat;
        }
    }
    return Category::Unknown;
}

std::string Report::kind() const {
    if (category == Category::Unknown && !type_name.empty()) {
        return type_name;
    }
    return std::string(category_name(category));
}

Report Report::from_json(const nlohmann::json& j) {
    Report report;
    auto name = j.at("category").get<std::string>();
    report.category = category_from_name(name);
    if (report.category == Category::Unknown && name != "Unknown") {
        report.type_name = name;
    }

    if (j.contains("timestamp_ns") && !j.at("timestamp_ns").is_null()) {
        auto ns = std::chrono::nanoseconds(j.at("timestamp_ns").get<std::int64_t>());
        report.timestamp = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(ns));
    }
    report.classification = j.value("classification", 0);
    report.training_indicator = j.value("training", false);
    if (j.contains("completed") && !j.at("completed").is_null()) {
        report.completed = j.at("completed").get<bool>();
    }
    report.header = j.value("header", "");
    report.text = j.value("text", "");

    report.regions = string_list(j, "regions");
    report.prefectures = string_list(j, "prefectures");
    report.local_governments = string_list(j, "local_governments");
    report.coastal_regions = string_list(j, "coastal_regions");
    return report;
}

nlohmann::json Report::to_json() const {
    nlohmann::json j = {
        {"category", kind()},
        {"timestamp_ns", nullptr},
        {"classification", classification},
        {"training", training_indicator},
        {"completed", nullptr},
        {"header", header},
        {"text", text},
        {"regions", regions},
        {"prefectures", prefectures},
        {"local_governments", local_governments},
        {"coastal_regions", coastal_regions}
    };
    if (timestamp) {
        j["timestamp_ns"] = std::chrono::duration_cast<std::chrono::nanoseconds>(
            timestamp->time_since_epoch()).count();
    }
    if (completed) {
        j["completed"] = *completed;
    }
    return j;
}
