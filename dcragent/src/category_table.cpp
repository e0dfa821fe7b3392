
#include "category_table.hpp"

const std::vector<CategoryTraits>& category_table() {
    using TS = TrainingSource;
    static const std::vector<CategoryTraits> table = {
        {Category::EarthquakeEarlyWarning, &Report::regions, "regions", "eew_forecast_regions", TS::Classification, false, ""},
        {Category::Hypocenter, nullptr, "", "", TS::Classification, false, ""},
        {Category::SeismicIntensity, &Report::prefectures, "prefectures", "prefectures", TS::Classification, false, ""},
        {Category::NankaiTroughEarthquake, nullptr, "", "", TS::Classification, true, ""},
        {Category::Tsunami, &Report::regions, "regions", "tsunami_forecast_regions", TS::Classification, false, ""},
        {Category::NorthwestPacificTsunami, &Report::coastal_regions, "regions", "coastal_regions", TS::Classification, false, ""},
        {Category::Volcano, &Report::local_governments, "local_governments", "local_governments", TS::Classification, false, ""},
        {Category::AshFall, &Report::local_governments, "local_governments", "local_governments", TS::Classification, false, ""},
        {Category::Weather, &Report::regions, "regions", "weather_forecast_regions", TS::Classification, false, ""},
        {Category::Flood, &Report::regions, "regions", "flood_forecast_regions", TS::Classification, false, ""},
        {Category::Typhoon, nullptr, "", "", TS::Classification, false, ""},
        {Category::Marine, &Report::regions, "regions", "marine_forecast_regions", TS::Classification, false, ""},
        {Category::JAlert, nullptr, "", "", TS::Indicator, false, "J-ALERT"},
        {Category::LAlert, nullptr, "", "", TS::Indicator, false, "L-ALERT"},
        {Category::Municipality, nullptr, "", "", TS::Indicator, false, "Municipal Disaster Information"},
        {Category::Overseas, nullptr, "", "", TS::Indicator, false, "Overseas Disaster Information"},
    };
    return table;
}

const CategoryTraits* find_traits(Category category) {
    for (const auto& traits : category_table()) {
        if (traits.category == category) {
            return &traits;
        }
    }
    return nullptr;
}

bool is_training(const Report& report, const CategoryTraits& traits) {
    switch (traits.training) {
        case TrainingSource::Classification:
            return report.classification == kTrainingClassification;
        case TrainingSource::Indicator:
            return report.training_indicator;
    }
    return false;
}
