#pragma once

#include <map>
#include <string>
#include <vector>

// Closed sets of legal locality names, keyed by field
// (e.g. "prefectures", "tsunami_forecast_regions").
class Vocabulary {
public:
    Vocabulary() = default;

    // Missing file yields an empty vocabulary; a malformed one throws ConfigError
    static Vocabulary load(const std::string& path);

    void set(const std::string& field, std::vector<std::string> values);

    // nullptr when the field is unknown
    const std::vector<std::string>* find(const std::string& field) const;

    size_t size() const { return fields_.size(); }

private:
    std::map<std::string, std::vector<std::string>> fields_;
};
