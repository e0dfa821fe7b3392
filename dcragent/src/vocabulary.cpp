
#include "vocabulary.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <fmt/core.h>

Vocabulary Vocabulary::load(const std::string& path) {
    Vocabulary vocabulary;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
        spdlog::warn("Vocabulary file {} could not be read ({})", path, e.what());
        return vocabulary;
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to parse vocabulary file {}: {}", path, e.what()));
    }

    if (!root.IsMap()) {
        throw ConfigError(fmt::format("Vocabulary file {} must map field names to lists", path));
    }

    for (const auto& item : root) {
        const auto field = item.first.Scalar();
        try {
            vocabulary.set(field, item.second.as<std::vector<std::string>>());
        } catch (const YAML::Exception& e) {
            throw ConfigError(fmt::format("Vocabulary field {} in {}: {}", field, path, e.what()));
        }
    }

    spdlog::info("Loaded {} vocabulary fields from {}", vocabulary.size(), path);
    return vocabulary;
}

void Vocabulary::set(const std::string& field, std::vector<std::string> values) {
    fields_[field] = std::move(values);
}

const std::vector<std::string>* Vocabulary::find(const std::string& field) const {
    auto it = fields_.find(field);
    if (it == fields_.end()) {
        return nullptr;
    }
    return &it->second;
}
