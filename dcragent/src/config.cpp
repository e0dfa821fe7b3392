
#include "config.hpp"
#include "category_table.hpp"
#include "errors.hpp"
#include "keyword_matcher.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <fmt/core.h>
#include <stdexcept>

namespace {

template <typename T>
void read_value(const YAML::Node& node, const char* section, const char* key, T& out) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return;
    }
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("{}.{}: {}", section, key, e.what()));
    }
}

// Accepts true/false/yes/no as well as the 0/1 style of older config files
void read_bool(const YAML::Node& node, const char* section, const char* key, bool& out) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return;
    }
    try {
        out = value.as<bool>();
        return;
    } catch (const YAML::BadConversion&) {
        // not true/false/yes/no, try 0/1 below
    }
    try {
        out = value.as<int>() != 0;
    } catch (const YAML::Exception&) {
        throw ConfigError(fmt::format("{}.{}: expected a boolean, got '{}'", section, key, value.Scalar()));
    }
}

void read_keywords(const YAML::Node& node, const std::string& section, const std::string& key,
                   std::vector<std::string>& out) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return;
    }
    if (value.IsScalar()) {
        out = parse_keywords(value.Scalar());
        return;
    }
    if (value.IsSequence()) {
        out.clear();
        for (const auto& item : value) {
            if (!item.IsScalar()) {
                throw ConfigError(fmt::format("{}.{}: keyword entries must be strings", section, key));
            }
            auto keyword = util::trim(item.Scalar());
            if (!keyword.empty()) {
                out.push_back(keyword);
            }
        }
        return;
    }
    throw ConfigError(fmt::format("{}.{}: expected a string or a list", section, key));
}

void read_policy(const YAML::Node& node, const char* section, ChannelPolicy& policy) {
    read_bool(node, section, "report_incomplete_info", policy.report_incomplete_info);
    read_bool(node, section, "ignore_filter", policy.ignore_filter);
    read_bool(node, section, "report_training", policy.report_training);
}

void check_port(int port, const char* section) {
    if (port < 1 || port > 65535) {
        throw ConfigError(fmt::format("{}.port must be between 1 and 65535, got {}", section, port));
    }
}

}

Config::Config() {
    for (const auto& traits : category_table()) {
        categories[traits.category] = CategoryConfig{};
    }
}

Config Config::load(const std::string& path) {
    Config config;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
        spdlog::warn("Config file {} could not be read ({}). Using default values.", path, e.what());
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to parse config file {}: {}", path, e.what()));
    }

    config.load_from_yaml(root);
    spdlog::info("Config file is {}", path);
    return config;
}

void Config::load_from_yaml(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ConfigError("Config root must be a mapping");
    }

    if (const auto general = root["general"]) {
        read_value(general, "general", "log_level", log_level);
        read_bool(general, "general", "ignore_filter_when_training", ignore_filter_when_training);
        read_value(general, "general", "vocabulary_path", vocabulary_path);
    }

    if (const auto cache = root["cache"]) {
        read_value(cache, "cache", "valid_period_hour", cache_valid_period_hours);
        read_value(cache, "cache", "valid_period_hours", cache_valid_period_hours);
        read_value(cache, "cache", "path", cache_path);
    }

    if (const auto source = root["source"]) {
        read_value(source, "source", "command", source_command);
        read_value(source, "source", "type", source_type);
        read_value(source, "source", "restart_delay_seconds", restart_delay_seconds);
    }

    if (const auto cats = root["categories"]) {
        if (!cats.IsMap()) {
            throw ConfigError("categories must be a mapping");
        }
        for (const auto& item : cats) {
            const auto name = item.first.Scalar();
            const auto* traits = find_traits(category_from_name(name));
            if (!traits) {
                spdlog::warn("conf: unknown category '{}' ignored", name);
                continue;
            }
            auto& cat = categories[traits->category];
            const std::string section = "categories." + name;
            read_bool(item.second, section.c_str(), "use", cat.use);
            if (!traits->keyword_key.empty()) {
                read_keywords(item.second, section, std::string(traits->keyword_key), cat.keywords);
            }
        }
    }

    if (const auto file_node = root["file"]) {
        read_bool(file_node, "file", "use", file.use);
        read_value(file_node, "file", "path", file.path);
        read_value(file_node, "file", "rotation_hour", file.rotation_hour);
        read_value(file_node, "file", "rotation_minute", file.rotation_minute);
        read_value(file_node, "file", "max_files", file.max_files);
        read_policy(file_node, "file", file.policy);
    }

    if (const auto mail_node = root["mail"]) {
        read_bool(mail_node, "mail", "use", mail.use);
        read_value(mail_node, "mail", "host", mail.host);
        read_value(mail_node, "mail", "port", mail.port);
        read_value(mail_node, "mail", "id", mail.id);
        read_value(mail_node, "mail", "password", mail.password);
        read_value(mail_node, "mail", "address", mail.address);
        read_bool(mail_node, "mail", "tls", mail.tls);
        read_bool(mail_node, "mail", "ssl", mail.ssl);
        read_value(mail_node, "mail", "timeout_seconds", mail.timeout_seconds);
        read_bool(mail_node, "mail", "suppress_header_from_text", mail.suppress_header_from_text);
        read_policy(mail_node, "mail", mail.policy);
    }

    if (const auto console_node = root["console"]) {
        read_bool(console_node, "console", "use", console.use);
        read_policy(console_node, "console", console.policy);
    }

    if (const auto health_node = root["health"]) {
        read_bool(health_node, "health", "use", health.use);
        read_value(health_node, "health", "host", health.host);
        read_value(health_node, "health", "port", health.port);
    }
}

void Config::load_from_env() {
    log_level = util::get_env("DCRAGENT_LOG_LEVEL", log_level);
    source_command = util::get_env("DCRAGENT_SOURCE_COMMAND", source_command);
    cache_path = util::get_env("DCRAGENT_CACHE_PATH", cache_path);
    cache_valid_period_hours = util::get_env_int("DCRAGENT_CACHE_VALID_PERIOD_HOURS", cache_valid_period_hours);
    mail.password = util::read_secret("DCRAGENT_MAIL_PASSWORD_FILE", "DCRAGENT_MAIL_PASSWORD", mail.password);
}

void Config::validate() const {
    if (cache_valid_period_hours <= 0) {
        throw ConfigError("cache.valid_period_hours must be positive");
    }

    if (restart_delay_seconds < 0) {
        throw ConfigError("source.restart_delay_seconds must not be negative");
    }

    std::vector<std::string> argv;
    try {
        argv = util::split_command_line(source_command);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(fmt::format("source.command: {}", e.what()));
    }
    if (argv.empty()) {
        throw ConfigError("source.command is required");
    }

    if (file.use) {
        if (file.path.empty()) {
            throw ConfigError("file.path is required when the file channel is used");
        }
        if (file.rotation_hour < 0 || file.rotation_hour > 23 ||
            file.rotation_minute < 0 || file.rotation_minute > 59) {
            throw ConfigError("file.rotation_hour/rotation_minute out of range");
        }
        // spdlog keeps the file count in a uint16_t
        if (file.max_files < 0 || file.max_files > 65535) {
            throw ConfigError(fmt::format("file.max_files must be between 0 and 65535, got {}", file.max_files));
        }
    }

    if (mail.use) {
        if (mail.host.empty()) {
            throw ConfigError("mail.host is required when mail is used");
        }
        if (mail.address.empty()) {
            throw ConfigError("mail.address is required when mail is used");
        }
        check_port(mail.port, "mail");
        if (mail.timeout_seconds <= 0) {
            throw ConfigError("mail.timeout_seconds must be positive");
        }
    }

    if (health.use) {
        check_port(health.port, "health");
    }

    spdlog::debug("Configuration validated successfully");
}

const CategoryConfig& Config::category(Category category) const {
    auto it = categories.find(category);
    if (it == categories.end()) {
        throw std::out_of_range(fmt::format("no configuration for category {}", category_name(category)));
    }
    return it->second;
}
