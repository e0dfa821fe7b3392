
#pragma once

#include "types.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

struct CategoryConfig {
    bool use = true;
    // Locality keywords, empty means no filter
    std::vector<std::string> keywords;
};

// Per-channel suppression options layered over the report disposition
struct ChannelPolicy {
    bool report_incomplete_info = false;
    bool ignore_filter = false;
    bool report_training = true;
};

struct FileSinkConfig {
    bool use = true;
    std::string path = "/var/log/dcragent.log";
    int rotation_hour = 0;
    int rotation_minute = 0;
    int max_files = 35;
    ChannelPolicy policy{false, true, true};
};

struct MailConfig {
    bool use = false;
    std::string host;
    int port = 0;
    std::string id;
    std::string password;
    std::string address;
    bool tls = false;
    bool ssl = false;
    int timeout_seconds = 30;
    bool suppress_header_from_text = true;
    ChannelPolicy policy;
};

struct ConsoleConfig {
    bool use = false;
    ChannelPolicy policy;
};

struct HealthConfig {
    bool use = false;
    std::string host = "127.0.0.1";
    int port = 8085;
};

// Operator settings. Built once at startup and only read afterwards.
struct Config {
    // General
    std::string service_name = "dcragent";
    std::string log_level = "info";
    bool ignore_filter_when_training = false;
    std::string vocabulary_path = "/usr/share/dcragent/vocabulary.yaml";

    // Dedup cache
    int cache_valid_period_hours = 24;
    std::string cache_path = "/var/lib/dcragent/cache.json";

    // Producer subprocess
    std::string source_command = "stdbuf -oL gpsmon -a";
    std::string source_type = "ndjson";
    int restart_delay_seconds = 5;

    std::map<Category, CategoryConfig> categories;

    // Channels
    FileSinkConfig file;
    MailConfig mail;
    ConsoleConfig console;
    HealthConfig health;

    Config();

    // Missing file means defaults; a malformed file throws ConfigError
    static Config load(const std::string& path);

    void load_from_yaml(const YAML::Node& root);
    void load_from_env();
    void validate() const;

    const CategoryConfig& category(Category category) const;
    std::chrono::hours cache_valid_period() const { return std::chrono::hours(cache_valid_period_hours); }
};
