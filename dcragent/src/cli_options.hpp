#pragma once

#include <optional>
#include <string>

struct CliOptions {
    std::string config_path = "/etc/dcragent/dcragent.yaml";
    std::optional<std::string> report_path;
    std::optional<std::string> log_level;
    bool no_report = false;
    bool no_load = false;
    bool no_dump = false;
    bool help = false;
};

// Throws std::invalid_argument for unknown flags or a missing value
CliOptions parse_cli(int argc, const char* const* argv);

std::string usage(const std::string& program);
