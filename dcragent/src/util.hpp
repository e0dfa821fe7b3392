#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace util {

void setup_logging(const std::string& level);

// Environment helpers
std::string get_env(const char* name, const std::string& default_val = "");
int get_env_int(const char* name, int default_val);

// Reads the first line of the file named by env_var, falling back to the
// value of fallback_env. Returns default_val when neither is set.
std::string read_secret(const char* env_var, const char* fallback_env, const std::string& default_val);

// Local time as "YYYY/MM/DD HH:MM:SS"
std::string format_local(const std::chrono::system_clock::time_point& tp);

// UTC ISO8601 with milliseconds
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::string current_iso8601();

std::string trim(const std::string& s);
std::vector<std::string> split_string(const std::string& s, char delimiter);

// Splits a command line into argv words. Single and double quotes group
// words; a backslash escapes the next character outside single quotes.
std::vector<std::string> split_command_line(const std::string& command);

}
