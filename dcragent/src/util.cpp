
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace util {

void setup_logging(const std::string& level) {
    // stdout belongs to the console channel, operator log goes to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("dcragent", console_sink);
    spdlog::set_default_logger(logger);

    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::info);
}

std::string get_env(const char* name, const std::string& default_val) {
    const char* value = std::getenv(name);
    return value ? value : default_val;
}

int get_env_int(const char* name, int default_val) {
    const char* value = std::getenv(name);
    if (value) {
        int int_val;
        auto result = std::from_chars(value, value + std::strlen(value), int_val);
        if (result.ec == std::errc()) {
            return int_val;
        }
    }
    return default_val;
}

std::string read_secret(const char* env_var, const char* fallback_env, const std::string& default_val) {
    const char* file_path = std::getenv(env_var);
    if (file_path) {
        std::ifstream file(file_path);
        if (file.is_open()) {
            std::string content;
            std::getline(file, content);
            return content;
        }
        spdlog::warn("Secret file {} from {} could not be read", file_path, env_var);
    }

    const char* value = std::getenv(fallback_env);
    if (value) {
        return std::string(value);
    }
    return default_val;
}

std::string format_local(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y/%m/%d %H:%M:%S");
    return ss.str();
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::string current_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split_string(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream stream(s);
    while (std::getline(stream, token, delimiter)) {
        tokens.push_back(token);
    }
    if (!s.empty() && s.back() == delimiter) {
        tokens.emplace_back();
    }
    return tokens;
}

std::vector<std::string> split_command_line(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        if (quote == '\'') {
            if (c == '\'') {
                quote = 0;
            } else {
                current += c;
            }
        } else if (c == '\\') {
            if (i + 1 >= command.size()) {
                throw std::invalid_argument("trailing backslash in command: " + command);
            }
            current += command[++i];
            in_word = true;
        } else if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else {
                current += c;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == ' ' || c == '\t') {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current += c;
            in_word = true;
        }
    }

    if (quote != 0) {
        throw std::invalid_argument("unterminated quote in command: " + command);
    }
    if (in_word) {
        words.push_back(current);
    }
    return words;
}

}
