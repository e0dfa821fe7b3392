
#include "cache_store.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

constexpr const char* kFormatName = "dcragent-cache";

std::int64_t to_ns(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_ns(std::int64_t ns) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(ns)));
}

}

CacheStore::CacheStore(std::string path) : path_(std::move(path)) {}

nlohmann::json CacheStore::encode(const std::vector<CacheEntry>& entries) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& entry : entries) {
        items.push_back({
            {"arrival_ns", to_ns(entry.arrival)},
            {"report", entry.report.to_json()}
        });
    }
    return {
        {"format", kFormatName},
        {"version", kFormatVersion},
        {"entries", items}
    };
}

std::vector<CacheEntry> CacheStore::decode(const nlohmann::json& j) {
    try {
        if (j.at("format").get<std::string>() != kFormatName) {
            throw PersistenceError("not a dcragent cache file");
        }
        auto version = j.at("version").get<int>();
        if (version != kFormatVersion) {
            throw PersistenceError(fmt::format("unsupported cache version {}", version));
        }

        std::vector<CacheEntry> entries;
        for (const auto& item : j.at("entries")) {
            CacheEntry entry;
            entry.arrival = from_ns(item.at("arrival_ns").get<std::int64_t>());
            entry.report = Report::from_json(item.at("report"));
            entries.push_back(std::move(entry));
        }
        return entries;
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError(fmt::format("malformed cache file: {}", e.what()));
    }
}

std::vector<CacheEntry> CacheStore::load() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::info("No cache file at {}, starting with an empty cache", path_);
        return {};
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        throw PersistenceError(fmt::format("cannot open cache file {}", path_));
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw PersistenceError(fmt::format("cannot parse cache file {}: {}", path_, e.what()));
    }
    return decode(j);
}

void CacheStore::save(const std::vector<CacheEntry>& entries) const {
    const fs::path target(path_);
    const fs::path temp(path_ + ".tmp");

    try {
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path());
        }

        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open()) {
                throw PersistenceError(fmt::format("cannot open {} for writing", temp.string()));
            }
            out << encode(entries).dump();
            out.flush();
            if (!out) {
                throw PersistenceError(fmt::format("write to {} failed", temp.string()));
            }
        }

        fs::rename(temp, target);
    } catch (const PersistenceError&) {
        std::error_code ec;
        fs::remove(temp, ec);
        throw;
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(temp, ec);
        throw PersistenceError(fmt::format("cannot write cache file {}: {}", path_, e.what()));
    }
}
