#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Versioned on-disk form of the dedup cache
class CacheStore {
public:
    static constexpr int kFormatVersion = 1;

    explicit CacheStore(std::string path);

    // Empty when the file does not exist. Throws PersistenceError on a
    // corrupt file or an unsupported version.
    std::vector<CacheEntry> load() const;

    // Writes through a temporary file and renames it into place. The
    // temporary file is removed on failure and PersistenceError is thrown.
    void save(const std::vector<CacheEntry>& entries) const;

    static nlohmann::json encode(const std::vector<CacheEntry>& entries);
    static std::vector<CacheEntry> decode(const nlohmann::json& j);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
