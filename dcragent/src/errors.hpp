#pragma once

#include <stdexcept>
#include <string>

// Process exit statuses
enum class ExitCode : int {
    kSignalShutdown = 1,
    kConfigInvalid = 2,
    kPipelineFailure = 3,
    kSpawnFailure = 4,
    kUsage = 64
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Raised by a Decoder when the producer stream is malformed or breaks.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

class SpawnError : public std::runtime_error {
public:
    SpawnError(const std::string& what, int err) : std::runtime_error(what), errno_(err) {}

    int error_number() const { return errno_; }

private:
    int errno_;
};

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

// Thrown out of a blocked read when a termination signal arrives.
// Must stay outside the std::exception hierarchy.
struct ShutdownRequested {};
