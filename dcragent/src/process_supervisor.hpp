#pragma once

#include "agent_context.hpp"
#include "decoder.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

// A spawned producer with its stdout connected to a pipe. The destructor
// terminates and reaps a child that is still running.
class ChildProcess {
    struct PrivateTag {};

public:
    // Throws SpawnError when the pipe, fork or exec fails
    static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& argv);

    ChildProcess(PrivateTag, pid_t pid, int stdout_fd) : pid_(pid), stdout_fd_(stdout_fd) {}
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }

    // SIGTERM, then SIGKILL once the grace period has passed. Returns the
    // wait status.
    int terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    // Blocks until the child exits, returns the wait status
    int wait();

    // Non-blocking; true once the child has exited and status is filled in
    bool try_reap(int& status);

private:

    pid_t pid_;
    int stdout_fd_;
    bool reaped_ = false;
    int status_ = 0;
};

// Reads the child pipe, waking up on shutdown. Throws ShutdownRequested
// once a termination signal has been delivered.
class PipeStream : public ByteStream {
public:
    PipeStream(int fd, const ShutdownSignal& shutdown) : fd_(fd), shutdown_(shutdown) {}

    size_t read(char* buffer, size_t length) override;

private:
    int fd_;
    const ShutdownSignal& shutdown_;
};

// "exit status 3", "signal 15"
std::string describe_wait_status(int status);

struct SupervisorStats {
    uint64_t sessions = 0;
    uint64_t restarts = 0;
    uint64_t decode_errors = 0;
    uint64_t unexpected_exits = 0;
    uint64_t spawn_failures = 0;
};

// Keeps the producer running: spawn, decode until the stream ends or
// breaks, wait restart_delay, respawn. run() returns only on shutdown.
class ProcessSupervisor {
public:
    ProcessSupervisor(AgentContext& context, Decoder& decoder, ReportCallback on_report);

    // Throws SpawnError when the very first spawn fails and
    // std::system_error when the pipe can no longer be read.
    void run();

    const SupervisorStats& stats() const { return stats_; }

private:
    AgentContext& context_;
    Decoder& decoder_;
    ReportCallback on_report_;
    std::vector<std::string> argv_;
    std::chrono::milliseconds restart_delay_;
    SupervisorStats stats_;
};
