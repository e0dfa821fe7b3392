#pragma once

#include <atomic>
#include <chrono>

// Termination request shared by every blocking point of the agent. The
// read end of a self-pipe becomes readable once request() has been called,
// so poll() based waits wake up immediately.
class ShutdownSignal {
public:
    ShutdownSignal();
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    // Async-signal-safe
    void request() noexcept;
    bool requested() const noexcept { return requested_.load(); }

    int fd() const noexcept { return pipe_[0]; }

    // Returns true when shutdown was requested before the timeout elapsed
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> requested_{false};
    int pipe_[2] = {-1, -1};
};

// Routes SIGINT and SIGTERM to signal.request()
void install_signal_handlers(ShutdownSignal& signal);

// Last signal number delivered to the handlers, 0 if none
int last_signal();
