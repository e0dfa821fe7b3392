
#include "shutdown.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <system_error>
#include <unistd.h>

namespace {

ShutdownSignal* g_signal_target = nullptr;
volatile std::sig_atomic_t g_last_signal = 0;

void signal_handler(int signum) {
    g_last_signal = signum;
    if (g_signal_target) {
        g_signal_target->request();
    }
}

}

ShutdownSignal::ShutdownSignal() {
    if (pipe2(pipe_, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
}

ShutdownSignal::~ShutdownSignal() {
    if (g_signal_target == this) {
        g_signal_target = nullptr;
    }
    close(pipe_[0]);
    close(pipe_[1]);
}

void ShutdownSignal::request() noexcept {
    if (requested_.exchange(true)) {
        return;
    }
    const char byte = 1;
    ssize_t written;
    do {
        written = write(pipe_[1], &byte, 1);
    } while (written < 0 && errno == EINTR);
}

bool ShutdownSignal::wait_for(std::chrono::milliseconds timeout) const {
    if (requested()) {
        return true;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!requested()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }

        pollfd pfd{pipe_[0], POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "poll");
        }
    }
    return true;
}

void install_signal_handlers(ShutdownSignal& signal) {
    g_signal_target = &signal;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A vanished producer must surface as EOF/EPIPE, not kill the agent
    std::signal(SIGPIPE, SIG_IGN);
}

int last_signal() {
    return g_last_signal;
}
