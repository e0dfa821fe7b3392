
#include "process_supervisor.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(100);

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw SpawnError("empty producer command", EINVAL);
    }

    // Built before fork; the child may only make async-signal-safe calls
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    int out[2];
    if (pipe2(out, O_CLOEXEC) != 0) {
        throw SpawnError("pipe2 failed: " + std::string(strerror(errno)), errno);
    }
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        close(out[0]);
        close(out[1]);
        throw SpawnError("pipe2 failed: " + std::string(strerror(e)), e);
    }

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        close(out[0]);
        close(out[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw SpawnError("fork failed: " + std::string(strerror(e)), e);
    }

    if (pid == 0) {
        dup2(out[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
        }
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        execvp(cargv[0], cargv.data());

        int e = errno;
        ssize_t ignored = write(err_pipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    close(out[1]);
    close(err_pipe[1]);

    // exec closes the error pipe on success, so EOF here means the exec worked
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        close(out[0]);
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw SpawnError("cannot execute '" + argv[0] + "': " + strerror(child_errno), child_errno);
    }

    return std::make_unique<ChildProcess>(PrivateTag{}, pid, out[0]);
}

ChildProcess::~ChildProcess() {
    close_fd(stdout_fd_);
    if (!reaped_) {
        terminate();
    }
}

bool ChildProcess::try_reap(int& status) {
    if (reaped_) {
        status = status_;
        return true;
    }
    pid_t rc = waitpid(pid_, &status_, WNOHANG);
    if (rc == pid_) {
        reaped_ = true;
        status = status_;
        return true;
    }
    if (rc < 0 && errno == ECHILD) {
        reaped_ = true;
        status = status_;
        return true;
    }
    return false;
}

int ChildProcess::terminate(std::chrono::milliseconds grace) {
    int status = 0;
    if (try_reap(status)) {
        return status;
    }

    kill(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_reap(status)) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    spdlog::warn("Producer (pid {}) ignored SIGTERM, sending SIGKILL", pid_);
    kill(pid_, SIGKILL);
    return wait();
}

int ChildProcess::wait() {
    if (reaped_) {
        return status_;
    }
    pid_t rc;
    do {
        rc = waitpid(pid_, &status_, 0);
    } while (rc < 0 && errno == EINTR);
    reaped_ = true;
    return status_;
}

size_t PipeStream::read(char* buffer, size_t length) {
    pollfd fds[2] = {
        {fd_, POLLIN, 0},
        {shutdown_.fd(), POLLIN, 0}
    };

    for (;;) {
        if (shutdown_.requested()) {
            throw ShutdownRequested{};
        }

        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "poll on producer pipe");
        }

        if (shutdown_.requested()) {
            throw ShutdownRequested{};
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = ::read(fd_, buffer, length);
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "read from producer pipe");
            }
            return static_cast<size_t>(n);
        }
    }
}

std::string describe_wait_status(int status) {
    if (WIFEXITED(status)) {
        return "exit status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

ProcessSupervisor::ProcessSupervisor(AgentContext& context, Decoder& decoder, ReportCallback on_report)
    : context_(context),
      decoder_(decoder),
      on_report_(std::move(on_report)),
      argv_(util::split_command_line(context.config.source_command)),
      restart_delay_(std::chrono::seconds(context.config.restart_delay_seconds)) {}

void ProcessSupervisor::run() {
    auto& status = context_.status;
    auto& shutdown = context_.shutdown;
    bool first_spawn = true;

    while (!shutdown.requested()) {
        std::unique_ptr<ChildProcess> child;
        try {
            child = ChildProcess::spawn(argv_);
        } catch (const SpawnError& e) {
            if (first_spawn) {
                throw;
            }
            stats_.spawn_failures++;
            spdlog::error("Producer spawn failed: {}. Retry after {} seconds...",
                          e.what(), restart_delay_.count() / 1000);
            if (shutdown.wait_for(restart_delay_)) {
                break;
            }
            stats_.restarts++;
            status.restarts++;
            continue;
        }
        first_spawn = false;

        stats_.sessions++;
        status.sessions++;
        status.producer_pid = child->pid();
        status.producer_running = true;
        spdlog::info("Producer started (pid {}). Waiting for messages...", child->pid());

        PipeStream stream(child->stdout_fd(), shutdown);
        try {
            decoder_.decode_stream(stream, context_.config.source_type, on_report_);
            // stdout is closed but the producer may still be running
            int wait_status = 0;
            while (!child->try_reap(wait_status)) {
                if (shutdown.wait_for(kReapPollInterval)) {
                    throw ShutdownRequested{};
                }
            }
            stats_.unexpected_exits++;
            spdlog::warn("Producer terminated ({}).", describe_wait_status(wait_status));
        } catch (const ShutdownRequested&) {
            child->terminate();
            status.producer_running = false;
            break;
        } catch (const DecodeError& e) {
            stats_.decode_errors++;
            status.decode_errors++;
            spdlog::error("Decode error: {}", e.what());
            child->terminate();
        } catch (const std::system_error&) {
            child->terminate();
            status.producer_running = false;
            throw;
        } catch (const std::exception& e) {
            spdlog::error("Report processing failed: {}", e.what());
            child->terminate();
        }
        child.reset();
        status.producer_running = false;

        spdlog::info("Restarting producer after {} seconds...", restart_delay_.count() / 1000);
        if (shutdown.wait_for(restart_delay_)) {
            break;
        }
        stats_.restarts++;
        status.restarts++;
    }

    spdlog::info("Producer supervision stopped");
}
