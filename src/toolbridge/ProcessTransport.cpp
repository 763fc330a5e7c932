//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Child-process transport: fork/exec, framed stdin/stdout exchange, graceful shutdown
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>

#include <array>
#include <atomic>
#include <cstring>
#include <format>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include "toolbridge/ProcessTransport.hpp"
#include "toolbridge/errors/Errors.h"
#include "logging/Logger.h"

extern char** environ;

namespace toolbridge {

using errors::ErrorCategory;
using errors::McpException;

namespace {
constexpr std::size_t kStderrTailBytes = 8 * 1024;
constexpr int kWaitSliceMs = 100;

// Launch failure report written by the child before _exit(127)
struct SpawnFailure {
    int stage; // 1 = chdir, 2 = exec
    int err;
};

// write() to a pipe whose reader is gone raises SIGPIPE. Block it for this thread and consume it
// if our write generated it, so a dead peer can never terminate the host process.
ssize_t writeNoSigpipe(int fd, const char* data, std::size_t len) {
    sigset_t pipeSet;
    sigset_t oldSet;
    sigemptyset(&pipeSet);
    sigaddset(&pipeSet, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipeSet, &oldSet);

    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    const bool alreadyPending = sigismember(&pending, SIGPIPE) == 1;

    ssize_t n = ::write(fd, data, len);
    int savedErrno = errno;
    if (n < 0 && savedErrno == EPIPE && !alreadyPending) {
        struct timespec zero{0, 0};
        while (::sigtimedwait(&pipeSet, nullptr, &zero) < 0 && errno == EINTR) {
        }
    }
    pthread_sigmask(SIG_SETMASK, &oldSet, nullptr);
    errno = savedErrno;
    return n;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

bool setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}
} // namespace

class ProcessTransport::Impl {
public:
    ServerConfig config;
    std::chrono::milliseconds shutdownGrace;
    std::unique_ptr<IContentFramer> framer;
    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};
    std::atomic<bool> closing{false};
    std::atomic<int> pid{-1};
    std::string sessionId;

    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};
    int epollFd{-1};

    // Reader-thread only
    std::string readBuffer;

    std::mutex writeMutex;      // guards stdinFd and frame writes
    std::mutex reapMutex;       // one thread at a time calls waitpid
    mutable std::mutex statusMutex;
    std::optional<int> exitCode;
    std::string closeReason;

    mutable std::mutex stderrMutex;
    std::string stderrTail;
    std::thread stderrThread;
    std::atomic<bool> stderrStop{false};

    Impl(ServerConfig cfg, std::chrono::milliseconds grace)
        : config(std::move(cfg)), shutdownGrace(grace), framer(MakeFramer(config.framing)) {
        sessionId = "process-" + config.name;
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("ProcessTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        stderrStop = true;
        if (stderrThread.joinable()) {
            stderrThread.join();
        }
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(epollFd);
        closeFd(wakeEventFd);
    }

    void wake() {
        if (wakeEventFd < 0) return;
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0) break;
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break; // already signaled
            LOG_WARN("ProcessTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
    }

    void markClosed(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lk(statusMutex);
            if (closeReason.empty()) closeReason = reason;
        }
        connected = false;
        wake();
    }

    std::string closedMessage() const {
        std::lock_guard<std::mutex> lk(statusMutex);
        if (!closeReason.empty()) return closeReason;
        return std::format("channel to '{}' is closed", config.name);
    }

    void recordExit(int status) {
        std::lock_guard<std::mutex> lk(statusMutex);
        exitCode = decodeWaitStatus(status);
        pid = -1;
    }

    // Polls for child exit until the deadline. Caller holds reapMutex.
    bool waitForExit(pid_t p, std::chrono::milliseconds budget) {
        auto deadline = std::chrono::steady_clock::now() + budget;
        while (true) {
            int status = 0;
            pid_t r = ::waitpid(p, &status, WNOHANG);
            if (r == p) {
                recordExit(status);
                return true;
            }
            if (r < 0 && errno != EINTR) {
                // ECHILD: already reaped elsewhere
                pid = -1;
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void spawn() {
        if (started.exchange(true)) {
            throw McpException(ErrorCategory::TransportIOFailure, "ProcessTransport already started");
        }
        if (config.command.empty()) {
            throw McpException(ErrorCategory::TransportIOFailure,
                               std::format("server '{}' has no command", config.name));
        }

        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int errPipe[2]{-1, -1};
        int statusPipe[2]{-1, -1};
        auto closeAll = [&]() {
            closeFd(inPipe[0]); closeFd(inPipe[1]);
            closeFd(outPipe[0]); closeFd(outPipe[1]);
            closeFd(errPipe[0]); closeFd(errPipe[1]);
            closeFd(statusPipe[0]); closeFd(statusPipe[1]);
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
            ::pipe2(statusPipe, O_CLOEXEC) != 0 ||
            (config.captureStderr && ::pipe2(errPipe, O_CLOEXEC) != 0)) {
            int e = errno;
            closeAll();
            throw McpException(ErrorCategory::TransportIOFailure,
                               std::format("failed to create pipes for '{}': {}", config.name, ::strerror(e)));
        }

        // Everything the child needs is built before fork(); the child only makes async-signal-safe calls.
        std::vector<std::string> argvStore;
        argvStore.push_back(config.command);
        for (const auto& a : config.args) argvStore.push_back(a);
        std::vector<char*> argv;
        for (auto& s : argvStore) argv.push_back(s.data());
        argv.push_back(nullptr);

        std::map<std::string, std::string> envMap;
        for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
            std::string kv(*e);
            auto eq = kv.find('=');
            if (eq == std::string::npos) continue;
            envMap[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
        for (const auto& [k, v] : config.env) envMap[k] = v;
        std::vector<std::string> envStore;
        for (const auto& [k, v] : envMap) envStore.push_back(k + "=" + v);
        std::vector<char*> envp;
        for (auto& s : envStore) envp.push_back(s.data());
        envp.push_back(nullptr);

        const char* cwd = config.cwd.has_value() ? config.cwd->c_str() : nullptr;

        pid_t child = ::fork();
        if (child < 0) {
            int e = errno;
            closeAll();
            throw McpException(ErrorCategory::TransportIOFailure,
                               std::format("fork failed for '{}': {}", config.name, ::strerror(e)));
        }

        if (child == 0) {
            // dup2 clears FD_CLOEXEC on the targets; the originals close at exec
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            if (errPipe[1] >= 0) {
                ::dup2(errPipe[1], STDERR_FILENO);
            }
            sigset_t none;
            sigemptyset(&none);
            ::sigprocmask(SIG_SETMASK, &none, nullptr);
            ::signal(SIGPIPE, SIG_DFL);

            SpawnFailure failure{0, 0};
            if (cwd != nullptr && ::chdir(cwd) != 0) {
                failure = SpawnFailure{1, errno};
            } else {
                environ = envp.data();
                ::execvp(argv[0], argv.data());
                failure = SpawnFailure{2, errno};
            }
            ssize_t ignored = ::write(statusPipe[1], &failure, sizeof(failure));
            (void)ignored;
            ::_exit(127);
        }

        // Parent
        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(statusPipe[1]);

        SpawnFailure failure{0, 0};
        ssize_t got = 0;
        do {
            got = ::read(statusPipe[0], &failure, sizeof(failure));
        } while (got < 0 && errno == EINTR);
        closeFd(statusPipe[0]);

        if (got == static_cast<ssize_t>(sizeof(failure))) {
            int status = 0;
            while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
            }
            recordExit(status);
            closeAll();
            std::string what = failure.stage == 1
                ? std::format("cannot enter working directory '{}': {}", config.cwd.value_or(""), ::strerror(failure.err))
                : std::format("cannot execute '{}': {}", config.command, ::strerror(failure.err));
            LOG_ERROR("Failed to launch server '{}': {}", config.name, what);
            markClosed(what);
            throw McpException(ErrorCategory::TransportIOFailure,
                               std::format("failed to launch server '{}': {}", config.name, what));
        }

        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        pid = child;
        sessionId = std::format("process-{}-{}", config.name, child);

        if (!setNonBlocking(stdinFd) || !setNonBlocking(stdoutFd) || (stderrFd >= 0 && !setNonBlocking(stderrFd))) {
            LOG_WARN("ProcessTransport: failed to set O_NONBLOCK for '{}' (errno={} msg={})", config.name, errno, ::strerror(errno));
        }

        epollFd = ::epoll_create1(EPOLL_CLOEXEC);
        if (epollFd < 0) {
            int e = errno;
            markClosed("epoll_create1 failed");
            terminateChild();
            throw McpException(ErrorCategory::TransportIOFailure,
                               std::format("epoll_create1 failed for '{}': {}", config.name, ::strerror(e)));
        }
        epoll_event evIn{};
        evIn.events = EPOLLIN | EPOLLRDHUP;
        evIn.data.fd = stdoutFd;
        (void)::epoll_ctl(epollFd, EPOLL_CTL_ADD, stdoutFd, &evIn);
        if (wakeEventFd >= 0) {
            epoll_event evWake{};
            evWake.events = EPOLLIN;
            evWake.data.fd = wakeEventFd;
            (void)::epoll_ctl(epollFd, EPOLL_CTL_ADD, wakeEventFd, &evWake);
        }

        if (stderrFd >= 0) {
            startStderrCapture();
        }
        connected = true;
        LOG_INFO("Started server '{}' (pid {}): {}", config.name, static_cast<int>(child), config.FullCommand());
    }

    void startStderrCapture() {
        stderrThread = std::thread([this]() {
            std::array<char, 1024> buf{};
            while (!stderrStop) {
                pollfd p{};
                p.fd = stderrFd;
                p.events = POLLIN;
                int rc = ::poll(&p, 1, kWaitSliceMs);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    break;
                }
                if (rc == 0) continue;
                ssize_t n = ::read(stderrFd, buf.data(), buf.size());
                if (n > 0) {
                    std::lock_guard<std::mutex> lk(stderrMutex);
                    stderrTail.append(buf.data(), static_cast<std::size_t>(n));
                    if (stderrTail.size() > kStderrTailBytes) {
                        stderrTail.erase(0, stderrTail.size() - kStderrTailBytes);
                    }
                    continue;
                }
                if (n == 0) break;
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                break;
            }
        });
    }

    void send(const std::string& payload) {
        if (!connected) {
            throw McpException(ErrorCategory::TransportClosed, closedMessage());
        }
        const std::string frame = framer->encode(payload);
        std::lock_guard<std::mutex> lock(writeMutex);
        std::size_t off = 0;
        while (off < frame.size()) {
            if (!connected || stdinFd < 0) {
                throw McpException(ErrorCategory::TransportClosed, closedMessage());
            }
            ssize_t n = writeNoSigpipe(stdinFd, frame.data() + off, frame.size() - off);
            if (n > 0) {
                off += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                pollfd p{};
                p.fd = stdinFd;
                p.events = POLLOUT;
                int rc = ::poll(&p, 1, kWaitSliceMs);
                if (rc < 0 && errno != EINTR) {
                    int e = errno;
                    markClosed(std::format("poll on stdin of '{}' failed: {}", config.name, ::strerror(e)));
                    throw McpException(ErrorCategory::TransportIOFailure, closedMessage());
                }
                continue;
            }
            int e = (n < 0) ? errno : EIO;
            std::string why = std::format("write to '{}' failed: {}", config.name, ::strerror(e));
            LOG_WARN("ProcessTransport: {}", why);
            markClosed(why);
            throw McpException(ErrorCategory::TransportIOFailure, why);
        }
        LOG_DEBUG("-> {}: {}", config.name, payload);
    }

    // Reaps the child after EOF on stdout. Skipped when Close() is already reaping.
    void reapAfterEof() {
        std::unique_lock<std::mutex> lk(reapMutex, std::try_to_lock);
        if (!lk.owns_lock()) return;
        pid_t p = pid.load();
        if (p > 0) {
            (void)waitForExit(p, std::chrono::milliseconds(500));
        }
    }

    std::string receive() {
        std::array<char, 64 * 1024> tmp{};
        while (true) {
            auto r = framer->tryDecodeEx(readBuffer);
            if (r.status == IContentFramer::DecodeStatus::Ok) {
                std::string payload = std::move(r.payload.value());
                readBuffer.erase(0, r.bytesConsumed);
                LOG_DEBUG("<- {}: {}", config.name, payload);
                return payload;
            }
            if (r.status == IContentFramer::DecodeStatus::BodyTooLarge ||
                r.status == IContentFramer::DecodeStatus::InvalidHeader) {
                readBuffer.clear();
                std::string why = r.status == IContentFramer::DecodeStatus::BodyTooLarge
                    ? std::format("frame from '{}' exceeds the size limit", config.name)
                    : std::format("invalid frame header from '{}'", config.name);
                markClosed(why);
                throw McpException(ErrorCategory::TransportIOFailure, why);
            }
            if (r.bytesConsumed > 0 && r.bytesConsumed <= readBuffer.size()) {
                readBuffer.erase(0, r.bytesConsumed);
            }

            if (!connected) {
                throw McpException(ErrorCategory::TransportClosed, closedMessage());
            }

            epoll_event events[2];
            int rc = ::epoll_wait(epollFd, events, 2, kWaitSliceMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                int e = errno;
                markClosed(std::format("epoll_wait failed for '{}': {}", config.name, ::strerror(e)));
                throw McpException(ErrorCategory::TransportIOFailure, closedMessage());
            }
            bool readable = false;
            for (int i = 0; i < rc; ++i) {
                if (events[i].data.fd == stdoutFd) {
                    readable = true;
                } else {
                    uint64_t v = 0;
                    ssize_t w;
                    do {
                        w = ::read(wakeEventFd, &v, sizeof(v));
                    } while (w < 0 && errno == EINTR);
                }
            }
            if (!readable) continue;

            ssize_t n = ::read(stdoutFd, tmp.data(), tmp.size());
            if (n > 0) {
                readBuffer.append(tmp.data(), static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0) {
                if (closing) {
                    throw McpException(ErrorCategory::TransportClosed, closedMessage());
                }
                reapAfterEof();
                std::string why;
                {
                    std::lock_guard<std::mutex> lk(statusMutex);
                    why = exitCode.has_value()
                        ? std::format("server '{}' exited (code {})", config.name, exitCode.value())
                        : std::format("server '{}' closed its stdout", config.name);
                }
                LOG_WARN("ProcessTransport: {}", why);
                markClosed(why);
                throw McpException(ErrorCategory::TransportClosed, why);
            }
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            int e = errno;
            std::string why = std::format("read from '{}' failed: {}", config.name, ::strerror(e));
            markClosed(why);
            throw McpException(ErrorCategory::TransportIOFailure, why);
        }
    }

    void terminateChild() {
        std::lock_guard<std::mutex> lk(reapMutex);
        pid_t p = pid.load();
        if (p <= 0) return;
        if (waitForExit(p, shutdownGrace)) return;
        LOG_WARN("Server '{}' (pid {}) still running after {} ms; sending SIGTERM", config.name, static_cast<int>(p), shutdownGrace.count());
        ::kill(p, SIGTERM);
        if (waitForExit(p, shutdownGrace)) return;
        LOG_WARN("Server '{}' (pid {}) ignored SIGTERM; sending SIGKILL", config.name, static_cast<int>(p));
        ::kill(p, SIGKILL);
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(p, &status, 0);
        } while (r < 0 && errno == EINTR);
        if (r == p) {
            recordExit(status);
        } else {
            pid = -1;
        }
    }

    void shutdown() {
        if (closing.exchange(true)) {
            return;
        }
        LOG_INFO("Closing channel to server '{}'", config.name);
        markClosed(std::format("channel to '{}' closed locally", config.name));
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            closeFd(stdinFd); // peer sees EOF on its stdin
        }
        terminateChild();
        stderrStop = true;
        if (stderrThread.joinable()) {
            stderrThread.join();
        }
        std::lock_guard<std::mutex> lk(statusMutex);
        if (exitCode.has_value()) {
            LOG_INFO("Server '{}' exited with code {}", config.name, exitCode.value());
        }
    }
};

ProcessTransport::ProcessTransport(ServerConfig config, std::chrono::milliseconds shutdownGrace)
    : pImpl(std::make_unique<Impl>(std::move(config), shutdownGrace)) {
    FUNC_SCOPE();
}

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    if (pImpl) {
        pImpl->shutdown();
    }
}

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    try {
        pImpl->spawn();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> ProcessTransport::Close() {
    FUNC_SCOPE();
    pImpl->shutdown();
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

bool ProcessTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string ProcessTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void ProcessTransport::Send(const std::string& payload) {
    pImpl->send(payload);
}

std::string ProcessTransport::Receive() {
    return pImpl->receive();
}

std::optional<int> ProcessTransport::GetExitCode() const {
    std::lock_guard<std::mutex> lk(pImpl->statusMutex);
    return pImpl->exitCode;
}

std::string ProcessTransport::GetStderrTail() const {
    std::lock_guard<std::mutex> lk(pImpl->stderrMutex);
    return pImpl->stderrTail;
}

int ProcessTransport::GetPid() const {
    return pImpl->pid.load();
}

std::unique_ptr<ITransport> ProcessTransportFactory::CreateTransport(const ServerConfig& config) {
    FUNC_SCOPE();
    return std::make_unique<ProcessTransport>(config, shutdownGrace);
}

} // namespace toolbridge
