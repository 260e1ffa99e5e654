/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: process_line_source.cc
 * Description: Implementation of ProcessLineSource. Spawns the reader with
 *              fork/execvp and a pipe on its stdout; exec failures are
 *              reported back through a close-on-exec status pipe so a missing
 *              executable surfaces as a startup error.
 */

#include "lcsee/source/process_line_source.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lcsee {
namespace source {

namespace {
    constexpr size_t READ_CHUNK = 4096;
    // Upper bound on how long a stop request can go unnoticed while the
    // reader is silent
    constexpr int STOP_POLL_MS = 200;
}

pid_t spawn_process(const std::vector<std::string>& argv, int stdout_fd) {
    if (argv.empty()) {
        throw SourceError("Empty command line");
    }

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) == -1) {
        throw SourceError(std::string("pipe2 failed: ") + strerror(errno));
    }

    pid_t child = fork();
    if (child == -1) {
        int err = errno;
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        throw SourceError(std::string("fork failed: ") + strerror(err));
    }

    if (child == 0) {
        ::close(status_pipe[0]);
        if (stdout_fd != -1) {
            dup2(stdout_fd, STDOUT_FILENO);
            ::close(stdout_fd);
        }
        std::vector<char*> args;
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);
        execvp(args[0], args.data());

        int err = errno;
        ssize_t rc = write(status_pipe[1], &err, sizeof(err));
        (void) rc;
        _exit(127);
    }

    ::close(status_pipe[1]);
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n > 0) {
        waitpid(child, nullptr, 0);
        throw SourceError("Failed to launch " + argv[0] + ": " + strerror(exec_errno));
    }
    return child;
}

std::vector<std::string> ProcessLineSource::build_command(const Config& config) {
    std::vector<std::string> cmd;
    cmd.push_back(config.adb_path.empty() ? "adb" : config.adb_path);
    if (!config.serial.empty()) {
        cmd.push_back("-s");
        cmd.push_back(config.serial);
    }
    cmd.push_back("logcat");
    cmd.push_back("-v");
    cmd.push_back(config.format);
    if (config.buffer != "main") {
        cmd.push_back("-b");
        cmd.push_back(config.buffer);
    }
    return cmd;
}

ProcessLineSource::ProcessLineSource(const Config& config) : config_(config) {
    const auto cmd = build_command(config_);

    if (config_.clear) {
        auto clear_cmd = cmd;
        clear_cmd.push_back("-c");
        pid_t clear_child = spawn_process(clear_cmd, -1);
        int status = 0;
        while (waitpid(clear_child, &status, 0) == -1 && errno == EINTR) {
        }
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            std::cerr << "Warning: clearing the log buffer failed" << std::endl;
        }
    }

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) == -1) {
        throw SourceError(std::string("pipe2 failed: ") + strerror(errno));
    }
    try {
        // dup2 in the child clears close-on-exec on its stdout
        child_ = spawn_process(cmd, out_pipe[1]);
    } catch (...) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw;
    }
    ::close(out_pipe[1]);
    fd_ = out_pipe[0];
}

ProcessLineSource::~ProcessLineSource() {
    close();
}

std::optional<std::string> ProcessLineSource::next() {
    char chunk[READ_CHUNK];
    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            return finish_line(std::move(line));
        }
        if (fd_ == -1) {
            return std::nullopt;
        }

        if (stop_requested()) {
            return std::nullopt;
        }
        struct pollfd pfd = {fd_, POLLIN, 0};
        int ready = poll(&pfd, 1, STOP_POLL_MS);
        if (ready == 0) {
            continue;
        }
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            throw SourceError(std::string("poll failed on log reader: ") + strerror(err));
        }

        ssize_t n = read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            // Reader exited; flush what is left
            ::close(fd_);
            fd_ = -1;
            reap(false);
            if (buffer_.empty()) {
                return std::nullopt;
            }
            std::string line = std::move(buffer_);
            buffer_.clear();
            return finish_line(std::move(line));
        }
        if (errno == EINTR) {
            if (stop_requested()) {
                return std::nullopt;
            }
            continue;
        }
        int err = errno;
        throw SourceError(std::string("Read error from log reader: ") + strerror(err));
    }
}

void ProcessLineSource::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
    reap(true);
    buffer_.clear();
}

void ProcessLineSource::reap(bool terminate) {
    if (child_ <= 0) {
        return;
    }
    if (terminate) {
        kill(child_, SIGTERM);
    }
    while (waitpid(child_, nullptr, 0) == -1 && errno == EINTR) {
    }
    child_ = -1;
}

} // namespace source
} // namespace lcsee
