/**
 * @file process_utils.cpp
 * @brief fork/exec based command execution with separate stdout/stderr pipes
 *
 * Docker writes warnings to stderr while printing JSON on stdout, so the two
 * streams are captured separately (merging them with 2>&1 would corrupt the
 * inspect output). Both pipes are drained with poll() to avoid a deadlock
 * when the child fills one of them.
 *
 * @date 2025
 */

#include "redock/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace redock {
namespace utils {

namespace {

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool NeedsQuoting(const std::string& arg) {
    if (arg.empty()) return true;
    for (char c : arg) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) ||
              std::strchr("@%+=:,./_-", c) != nullptr)) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const std::optional<std::string>& stdin_data) {
    ProcessResult result;
    if (argv.empty()) {
        result.exit_code = -1;
        result.stderr_output = "Empty command";
        return result;
    }

    spdlog::debug("Executing: {}", FormatCommandLine(argv));

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};

    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe(in_pipe) != 0) {
        result.exit_code = -1;
        result.stderr_output = std::string("Failed to create pipes: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, in_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.exit_code = -1;
        result.stderr_output = std::string("Failed to fork: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, in_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child: wire pipes to stdio and exec
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        execvp(args[0], args.data());
        const std::string msg = "exec " + argv[0] + " failed: " + std::strerror(errno) + "\n";
        ssize_t ignored = write(STDERR_FILENO, msg.data(), msg.size());
        (void)ignored;
        _exit(127);
    }

    // Parent
    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);

    if (stdin_data && !stdin_data->empty()) {
        // SIGPIPE would kill us if the child exits without reading
        struct sigaction ignore_pipe{};
        struct sigaction previous{};
        ignore_pipe.sa_handler = SIG_IGN;
        sigaction(SIGPIPE, &ignore_pipe, &previous);

        std::size_t written = 0;
        while (written < stdin_data->size()) {
            ssize_t n = write(in_pipe[1], stdin_data->data() + written,
                              stdin_data->size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                spdlog::warn("Failed to write child stdin: {}", std::strerror(errno));
                break;
            }
            written += static_cast<std::size_t>(n);
        }
        sigaction(SIGPIPE, &previous, nullptr);
    }
    CloseFd(in_pipe[1]);

    std::array<char, 4096> buffer;
    std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
    int open_streams = 2;

    while (open_streams > 0) {
        int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("poll() failed while reading child output: {}", std::strerror(errno));
            break;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                auto& sink = (i == 0) ? result.stdout_output : result.stderr_output;
                sink.append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    for (auto& fd : fds) {
        if (fd.fd >= 0) close(fd.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exit_code = -1;
            result.stderr_output += std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    result.success = (result.exit_code == 0);

    if (!result.success) {
        spdlog::debug("Command exited with {}: {}", result.exit_code, TrimRight(result.stderr_output));
    }
    return result;
}

std::string FormatCommandLine(const std::vector<std::string>& argv) {
    std::ostringstream cmd;
    bool first = true;
    for (const auto& arg : argv) {
        if (!first) cmd << ' ';
        first = false;

        if (!NeedsQuoting(arg)) {
            cmd << arg;
            continue;
        }
        cmd << '\'';
        for (char c : arg) {
            if (c == '\'') {
                cmd << "'\\''";
            } else {
                cmd << c;
            }
        }
        cmd << '\'';
    }
    return cmd.str();
}

std::string TrimRight(std::string value) {
    value.erase(value.find_last_not_of(" \n\r\t") + 1);
    return value;
}

} // namespace utils
} // namespace redock
