/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "subprocess.h"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>

#if defined(_WIN32)
#include <cstdlib>
#else
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace romc::proc {
#if defined(_WIN32)
static std::string quote_arg(const std::string& arg) {
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

ProcessResult run_process(const std::vector<std::string>& argv) {
    ProcessResult res{};
    if (argv.empty()) {
        res.launch_error = "Empty argv";
        return res;
    }
    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) {
            cmd.push_back(' ');
        }
        cmd += quote_arg(arg);
    }
    FILE* pipe = ::_popen(cmd.c_str(), "rb");
    if (!pipe) {
        res.launch_error = "_popen() failed";
        return res;
    }
    res.launched = true;
    std::array<char, 4096> buffer{};
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        res.out.append(buffer.data(), n);
    }
    res.exit_code = ::_pclose(pipe);
    return res;
}
#else
static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

ProcessResult run_process(const std::vector<std::string>& argv) {
    ProcessResult res{};
    if (argv.empty()) {
        res.launch_error = "Empty argv";
        return res;
    }

    std::array<int, 2> out_fds{-1, -1};
    std::array<int, 2> err_fds{-1, -1};
    if (::pipe(out_fds.data()) != 0) {
        res.launch_error = "pipe() failed: " + std::string(std::strerror(errno));
        return res;
    }
    if (::pipe(err_fds.data()) != 0) {
        res.launch_error = "pipe() failed: " + std::string(std::strerror(errno));
        close_fd(out_fds[0]);
        close_fd(out_fds[1]);
        return res;
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, out_fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_fds[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, out_fds[0]);
    posix_spawn_file_actions_addclose(&actions, err_fds[0]);
    posix_spawn_file_actions_addclose(&actions, out_fds[1]);
    posix_spawn_file_actions_addclose(&actions, err_fds[1]);

    pid_t pid = 0;
    const int spawn_result =
        ::posix_spawnp(&pid, c_argv[0], &actions, nullptr, c_argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    close_fd(out_fds[1]);
    close_fd(err_fds[1]);

    if (spawn_result != 0) {
        close_fd(out_fds[0]);
        close_fd(err_fds[0]);
        res.launch_error =
            "posix_spawnp(" + argv[0] + ") failed: " + std::string(std::strerror(spawn_result));
        return res;
    }
    res.launched = true;

    // Drain both pipes together so a chatty stderr cannot block the child.
    std::array<pollfd, 2> fds{};
    fds[0] = {out_fds[0], POLLIN, 0};
    fds[1] = {err_fds[0], POLLIN, 0};
    std::array<char, 4096> buffer{};
    int open_count = 2;
    while (open_count > 0) {
        const int rc = ::poll(fds.data(), fds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (std::size_t i = 0; i < fds.size(); i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            const ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                std::string& sink = (i == 0) ? res.out : res.err;
                sink.append(buffer.data(), static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            ::close(fds[i].fd);
            fds[i].fd = -1;
            open_count--;
        }
    }
    for (auto& p : fds) {
        if (p.fd >= 0) {
            ::close(p.fd);
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            res.exit_code = -1;
            return res;
        }
    }
    if (WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.exit_code = 128 + WTERMSIG(status);
    }
    return res;
}
#endif
}  // namespace romc::proc
