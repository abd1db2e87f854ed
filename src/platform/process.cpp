#include "mdexpand/process.hpp"

#include <chrono>
#include <cstring>
#include <ctime>

#ifndef _WIN32
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace mdexpand {

std::vector<std::string> shell_argv(const std::string& command) {
#ifdef _WIN32
    return {"cmd.exe", "/d", "/s", "/c", command};
#else
    return {"/bin/sh", "-c", command};
#endif
}

#ifdef _WIN32

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
    (void)argv;
    (void)options;
    ProcessResult result;
    result.error = "process execution is not supported on this platform";
    return result;
}

#else

namespace {

// Close-on-exec so that children spawned concurrently by other threads do not
// inherit our pipe ends and hold them open.
bool make_pipe(int fds[2]) {
#if defined(__linux__)
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Returns false on EOF or error
bool drain(int fd, std::string& out) {
    char buf[8192];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

std::vector<std::string> build_environment(const std::unordered_map<std::string, std::string>& env) {
    std::vector<std::string> result;
    result.reserve(env.size());
    for (const auto& [key, value] : env) {
        result.push_back(key + "=" + value);
    }
    return result;
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv_strings, const ProcessOptions& options) {
    ProcessResult result;

    if (argv_strings.empty() || argv_strings[0].empty()) {
        result.error = "empty argv";
        return result;
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    for (const auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    auto env_strings = build_environment(options.env);
    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);
    char** child_env = options.env.empty() ? environ : envp.data();

    int out_pipe[2];
    int err_pipe[2];
    if (!make_pipe(out_pipe)) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (!make_pipe(err_pipe)) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        if (!options.cwd.empty()) {
            if (chdir(options.cwd.c_str()) != 0) {
                _exit(127);
            }
        }

        execve(argv[0], argv.data(), child_env);

        // A freshly written script can still be open for writing in a sibling
        // that forked before its exec closed the descriptor
        for (int attempt = 0; attempt < 50 && errno == ETXTBSY; ++attempt) {
            struct timespec pause = {0, 10 * 1000 * 1000};
            nanosleep(&pause, nullptr);
            execve(argv[0], argv.data(), child_env);
        }

        // If execve returns, it failed
        _exit(127);
    }

    // Parent process
    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(options.timeout_ms);

    while (out_fd >= 0 || err_fd >= 0) {
        int wait_ms = -1;
        if (options.timeout_ms > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - clock::now()).count();
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining);
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        int out_slot = -1;
        int err_slot = -1;
        if (out_fd >= 0) {
            fds[nfds] = {out_fd, POLLIN, 0};
            out_slot = static_cast<int>(nfds++);
        }
        if (err_fd >= 0) {
            fds[nfds] = {err_fd, POLLIN, 0};
            err_slot = static_cast<int>(nfds++);
        }

        int ready = poll(fds, nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = "poll failed: " + std::string(strerror(errno));
            break;
        }
        if (ready == 0) continue;

        if (out_slot >= 0 && fds[out_slot].revents != 0) {
            if (!drain(out_fd, result.stdout_text)) close_fd(out_fd);
        }
        if (err_slot >= 0 && fds[err_slot].revents != 0) {
            if (!drain(err_fd, result.stderr_text)) close_fd(err_fd);
        }
    }

    close_fd(out_fd);
    close_fd(err_fd);

    // The child may close or redirect its output and keep running, so the
    // deadline still applies once both pipes are at EOF
    int status = 0;
    bool reaped = false;
    if (!result.timed_out && result.error.empty() && options.timeout_ms > 0) {
        while (!reaped) {
            pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                reaped = true;
            } else if (waited == -1 && errno != EINTR) {
                result.error = "waitpid failed: " + std::string(strerror(errno));
                break;
            } else if (clock::now() >= deadline) {
                result.timed_out = true;
            } else {
                usleep(10 * 1000);
                continue;
            }
            if (result.timed_out) break;
        }
    }

    if (!reaped) {
        if (result.timed_out || !result.error.empty()) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
        }
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) {
                result.error = "waitpid failed: " + std::string(strerror(errno));
                return result;
            }
        }
    }

    if (!result.error.empty()) {
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    result.ok = true;
    return result;
}

#endif // _WIN32

} // namespace mdexpand
