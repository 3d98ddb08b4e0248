#include "subprocess.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace subprocess {

std::vector<std::string> ToolCommand::expand(const std::map<std::string, std::string>& values) const {
    std::vector<std::string> argv;
    argv.push_back(binary);
    for (const auto& arg : args) {
        std::string expanded = arg;
        for (const auto& [name, value] : values) {
            const std::string placeholder = "{" + name + "}";
            size_t pos = 0;
            while ((pos = expanded.find(placeholder, pos)) != std::string::npos) {
                expanded.replace(pos, placeholder.size(), value);
                pos += value.size();
            }
        }
        argv.push_back(expanded);
    }
    return argv;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::ostringstream ss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) ss << " ";
        ss << argv[i];
    }
    return ss.str();
}

std::string ExitStatus::describe() const {
    std::ostringstream ss;
    if (exited) ss << "exit code " << code;
    else ss << "killed by signal " << signal;
    return ss.str();
}

static ExitStatus decode_status(int raw) {
    ExitStatus status;
    if (WIFEXITED(raw)) {
        status.exited = true;
        status.code = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
        status.signal = WTERMSIG(raw);
    }
    return status;
}

pid_t spawn(const std::vector<std::string>& argv, const SpawnOptions& options) {
    if (argv.empty() || argv[0].empty()) {
        throw std::invalid_argument("subprocess: empty command line");
    }

    // The child reports a failed exec through this pipe; a successful exec
    // closes it and the parent reads EOF.
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }

    std::vector<char*> av;
    for (const auto& a : argv) av.push_back(const_cast<char*>(a.c_str()));
    av.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }
    if (pid == 0) {
        close(err_pipe[0]);
        if (options.detach) setsid();
        if (options.stdout_fd >= 0) {
            if (options.stdout_fd != STDOUT_FILENO) {
                dup2(options.stdout_fd, STDOUT_FILENO);
                close(options.stdout_fd);
            }
        } else if (options.quiet) {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                close(devnull);
            }
        }
        execvp(av[0], av.data());
        int err = errno;
        ssize_t written = write(err_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        wait_for(pid);
        throw std::system_error(child_errno, std::generic_category(), "exec " + argv[0]);
    }
    return pid;
}

ExitStatus wait_for(pid_t pid) {
    int raw = 0;
    while (waitpid(pid, &raw, 0) == -1) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    return decode_status(raw);
}

bool try_reap(pid_t pid, ExitStatus& status) {
    int raw = 0;
    pid_t r = waitpid(pid, &raw, WNOHANG);
    if (r == pid) {
        status = decode_status(raw);
        return true;
    }
    if (r == -1 && errno == ECHILD) {
        // Already reaped elsewhere; nothing left to wait for.
        status = ExitStatus{};
        return true;
    }
    return false;
}

bool wait_exit(pid_t pid, std::chrono::milliseconds timeout,
               std::chrono::milliseconds poll_interval, ExitStatus& status) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (try_reap(pid, status)) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(poll_interval);
    }
}

ExitStatus run(const std::vector<std::string>& argv) {
    return wait_for(spawn(argv));
}

ExitStatus run_capture(const std::vector<std::string>& argv, std::string& output) {
    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }

    SpawnOptions options;
    options.stdout_fd = out_pipe[1];
    pid_t pid;
    try {
        pid = spawn(argv, options);
    } catch (...) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw;
    }
    close(out_pipe[1]);

    char buf[65536];
    while (true) {
        ssize_t n = read(out_pipe[0], buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            int err = errno;
            close(out_pipe[0]);
            kill(pid, SIGKILL);
            wait_for(pid);
            throw std::system_error(err, std::generic_category(), "read from " + argv[0]);
        }
    }
    close(out_pipe[0]);
    return wait_for(pid);
}

} // namespace subprocess
