#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <sys/types.h>
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace subprocess {

// Command line template for an external tool. Arguments may carry {name}
// placeholders that expand() fills in, e.g. "-l" "{dir}".
struct ToolCommand {
    std::string binary;
    std::vector<std::string> args;

    std::vector<std::string> expand(const std::map<std::string, std::string>& values) const;
};

std::string join_command(const std::vector<std::string>& argv);

struct SpawnOptions {
    bool detach = false;  // new session, so terminal signals do not reach the child
    bool quiet = false;   // stdout to /dev/null
    int stdout_fd = -1;   // stdout to this descriptor, overrides quiet
};

struct ExitStatus {
    bool exited = false;
    int code = 0;
    int signal = 0;

    bool success() const { return exited && code == 0; }
    std::string describe() const;
};

// Throws std::system_error when fork fails or the binary cannot be executed.
pid_t spawn(const std::vector<std::string>& argv, const SpawnOptions& options = {});

ExitStatus wait_for(pid_t pid);
// Reaps the child if it has exited, never blocks.
bool try_reap(pid_t pid, ExitStatus& status);
bool wait_exit(pid_t pid, std::chrono::milliseconds timeout,
               std::chrono::milliseconds poll_interval, ExitStatus& status);

ExitStatus run(const std::vector<std::string>& argv);
ExitStatus run_capture(const std::vector<std::string>& argv, std::string& output);

} // namespace subprocess

#endif // SUBPROCESS_HPP
