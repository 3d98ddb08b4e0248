#include "capture_session.hpp"
#include "conversion_error.hpp"
#include <netdb.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace capture_session {

std::string Endpoint::to_string() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

bool endpoint_available(const Endpoint& endpoint, std::string* reason) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_flags = AI_NUMERICSERV;
    addrinfo* result = nullptr;
    int rc = getaddrinfo(endpoint.host.c_str(), std::to_string(endpoint.port).c_str(), &hints, &result);
    if (rc != 0) {
        if (reason) *reason = "cannot resolve '" + endpoint.host + "': " + gai_strerror(rc);
        return false;
    }

    // Available when any resolved address of the host can be bound.
    bool ok = false;
    for (addrinfo* ai = result; ai && !ok; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd == -1) {
            if (reason) *reason = std::strerror(errno);
            continue;
        }
        ok = bind(fd, ai->ai_addr, ai->ai_addrlen) == 0;
        if (!ok && reason) *reason = std::strerror(errno);
        close(fd);
    }
    freeaddrinfo(result);
    return ok;
}

static bool port_in_proc_table(const std::string& table, uint16_t port) {
    std::ifstream in(table);
    if (!in) return false;
    std::string line;
    std::getline(in, line); // column header
    while (std::getline(in, line)) {
        std::istringstream ss(line);
        std::string slot, local_address;
        if (!(ss >> slot >> local_address)) continue;
        auto colon = local_address.rfind(':');
        if (colon == std::string::npos) continue;
        try {
            if (std::stoul(local_address.substr(colon + 1), nullptr, 16) == port) return true;
        } catch (const std::exception&) {
            continue;
        }
    }
    return false;
}

bool endpoint_listening(const Endpoint& endpoint) {
    return port_in_proc_table("/proc/net/udp", endpoint.port) ||
           port_in_proc_table("/proc/net/udp6", endpoint.port);
}

CaptureSession::CaptureSession(const SessionConfig& config)
    : config_(config) {}

CaptureSession::~CaptureSession() {
    if (!active()) return;
    try {
        stop();
    } catch (const std::exception& e) {
        std::cerr << "[capture_session] Error stopping collector: " << e.what() << "\n";
    }
}

void CaptureSession::start(const Endpoint& endpoint, const std::string& scratch_dir) {
    if (active()) {
        throw std::logic_error("[capture_session] Collector already running (pid " + std::to_string(pid_) + ")");
    }
    std::error_code ec;
    if (!fs::is_directory(scratch_dir, ec)) {
        throw std::logic_error("[capture_session] Scratch directory '" + scratch_dir + "' does not exist");
    }
    if (!fs::is_empty(scratch_dir, ec) || ec) {
        throw std::logic_error("[capture_session] Scratch directory '" + scratch_dir + "' is not empty");
    }

    std::string reason;
    if (!endpoint_available(endpoint, &reason)) {
        throw conversion::Error(conversion::ErrorKind::EndpointBindFailed,
                                "Endpoint " + endpoint.to_string() + " is not available: " + reason);
    }

    auto argv = config_.collector.expand({
        {"host", endpoint.host},
        {"port", std::to_string(endpoint.port)},
        {"dir", scratch_dir}
    });
    subprocess::SpawnOptions options;
    options.detach = true;
    options.quiet = true;
    try {
        pid_ = subprocess::spawn(argv, options);
    } catch (const std::exception& e) {
        throw conversion::Error(conversion::ErrorKind::CollectorSpawnFailed,
                                "Could not start collector '" + subprocess::join_command(argv) + "': " + e.what());
    }
    endpoint_ = endpoint;
    scratch_dir_ = scratch_dir;

    std::cout << "[capture_session] Started collector (pid " << pid_ << ") on " << endpoint_.to_string()
              << ", writing to " << scratch_dir_ << "\n";
    if (config_.verbose) {
        std::cout << "[capture_session] Command: " << subprocess::join_command(argv) << "\n";
    }
    wait_until_listening();
}

void CaptureSession::wait_until_listening() {
    auto deadline = std::chrono::steady_clock::now() + config_.start_timeout;
    while (true) {
        subprocess::ExitStatus status;
        if (subprocess::try_reap(pid_, status)) {
            pid_ = -1;
            throw conversion::Error(conversion::ErrorKind::CollectorSpawnFailed,
                                    "Collector exited during startup (" + status.describe() + ")");
        }
        if (endpoint_listening(endpoint_)) {
            if (config_.verbose) {
                std::cout << "[capture_session] Collector is listening on " << endpoint_.to_string() << "\n";
            }
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            std::cout << "[capture_session] Collector not confirmed listening after "
                      << config_.start_timeout.count() << " ms, continuing\n";
            return;
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
}

void CaptureSession::stop() {
    if (!active()) return;
    pid_t pid = pid_;
    pid_ = -1;

    subprocess::ExitStatus status;
    if (subprocess::try_reap(pid, status)) {
        throw conversion::Error(conversion::ErrorKind::CollectorSpawnFailed,
                                "Collector (pid " + std::to_string(pid) + ") exited before it was stopped (" +
                                status.describe() + ")");
    }

    if (kill(pid, SIGTERM) == -1 && errno != ESRCH) {
        std::cerr << "[capture_session] Warning: could not signal collector (pid " << pid << "): "
                  << std::strerror(errno) << "\n";
    }

    // Process exit is the flush barrier: the collector writes its last file on SIGTERM.
    if (subprocess::wait_exit(pid, config_.stop_timeout, config_.poll_interval, status)) {
        std::cout << "[capture_session] Stopped collector (pid " << pid << ")\n";
        return;
    }

    kill(pid, SIGKILL);
    subprocess::wait_for(pid);
    throw conversion::Error(conversion::ErrorKind::CollectorFlushTimeout,
                            "Collector (pid " + std::to_string(pid) + ") did not exit within " +
                            std::to_string(config_.stop_timeout.count()) + " ms of the stop signal");
}

} // namespace capture_session
