#ifndef CAPTURE_SESSION_HPP
#define CAPTURE_SESSION_HPP

#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <string>
#include "subprocess.hpp"

namespace capture_session {

struct Endpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 9995;

    std::string to_string() const;
};

struct SessionConfig {
    // Placeholders: {host} {port} {dir}
    subprocess::ToolCommand collector{"nfcapd", {"-b", "{host}", "-p", "{port}", "-l", "{dir}"}};
    std::chrono::milliseconds start_timeout{2000};  // wait for the collector to bind
    std::chrono::milliseconds stop_timeout{10000};  // wait for the collector to flush and exit
    std::chrono::milliseconds poll_interval{50};
    bool verbose = false;
};

// False when the endpoint cannot be bound, with the reason in *reason.
bool endpoint_available(const Endpoint& endpoint, std::string* reason = nullptr);
// True when a UDP socket is bound on the endpoint's port (Linux /proc/net).
bool endpoint_listening(const Endpoint& endpoint);

// One collector process writing into one scratch directory. The process is
// owned by the session and is stopped at the latest when the session is destroyed.
class CaptureSession {
public:
    explicit CaptureSession(const SessionConfig& config);
    ~CaptureSession();
    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    void start(const Endpoint& endpoint, const std::string& scratch_dir);
    void stop();
    bool active() const { return pid_ > 0; }
    pid_t pid() const { return pid_; }
    const Endpoint& endpoint() const { return endpoint_; }
    const std::string& scratch_dir() const { return scratch_dir_; }

private:
    void wait_until_listening();

    SessionConfig config_;
    Endpoint endpoint_;
    std::string scratch_dir_;
    pid_t pid_ = -1;
};

} // namespace capture_session

#endif // CAPTURE_SESSION_HPP
