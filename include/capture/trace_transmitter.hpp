#ifndef TRACE_TRANSMITTER_HPP
#define TRACE_TRANSMITTER_HPP

#include <string>
#include "capture_session.hpp"
#include "subprocess.hpp"

namespace trace_transmitter {

struct TransmitConfig {
    // Placeholders: {host} {port} {version} {trace}
    subprocess::ToolCommand exporter{"softflowd", {"-n", "{host}:{port}", "-v", "{version}", "-r", "{trace}"}};
    int export_version = 5;  // NetFlow version sent to the collector
    bool probe_trace = true; // open the trace with libpcap before replaying it
    bool verbose = false;
};

std::string probe_trace(const std::string& trace_path);
void transmit(const std::string& trace_path, const capture_session::Endpoint& endpoint, const TransmitConfig& config);

} // namespace trace_transmitter

#endif // TRACE_TRANSMITTER_HPP
