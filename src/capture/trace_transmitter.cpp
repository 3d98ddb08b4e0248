#include "trace_transmitter.hpp"
#include "conversion_error.hpp"
#include <pcap.h>
#include <iostream>
#include <stdexcept>

namespace trace_transmitter {

// Returns the trace's link-layer name; throws TraceReadFailed if libpcap cannot read it.
std::string probe_trace(const std::string& trace_path) {
    char errbuf[PCAP_ERRBUF_SIZE];
    pcap_t* handle = pcap_open_offline(trace_path.c_str(), errbuf);
    if (!handle) {
        throw conversion::Error(conversion::ErrorKind::TraceReadFailed,
                                "Error opening " + trace_path + ": " + errbuf);
    }

    struct pcap_pkthdr* header;
    const u_char* packet;
    int rc = pcap_next_ex(handle, &header, &packet);
    if (rc == PCAP_ERROR) {
        std::string error = pcap_geterr(handle);
        pcap_close(handle);
        throw conversion::Error(conversion::ErrorKind::TraceReadFailed,
                                "Error reading " + trace_path + ": " + error);
    }

    const char* link_name = pcap_datalink_val_to_name(pcap_datalink(handle));
    std::string link = link_name ? link_name : "unknown";
    pcap_close(handle);
    return link;
}

void transmit(const std::string& trace_path, const capture_session::Endpoint& endpoint, const TransmitConfig& config) {
    std::cout << "[trace_transmitter] PCAP file: " << trace_path << "\n";
    if (config.probe_trace) {
        std::string link = probe_trace(trace_path);
        if (config.verbose) {
            std::cout << "[trace_transmitter] " << trace_path << " link type " << link << "\n";
        }
    }

    auto argv = config.exporter.expand({
        {"host", endpoint.host},
        {"port", std::to_string(endpoint.port)},
        {"version", std::to_string(config.export_version)},
        {"trace", trace_path}
    });
    if (config.verbose) {
        std::cout << "[trace_transmitter] Command: " << subprocess::join_command(argv) << "\n";
    }

    subprocess::ExitStatus status;
    try {
        status = subprocess::run(argv);
    } catch (const std::exception& e) {
        throw conversion::Error(conversion::ErrorKind::ExportSendFailed,
                                "Could not run exporter '" + subprocess::join_command(argv) + "': " + e.what());
    }
    if (!status.success()) {
        throw conversion::Error(conversion::ErrorKind::ExportSendFailed,
                                "Exporter failed on " + trace_path + " (" + status.describe() + ")");
    }
}

} // namespace trace_transmitter
