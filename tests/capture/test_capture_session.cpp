#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "capture_session.hpp"
#include "trace_transmitter.hpp"
#include "conversion_error.hpp"
#include "test_helpers.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <stdexcept>

using namespace capture_session;

// Stand-in collector: on SIGTERM it flushes what the exporter left in the
// sink file into the scratch directory and exits.
static const char* fake_collector =
    "dir=\"$1\"\n"
    "sink=\"$2\"\n"
    "trap 'if [ -f \"$sink\" ]; then cat \"$sink\" > \"$dir/nfcapd.current\"; rm -f \"$sink\"; "
    "else : > \"$dir/nfcapd.current\"; fi; exit 0' TERM\n"
    "while true; do sleep 0.05; done\n";

static bool process_alive(pid_t pid) {
    return kill(pid, 0) == 0 || errno == EPERM;
}

static SessionConfig make_session_config(const std::string& binary, const std::vector<std::string>& args) {
    SessionConfig config;
    config.collector = {binary, args};
    config.start_timeout = std::chrono::milliseconds(100);
    config.stop_timeout = std::chrono::milliseconds(5000);
    config.poll_interval = std::chrono::milliseconds(10);
    return config;
}

TEST_CASE("Capture session lifecycle", "[capture_session]") {
    CoutRedirect cout_redirect;
    CerrRedirect cerr_redirect;
    std::string tmp_dir = "capture-tmp";
    fs::remove_all(tmp_dir);
    fs::create_directories(tmp_dir + "/scratch");
    fs::create_directories(tmp_dir + "/tools");
    const std::string scratch = tmp_dir + "/scratch";
    const std::string sink = tmp_dir + "/sink.txt";
    const std::string collector = tmp_dir + "/tools/nfcapd.sh";
    write_script(collector, fake_collector);

    Endpoint endpoint;
    endpoint.host = "127.0.0.1";
    endpoint.port = free_udp_port();

    SECTION("Stop without a running collector is a no-op") {
        CaptureSession session(make_session_config(collector, {"{dir}", sink}));
        REQUIRE_NOTHROW(session.stop());
        REQUIRE_NOTHROW(session.stop());
        REQUIRE_FALSE(session.active());
        REQUIRE(list_dir(scratch).empty());
    }

    SECTION("Start and stop flush the collector into the scratch directory") {
        CaptureSession session(make_session_config(collector, {"{dir}", sink}));
        session.start(endpoint, scratch);
        REQUIRE(session.active());
        pid_t pid = session.pid();
        REQUIRE(process_alive(pid));
        write_file(sink, "1 first\n");
        session.stop();
        REQUIRE_FALSE(session.active());
        REQUIRE(list_dir(scratch) == std::vector<std::string>{"nfcapd.current"});
        REQUIRE(read_file(scratch + "/nfcapd.current") == "1 first\n");
        REQUIRE(cout_redirect.getOutput().find("[capture_session] Started collector (pid " + std::to_string(pid) +
                                               ") on " + endpoint.to_string()) != std::string::npos);
        REQUIRE(cout_redirect.getOutput().find("[capture_session] Stopped collector") != std::string::npos);
        REQUIRE_NOTHROW(session.stop());
    }

    SECTION("Destroying a session stops its collector") {
        pid_t pid;
        {
            CaptureSession session(make_session_config(collector, {"{dir}", sink}));
            session.start(endpoint, scratch);
            pid = session.pid();
        }
        REQUIRE_FALSE(process_alive(pid));
        REQUIRE(fs::exists(scratch + "/nfcapd.current"));
    }

    SECTION("Scratch directory must be empty") {
        write_file(scratch + "/nfcapd.stale", "old");
        CaptureSession session(make_session_config(collector, {"{dir}", sink}));
        REQUIRE_THROWS_AS(session.start(endpoint, scratch), std::logic_error);
        REQUIRE_FALSE(session.active());
    }

    SECTION("Only one collector per session") {
        CaptureSession session(make_session_config(collector, {"{dir}", sink}));
        session.start(endpoint, scratch);
        REQUIRE_THROWS_AS(session.start(endpoint, scratch), std::logic_error);
        session.stop();
    }

    SECTION("Missing collector binary") {
        CaptureSession session(make_session_config(tmp_dir + "/tools/not-installed", {"{dir}"}));
        try {
            session.start(endpoint, scratch);
            FAIL("expected CollectorSpawnFailed");
        } catch (const conversion::Error& e) {
            REQUIRE(e.kind() == conversion::ErrorKind::CollectorSpawnFailed);
        }
        REQUIRE_FALSE(session.active());
    }

    SECTION("Collector that dies during startup") {
        std::string broken = tmp_dir + "/tools/broken.sh";
        write_script(broken, "echo 'bind(): Address already in use' >&2\nexit 255\n");
        SessionConfig config = make_session_config(broken, {});
        config.start_timeout = std::chrono::milliseconds(2000);
        CaptureSession session(config);
        try {
            session.start(endpoint, scratch);
            FAIL("expected CollectorSpawnFailed");
        } catch (const conversion::Error& e) {
            REQUIRE(e.kind() == conversion::ErrorKind::CollectorSpawnFailed);
            REQUIRE(std::string(e.what()).find("exit code 255") != std::string::npos);
        }
        REQUIRE_FALSE(session.active());
    }

    SECTION("Endpoint already bound") {
        int fd = socket(AF_INET, SOCK_DGRAM, 0);
        REQUIRE(fd >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(endpoint.port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        REQUIRE(bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

        REQUIRE_FALSE(endpoint_available(endpoint));
        REQUIRE(endpoint_listening(endpoint));
        CaptureSession session(make_session_config(collector, {"{dir}", sink}));
        try {
            session.start(endpoint, scratch);
            FAIL("expected EndpointBindFailed");
        } catch (const conversion::Error& e) {
            REQUIRE(e.kind() == conversion::ErrorKind::EndpointBindFailed);
        }
        close(fd);
        REQUIRE(endpoint_available(endpoint));
    }

    SECTION("Collector that ignores the stop signal") {
        std::string stubborn = tmp_dir + "/tools/stubborn.sh";
        write_script(stubborn, "trap '' TERM\nwhile true; do sleep 0.05; done\n");
        SessionConfig config = make_session_config(stubborn, {});
        config.stop_timeout = std::chrono::milliseconds(200);
        CaptureSession session(config);
        session.start(endpoint, scratch);
        pid_t pid = session.pid();
        try {
            session.stop();
            FAIL("expected CollectorFlushTimeout");
        } catch (const conversion::Error& e) {
            REQUIRE(e.kind() == conversion::ErrorKind::CollectorFlushTimeout);
        }
        REQUIRE_FALSE(session.active());
        REQUIRE_FALSE(process_alive(pid));
    }

    SECTION("Endpoint formatting") {
        Endpoint v4;
        v4.port = 2055;
        Endpoint v6;
        v6.host = "::1";
        v6.port = 2055;
        REQUIRE(v4.to_string() == "127.0.0.1:2055");
        REQUIRE(v6.to_string() == "[::1]:2055");
    }

    SECTION("Host names are resolved") {
        Endpoint named;
        named.host = "localhost";
        named.port = endpoint.port;
        std::string reason;
        REQUIRE(endpoint_available(named, &reason));

        Endpoint bogus;
        bogus.host = "collector.invalid";
        REQUIRE_FALSE(endpoint_available(bogus, &reason));
        REQUIRE(reason.find("cannot resolve 'collector.invalid'") != std::string::npos);
    }

    fs::remove_all(tmp_dir);
}

TEST_CASE("Trace transmitter", "[trace_transmitter]") {
    CoutRedirect cout_redirect;
    std::string tmp_dir = "transmit-tmp";
    fs::remove_all(tmp_dir);
    fs::create_directories(tmp_dir);
    const std::string trace = tmp_dir + "/sample.pcap";
    const std::string args_log = tmp_dir + "/args.txt";
    create_sample_pcap(trace);

    const std::string exporter = tmp_dir + "/softflowd.sh";
    write_script(exporter, "echo \"$@\" > \"" + args_log + "\"\n");

    Endpoint endpoint;
    endpoint.port = free_udp_port();

    trace_transmitter::TransmitConfig config;
    config.exporter = {exporter, {"-n", "{host}:{port}", "-v", "{version}", "-r", "{trace}"}};

    SECTION("Probe reads the capture with libpcap") {
        REQUIRE(trace_transmitter::probe_trace(trace) == "EN10MB");
    }

    SECTION("Unreadable trace") {
        write_file(tmp_dir + "/garbage.pcap", "this is not a capture file");
        for (const auto& path : {tmp_dir + "/garbage.pcap", tmp_dir + "/nonexistent.pcap"}) {
            try {
                trace_transmitter::transmit(path, endpoint, config);
                FAIL("expected TraceReadFailed");
            } catch (const conversion::Error& e) {
                REQUIRE(e.kind() == conversion::ErrorKind::TraceReadFailed);
                REQUIRE(std::string(e.what()).find("Error opening " + path) != std::string::npos);
            }
        }
        REQUIRE_FALSE(fs::exists(args_log));
    }

    SECTION("Exporter runs to completion against the endpoint") {
        trace_transmitter::transmit(trace, endpoint, config);
        REQUIRE(read_file(args_log) == "-n " + endpoint.to_string() + " -v 5 -r " + trace + "\n");
        REQUIRE(cout_redirect.getOutput().find("[trace_transmitter] PCAP file: " + trace) != std::string::npos);
    }

    SECTION("Export version is configurable") {
        config.export_version = 9;
        trace_transmitter::transmit(trace, endpoint, config);
        REQUIRE(read_file(args_log).find("-v 9 ") != std::string::npos);
    }

    SECTION("Exporter failure") {
        write_script(exporter, "exit 1\n");
        try {
            trace_transmitter::transmit(trace, endpoint, config);
            FAIL("expected ExportSendFailed");
        } catch (const conversion::Error& e) {
            REQUIRE(e.kind() == conversion::ErrorKind::ExportSendFailed);
        }
    }

    SECTION("Missing exporter binary") {
        config.exporter.binary = tmp_dir + "/not-installed";
        try {
            trace_transmitter::transmit(trace, endpoint, config);
            FAIL("expected ExportSendFailed");
        } catch (const conversion::Error& e) {
            REQUIRE(e.kind() == conversion::ErrorKind::ExportSendFailed);
        }
    }

    fs::remove_all(tmp_dir);
}
