#include "batch_config.hpp"
#include "batch_orchestrator.hpp"
#include "filename_sequencer.hpp"
#include "signal_registry.hpp"
#include <cxxopts.hpp>
#include <iostream>

using namespace batch_pipeline;

int main(int argc, char* argv[]) {
    cxxopts::Options options(argv[0], "Convert PCAP traces to sorted NetFlow record files");
    options.add_options()
        ("i,input", "Input directory, scanned recursively", cxxopts::value<std::string>())
        ("o,output", "Output directory", cxxopts::value<std::string>())
        ("s,scratch", "Scratch directory for collector files (erased!)", cxxopts::value<std::string>())
        ("m,merge", "Merge all traces into a single NetFlow file")
        ("merged-name", "File name of the merged NetFlow file", cxxopts::value<std::string>())
        ("e,extension", "Trace file extension, empty for all files", cxxopts::value<std::string>())
        ("host", "Collector host", cxxopts::value<std::string>())
        ("port", "Collector UDP port", cxxopts::value<uint16_t>())
        ("export-version", "NetFlow export version", cxxopts::value<int>())
        ("c,config", "JSON configuration file; command line options override it", cxxopts::value<std::string>())
        ("save-config", "Write the effective configuration to a JSON file", cxxopts::value<std::string>())
        ("l,list", "Print the sequenced trace order and exit")
        ("v,verbose", "Verbose output")
        ("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error parsing options: " << e.what() << "\n";
        return 1;
    }

    if (result.count("help")) {
        std::cout << options.help() << "\n";
        return 0;
    }

    BatchConfig config;
    if (result.count("config")) {
        try {
            config = load_config(result["config"].as<std::string>());
        } catch (const std::exception& e) {
            std::cerr << "Error loading configuration: " << e.what() << "\n";
            return 1;
        }
    }

    if (result.count("input")) config.input_dir = result["input"].as<std::string>();
    if (result.count("output")) config.output_dir = result["output"].as<std::string>();
    if (result.count("scratch")) config.scratch_dir = result["scratch"].as<std::string>();
    if (result.count("merge")) config.merge_all = true;
    if (result.count("merged-name")) config.merged_filename = result["merged-name"].as<std::string>();
    if (result.count("extension")) config.trace_extension = result["extension"].as<std::string>();
    if (result.count("host")) config.endpoint.host = result["host"].as<std::string>();
    if (result.count("port")) config.endpoint.port = result["port"].as<uint16_t>();
    if (result.count("export-version")) config.transmit.export_version = result["export-version"].as<int>();
    if (result.count("verbose")) config.verbose = true;

    if (result.count("save-config")) {
        try {
            save_config(config, result["save-config"].as<std::string>());
        } catch (const std::exception& e) {
            std::cerr << "Error saving configuration: " << e.what() << "\n";
            return 1;
        }
    }

    if (config.input_dir.empty()) {
        std::cerr << "Error: Input directory (-i) is required.\n";
        return 1;
    }

    if (result.count("list")) {
        try {
            auto traces = filename_sequencer::sequence(
                filename_sequencer::discover_traces(config.input_dir, config.trace_extension), config.sequencer);
            for (const auto& trace : traces) {
                std::cout << trace.sort_key << "\t" << trace.path << "\n";
            }
        } catch (const conversion::Error& e) {
            std::cerr << "Error (" << conversion::to_string(e.kind()) << "): " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

    std::cout << "Converting traces in " << config.input_dir << " to "
              << (config.merge_all ? config.merged_output_path() : config.output_dir) << "\n";

    BatchOrchestrator orchestrator(config);
    SignalRegistry<BatchOrchestrator>::registerInstance(&orchestrator);
    BatchReport report;
    try {
        report = orchestrator.run();
    } catch (const std::exception& e) {
        SignalRegistry<BatchOrchestrator>::unregisterInstance();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    SignalRegistry<BatchOrchestrator>::unregisterInstance();

    print_report(report, std::cout);
    return report.failed ? 1 : 0;
}
