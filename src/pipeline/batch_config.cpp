#include "batch_config.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace fs = std::filesystem;

namespace batch_pipeline {

std::string BatchConfig::merged_output_path() const {
    return (fs::path(output_dir) / merged_filename).string();
}

std::string BatchConfig::flow_file_path(const filename_sequencer::InputTrace& trace) const {
    return (fs::path(output_dir) / (trace.basename + output_extension)).string();
}

static json tool_to_json(const subprocess::ToolCommand& tool) {
    json j;
    j["binary"] = tool.binary;
    j["args"] = tool.args;
    return j;
}

static void tool_from_json(const json& j, subprocess::ToolCommand& tool) {
    if (j.contains("binary")) tool.binary = j["binary"].get<std::string>();
    if (j.contains("args")) tool.args = j["args"].get<std::vector<std::string>>();
}

BatchConfig load_config(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open file '" + file_path + "' for reading");
    }

    BatchConfig config;
    try {
        json j;
        in >> j;

        if (j.contains("input_dir")) config.input_dir = j["input_dir"].get<std::string>();
        if (j.contains("trace_extension")) config.trace_extension = j["trace_extension"].get<std::string>();
        if (j.contains("scratch_dir")) config.scratch_dir = j["scratch_dir"].get<std::string>();
        if (j.contains("output_dir")) config.output_dir = j["output_dir"].get<std::string>();
        if (j.contains("merge_all")) config.merge_all = j["merge_all"].get<bool>();
        if (j.contains("merged_filename")) config.merged_filename = j["merged_filename"].get<std::string>();
        if (j.contains("output_extension")) config.output_extension = j["output_extension"].get<std::string>();
        if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();

        if (j.contains("sequencer")) {
            const auto& seq = j["sequencer"];
            if (seq.contains("delimiter")) {
                std::string delimiter = seq["delimiter"].get<std::string>();
                if (delimiter.size() != 1) {
                    throw std::runtime_error("sequencer.delimiter must be a single character, got '" + delimiter + "'");
                }
                config.sequencer.delimiter = delimiter[0];
            }
            if (seq.contains("key_field")) config.sequencer.key_field = seq["key_field"].get<size_t>();
        }

        if (j.contains("endpoint")) {
            const auto& endpoint = j["endpoint"];
            if (endpoint.contains("host")) config.endpoint.host = endpoint["host"].get<std::string>();
            if (endpoint.contains("port")) config.endpoint.port = endpoint["port"].get<uint16_t>();
        }

        if (j.contains("export_version")) config.transmit.export_version = j["export_version"].get<int>();
        if (j.contains("probe_trace")) config.transmit.probe_trace = j["probe_trace"].get<bool>();

        if (j.contains("timing")) {
            const auto& timing = j["timing"];
            if (timing.contains("start_timeout_ms"))
                config.session.start_timeout = std::chrono::milliseconds(timing["start_timeout_ms"].get<long>());
            if (timing.contains("stop_timeout_ms"))
                config.session.stop_timeout = std::chrono::milliseconds(timing["stop_timeout_ms"].get<long>());
            if (timing.contains("poll_interval_ms"))
                config.session.poll_interval = std::chrono::milliseconds(timing["poll_interval_ms"].get<long>());
        }

        if (j.contains("tools")) {
            const auto& tools = j["tools"];
            if (tools.contains("collector")) tool_from_json(tools["collector"], config.session.collector);
            if (tools.contains("exporter")) tool_from_json(tools["exporter"], config.transmit.exporter);
            if (tools.contains("dump")) tool_from_json(tools["dump"], config.dump_tool);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Error parsing JSON configuration '" + file_path + "': " + e.what());
    }

    std::cout << "Configuration loaded from: " << file_path << "\n";
    return config;
}

void save_config(const BatchConfig& config, const std::string& file_path) {
    json j;
    j["input_dir"] = config.input_dir;
    j["trace_extension"] = config.trace_extension;
    j["scratch_dir"] = config.scratch_dir;
    j["output_dir"] = config.output_dir;
    j["merge_all"] = config.merge_all;
    j["merged_filename"] = config.merged_filename;
    j["output_extension"] = config.output_extension;
    j["verbose"] = config.verbose;
    j["sequencer"]["delimiter"] = std::string(1, config.sequencer.delimiter);
    j["sequencer"]["key_field"] = config.sequencer.key_field;
    j["endpoint"]["host"] = config.endpoint.host;
    j["endpoint"]["port"] = config.endpoint.port;
    j["export_version"] = config.transmit.export_version;
    j["probe_trace"] = config.transmit.probe_trace;
    j["timing"]["start_timeout_ms"] = config.session.start_timeout.count();
    j["timing"]["stop_timeout_ms"] = config.session.stop_timeout.count();
    j["timing"]["poll_interval_ms"] = config.session.poll_interval.count();
    j["tools"]["collector"] = tool_to_json(config.session.collector);
    j["tools"]["exporter"] = tool_to_json(config.transmit.exporter);
    j["tools"]["dump"] = tool_to_json(config.dump_tool);

    std::ofstream out(file_path);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open file '" + file_path + "' for writing");
    }
    out << j.dump(4);
    out.close();
    if (!out) {
        throw std::runtime_error("Could not write configuration to '" + file_path + "'");
    }
    std::cout << "Configuration saved to: " << file_path << "\n";
}

} // namespace batch_pipeline
