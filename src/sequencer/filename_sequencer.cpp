#include "filename_sequencer.hpp"
#include "conversion_error.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace filename_sequencer {

std::vector<std::string> discover_traces(const std::string& input_dir, const std::string& extension) {
    std::error_code ec;
    if (!fs::is_directory(input_dir, ec)) {
        throw conversion::Error(conversion::ErrorKind::InputDiscoveryFailed,
                                "Input '" + input_dir + "' is not a directory");
    }

    std::vector<std::string> files;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(input_dir)) {
            if (!entry.is_regular_file()) continue;
            if (!extension.empty() && entry.path().extension() != extension) continue;
            files.push_back(entry.path().string());
        }
    } catch (const fs::filesystem_error& e) {
        throw conversion::Error(conversion::ErrorKind::InputDiscoveryFailed,
                                "Could not scan '" + input_dir + "': " + e.what());
    }
    return files;
}

uint64_t extract_sort_key(const std::string& path, const SequencerConfig& config) {
    if (config.key_field == 0) {
        throw conversion::Error(conversion::ErrorKind::MalformedInputName, "Sort key field index must be 1 or greater");
    }

    std::vector<std::string> fields;
    std::stringstream ss(path);
    std::string field;
    while (std::getline(ss, field, config.delimiter)) {
        fields.push_back(field);
    }
    if (fields.size() < config.key_field) {
        std::ostringstream msg;
        msg << "'" << path << "' has " << fields.size() << " '" << config.delimiter
            << "'-separated fields, sort key needs field " << config.key_field;
        throw conversion::Error(conversion::ErrorKind::MalformedInputName, msg.str());
    }

    const std::string& key = fields[config.key_field - 1];
    if (key.empty() || !std::isdigit(static_cast<unsigned char>(key[0]))) {
        throw conversion::Error(conversion::ErrorKind::MalformedInputName,
                                "'" + path + "': field " + std::to_string(config.key_field) +
                                " ('" + key + "') does not start with a number");
    }

    uint64_t value = 0;
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    for (size_t i = 0; i < key.size() && std::isdigit(static_cast<unsigned char>(key[i])); ++i) {
        uint64_t digit = static_cast<uint64_t>(key[i] - '0');
        if (value > (max - digit) / 10) {
            throw conversion::Error(conversion::ErrorKind::MalformedInputName,
                                    "'" + path + "': sort key '" + key + "' is out of range");
        }
        value = value * 10 + digit;
    }
    return value;
}

std::string trace_basename(const std::string& path) {
    return fs::path(path).stem().string();
}

std::vector<InputTrace> sequence(const std::vector<std::string>& paths, const SequencerConfig& config) {
    std::vector<InputTrace> traces;
    traces.reserve(paths.size());
    for (const auto& path : paths) {
        traces.push_back({path, extract_sort_key(path, config), trace_basename(path)});
    }
    // Equal keys fall back to the path so the result never depends on discovery order.
    std::sort(traces.begin(), traces.end(), [](const InputTrace& a, const InputTrace& b) {
        if (a.sort_key != b.sort_key) return a.sort_key < b.sort_key;
        return a.path < b.path;
    });
    return traces;
}

} // namespace filename_sequencer
