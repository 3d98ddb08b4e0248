#ifndef FILENAME_SEQUENCER_HPP
#define FILENAME_SEQUENCER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace filename_sequencer {

struct SequencerConfig {
    char delimiter = '_';  // path is split on this character
    size_t key_field = 3;  // 1-based field holding the numeric sort key
};

struct InputTrace {
    std::string path;      // as discovered
    uint64_t sort_key;     // leading digits of the key field
    std::string basename;  // file name without its last extension
};

std::vector<std::string> discover_traces(const std::string& input_dir, const std::string& extension);
uint64_t extract_sort_key(const std::string& path, const SequencerConfig& config);
std::string trace_basename(const std::string& path);
std::vector<InputTrace> sequence(const std::vector<std::string>& paths, const SequencerConfig& config);

} // namespace filename_sequencer

#endif // FILENAME_SEQUENCER_HPP
