#ifndef BATCH_CONFIG_HPP
#define BATCH_CONFIG_HPP

#include <string>
#include "capture_session.hpp"
#include "filename_sequencer.hpp"
#include "subprocess.hpp"
#include "trace_transmitter.hpp"
#include "record_normalizer.hpp"

namespace batch_pipeline {

struct BatchConfig {
    std::string input_dir;                      // scanned recursively for traces
    std::string trace_extension = ".pcap";      // empty keeps every file
    std::string scratch_dir = "nf-binary";      // all files here are erased
    std::string output_dir = ".";
    bool merge_all = false;                     // one FlowFile for the whole batch
    std::string merged_filename = "merged.nf";  // used only when merge_all is set
    std::string output_extension = ".nf";
    filename_sequencer::SequencerConfig sequencer;
    capture_session::Endpoint endpoint;
    capture_session::SessionConfig session;
    trace_transmitter::TransmitConfig transmit;
    subprocess::ToolCommand dump_tool = record_normalizer::NormalizerConfig{}.dump_tool;
    bool verbose = false;

    std::string merged_output_path() const;
    std::string flow_file_path(const filename_sequencer::InputTrace& trace) const;
};

// Keys absent from the document keep their defaults. Throws std::runtime_error.
BatchConfig load_config(const std::string& file_path);
void save_config(const BatchConfig& config, const std::string& file_path);

} // namespace batch_pipeline

#endif // BATCH_CONFIG_HPP
