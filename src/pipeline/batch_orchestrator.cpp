#include "batch_orchestrator.hpp"
#include "capture_session.hpp"
#include "record_normalizer.hpp"
#include "trace_transmitter.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace batch_pipeline {

const char* to_string(BatchState state) {
    switch (state) {
        case BatchState::Idle:        return "Idle";
        case BatchState::Sequencing:  return "Sequencing";
        case BatchState::MergedRun:   return "MergedRun";
        case BatchState::PerInputRun: return "PerInputRun";
        case BatchState::Finalizing:  return "Finalizing";
        case BatchState::Done:        return "Done";
        case BatchState::Failed:      return "Failed";
    }
    return "Unknown";
}

void print_report(const BatchReport& report, std::ostream& os) {
    os << "Batch finished: " << to_string(report.state) << "\n";
    os << "  Completed units: " << report.completed.size() << "\n";
    for (const auto& unit : report.completed) {
        os << "    - " << unit.unit << " -> " << unit.flow_file << " (" << unit.record_count << " records)\n";
    }
    if (report.failed) {
        os << "  Failed on: " << (report.failure.unit.empty() ? "<batch>" : report.failure.unit)
           << " (" << conversion::to_string(report.failure.kind) << "): " << report.failure.message << "\n";
    }
}

static fs::path resolved(const fs::path& p) {
    std::error_code ec;
    fs::path r = fs::weakly_canonical(fs::absolute(p), ec);
    if (ec) r = fs::absolute(p).lexically_normal();
    if (!r.has_filename()) r = r.parent_path();
    return r;
}

// True when `inner` is `outer` or lies somewhere below it.
static bool path_within(const fs::path& inner, const fs::path& outer) {
    fs::path a = resolved(inner);
    fs::path b = resolved(outer);
    auto mismatch = std::mismatch(b.begin(), b.end(), a.begin(), a.end());
    return mismatch.first == b.end();
}

BatchOrchestrator::BatchOrchestrator(const BatchConfig& config)
    : config_(config) {
    config_.session.verbose = config_.session.verbose || config_.verbose;
    config_.transmit.verbose = config_.transmit.verbose || config_.verbose;
}

BatchReport BatchOrchestrator::run() {
    return execute(nullptr);
}

BatchReport BatchOrchestrator::run(const std::vector<std::string>& trace_paths) {
    return execute(&trace_paths);
}

BatchReport BatchOrchestrator::execute(const std::vector<std::string>* trace_paths) {
    BatchReport report;
    state_ = BatchState::Idle;
    current_unit_.clear();
    scratch_prepared_ = false;

    transition(BatchState::Sequencing);
    std::vector<filename_sequencer::InputTrace> sequenced;
    try {
        sequenced = filename_sequencer::sequence(
            trace_paths ? *trace_paths : filename_sequencer::discover_traces(config_.input_dir, config_.trace_extension),
            config_.sequencer);
        if (!config_.merge_all) {
            std::set<std::string> outputs;
            for (const auto& trace : sequenced) {
                if (!outputs.insert(config_.flow_file_path(trace)).second) {
                    throw conversion::Error(conversion::ErrorKind::MalformedInputName,
                                            "More than one trace maps to " + config_.flow_file_path(trace));
                }
            }
        }
    } catch (const conversion::Error& e) {
        fail(report, e.kind(), e.what());
        cancelled_ = false;
        return report;
    }

    const std::vector<filename_sequencer::InputTrace> traces = std::move(sequenced);
    std::cout << "[batch_orchestrator] Sequenced " << traces.size() << " trace(s)\n";
    if (config_.verbose) {
        for (const auto& trace : traces) {
            std::cout << "[batch_orchestrator]   " << trace.sort_key << "  " << trace.path << "\n";
        }
    }

    try {
        if (traces.empty()) {
            transition(config_.merge_all ? BatchState::MergedRun : BatchState::PerInputRun);
            if (!config_.merge_all) fs::create_directories(config_.output_dir);
            transition(BatchState::Finalizing);
        } else {
            prepare_directories();
            if (config_.merge_all) {
                transition(BatchState::MergedRun);
                run_merged(traces, report);
            } else {
                transition(BatchState::PerInputRun);
                run_per_input(traces, report);
            }
            transition(BatchState::Finalizing);
            finalize();
        }
        transition(BatchState::Done);
    } catch (const conversion::Error& e) {
        // A Ctrl-C also reaches the exporter, which then fails; report the cancellation.
        if (cancelled_ && e.kind() != conversion::ErrorKind::Cancelled) {
            fail(report, conversion::ErrorKind::Cancelled, std::string("Batch cancelled: ") + e.what());
        } else {
            fail(report, e.kind(), e.what());
        }
        cleanup_after_failure();
    } catch (const fs::filesystem_error& e) {
        fail(report, conversion::ErrorKind::ScratchIoFailed, e.what());
        cleanup_after_failure();
    } catch (const std::exception& e) {
        // Tool launches are mapped to their kinds below this level; what is left
        // concerns the collector process (session misuse, waitpid failure).
        fail(report, cancelled_ ? conversion::ErrorKind::Cancelled : conversion::ErrorKind::CollectorSpawnFailed,
             e.what());
        cleanup_after_failure();
    }

    report.state = state_;
    cancelled_ = false;
    return report;
}

void BatchOrchestrator::transition(BatchState next) {
    if (config_.verbose) {
        std::cout << "[batch_orchestrator] " << to_string(state_) << " -> " << to_string(next) << "\n";
    }
    state_ = next;
}

void BatchOrchestrator::check_cancelled() const {
    if (cancelled_) {
        throw conversion::Error(conversion::ErrorKind::Cancelled, "Batch cancelled");
    }
}

void BatchOrchestrator::prepare_directories() {
    if (path_within(config_.output_dir, config_.scratch_dir)) {
        throw conversion::Error(conversion::ErrorKind::ScratchIoFailed,
                                "Output directory '" + config_.output_dir + "' lies inside scratch directory '" +
                                config_.scratch_dir + "'");
    }
    if (!config_.input_dir.empty() && path_within(config_.input_dir, config_.scratch_dir)) {
        throw conversion::Error(conversion::ErrorKind::ScratchIoFailed,
                                "Input directory '" + config_.input_dir + "' lies inside scratch directory '" +
                                config_.scratch_dir + "'");
    }

    std::error_code ec;
    fs::create_directories(config_.output_dir, ec);
    if (ec) {
        throw conversion::Error(conversion::ErrorKind::OutputWriteFailed,
                                "Could not create output directory '" + config_.output_dir + "': " + ec.message());
    }
    fs::create_directories(config_.scratch_dir, ec);
    if (ec) {
        throw conversion::Error(conversion::ErrorKind::ScratchIoFailed,
                                "Could not create scratch directory '" + config_.scratch_dir + "': " + ec.message());
    }
    scratch_prepared_ = true;

    if (!fs::is_empty(config_.scratch_dir)) {
        std::cerr << "[batch_orchestrator] Warning: scratch directory " << config_.scratch_dir
                  << " is not empty, erasing its contents\n";
        drain_scratch();
    }
}

void BatchOrchestrator::run_merged(const std::vector<filename_sequencer::InputTrace>& traces, BatchReport& report) {
    const std::string output_file = config_.merged_output_path();
    std::cout << "[batch_orchestrator] Merging " << traces.size() << " trace(s) into " << output_file << "\n";
    report.completed.push_back(convert_unit(traces, config_.merged_filename, output_file));
}

void BatchOrchestrator::run_per_input(const std::vector<filename_sequencer::InputTrace>& traces, BatchReport& report) {
    for (size_t i = 0; i < traces.size(); ++i) {
        const auto& trace = traces[i];
        std::cout << "[batch_orchestrator] (" << (i + 1) << "/" << traces.size() << ") Converting " << trace.path << "\n";
        report.completed.push_back(convert_unit({trace}, trace.basename, config_.flow_file_path(trace)));
    }
}

UnitResult BatchOrchestrator::convert_unit(const std::vector<filename_sequencer::InputTrace>& traces,
                                           const std::string& unit, const std::string& output_file) {
    current_unit_ = unit;
    check_cancelled();

    {
        // The session stops its collector on every way out of this scope.
        capture_session::CaptureSession session(config_.session);
        session.start(config_.endpoint, config_.scratch_dir);
        for (const auto& trace : traces) {
            check_cancelled();
            trace_transmitter::transmit(trace.path, config_.endpoint, config_.transmit);
        }
        session.stop();
    }

    record_normalizer::NormalizerConfig normalizer_config;
    normalizer_config.scratch_dir = config_.scratch_dir;
    normalizer_config.output_file = output_file;
    normalizer_config.dump_tool = config_.dump_tool;
    normalizer_config.verbose = config_.verbose;
    record_normalizer::RecordNormalizer normalizer(normalizer_config);
    normalizer.normalize();

    try {
        drain_scratch();
    } catch (const conversion::Error&) {
        std::error_code ec;
        fs::remove(output_file, ec);
        throw;
    }

    current_unit_.clear();
    return {unit, output_file, normalizer.records().size()};
}

void BatchOrchestrator::drain_scratch() {
    try {
        for (const auto& entry : fs::directory_iterator(config_.scratch_dir)) {
            fs::remove_all(entry.path());
        }
    } catch (const fs::filesystem_error& e) {
        throw conversion::Error(conversion::ErrorKind::ScratchIoFailed,
                                "Could not drain scratch directory '" + config_.scratch_dir + "': " + e.what());
    }
}

void BatchOrchestrator::finalize() {
    std::error_code ec;
    fs::remove(config_.scratch_dir, ec);
    if (ec) {
        throw conversion::Error(conversion::ErrorKind::ScratchIoFailed,
                                "Could not remove scratch directory '" + config_.scratch_dir + "': " + ec.message());
    }
    scratch_prepared_ = false;
}

void BatchOrchestrator::fail(BatchReport& report, conversion::ErrorKind kind, const std::string& message) {
    report.failed = true;
    report.failure = {current_unit_, kind, message};
    std::cerr << "[batch_orchestrator] Error (" << conversion::to_string(kind) << ")";
    if (!current_unit_.empty()) std::cerr << " on " << current_unit_;
    std::cerr << ": " << message << "\n";
    transition(BatchState::Failed);
    report.state = state_;
}

// Best effort: problems here are logged, the original error is what the batch reports.
void BatchOrchestrator::cleanup_after_failure() {
    if (!scratch_prepared_) return;
    try {
        drain_scratch();
    } catch (const conversion::Error& e) {
        std::cerr << "[batch_orchestrator] Warning: " << e.what() << "\n";
        return;
    }
    std::error_code ec;
    fs::remove(config_.scratch_dir, ec);
    if (ec) {
        std::cerr << "[batch_orchestrator] Warning: could not remove scratch directory " << config_.scratch_dir
                  << ": " << ec.message() << "\n";
    }
    scratch_prepared_ = false;
}

} // namespace batch_pipeline
