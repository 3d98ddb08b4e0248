#ifndef BATCH_ORCHESTRATOR_HPP
#define BATCH_ORCHESTRATOR_HPP

#include <atomic>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>
#include "batch_config.hpp"
#include "conversion_error.hpp"
#include "filename_sequencer.hpp"

namespace batch_pipeline {

enum class BatchState { Idle, Sequencing, MergedRun, PerInputRun, Finalizing, Done, Failed };

const char* to_string(BatchState state);

struct UnitResult {
    std::string unit;       // trace basename, or the merged file name
    std::string flow_file;
    size_t record_count = 0;
};

struct BatchFailure {
    std::string unit;       // empty when the batch failed before any unit started
    conversion::ErrorKind kind = conversion::ErrorKind::Cancelled;
    std::string message;
};

struct BatchReport {
    BatchState state = BatchState::Idle;
    std::vector<UnitResult> completed;
    bool failed = false;
    BatchFailure failure;
};

void print_report(const BatchReport& report, std::ostream& os);

// Drives sequencing, one or more capture sessions and normalization for a
// batch of traces. Only one collector is ever running; the scratch directory
// is drained after each unit and removed when the batch ends.
class BatchOrchestrator {
public:
    explicit BatchOrchestrator(const BatchConfig& config);

    BatchReport run();
    BatchReport run(const std::vector<std::string>& trace_paths);

    // Safe to call from a signal handler or another thread. Applies to the
    // current run, or to the next one when no run is in progress; the flag
    // is cleared when that run returns.
    void cancel() { cancelled_ = true; }
    BatchState state() const { return state_; }

private:
    BatchConfig config_;
    BatchState state_ = BatchState::Idle;
    std::atomic<bool> cancelled_{false};
    std::string current_unit_;
    bool scratch_prepared_ = false;

    BatchReport execute(const std::vector<std::string>* trace_paths);
    void transition(BatchState next);
    void check_cancelled() const;
    void prepare_directories();
    void run_merged(const std::vector<filename_sequencer::InputTrace>& traces, BatchReport& report);
    void run_per_input(const std::vector<filename_sequencer::InputTrace>& traces, BatchReport& report);
    UnitResult convert_unit(const std::vector<filename_sequencer::InputTrace>& traces,
                            const std::string& unit, const std::string& output_file);
    void drain_scratch();
    void finalize();
    void fail(BatchReport& report, conversion::ErrorKind kind, const std::string& message);
    void cleanup_after_failure();
};

} // namespace batch_pipeline

#endif // BATCH_ORCHESTRATOR_HPP
