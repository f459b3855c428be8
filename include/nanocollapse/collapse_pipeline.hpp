#pragma once
/**
 * @file collapse_pipeline.hpp
 * @brief Streaming reader -> workers -> writer pipeline
 *
 * Threads:
 * - 1 reader: EventalignReader, pushes ReadGroups on the work queue
 * - N workers: ReadCollapser, push CollapsedReads on the result queue
 * - 1 writer: CollapseWriter, drains the result queue
 *
 * Both queues are bounded. End of input travels through the queues as one
 * empty item per worker: the reader sends N markers, each worker forwards
 * the one it receives, and the writer stops after counting N. Results are
 * written in arrival order, so read order in the output is not input order.
 *
 * Faults and completion are reported on a PipelineSignal. The coordinator
 * (run()) waits on it, cancels every stage on the first fault and rethrows
 * that fault once all threads have joined.
 */

#include "nanocollapse/bounded_queue.hpp"
#include "nanocollapse/collapse.hpp"
#include "nanocollapse/eventalign.hpp"
#include "nanocollapse/log_utils.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nanocollapse {

constexpr size_t DEFAULT_QUEUE_CAPACITY = 1000;
constexpr int MIN_THREADS = 3;  // reader + writer + at least one worker

struct OutputPaths {
    std::string data;   // <outdir>/<prefix>_eventalign_collapse.tsv
    std::string index;  // data + ".idx"
    std::string log;    // <outdir>/<prefix>_eventalign_collapse.log
};

OutputPaths make_output_paths(const std::string& outdir, const std::string& prefix);

struct PipelineConfig {
    std::vector<std::string> inputs;  // empty or "-" = stdin
    OutputPaths outputs;
    size_t max_reads = 0;             // 0 = unlimited
    int threads = 4;                  // total, including reader and writer
    size_t queue_capacity = DEFAULT_QUEUE_CAPACITY;
    CollapseOptions collapse;
    log_utils::Verbosity verbosity = log_utils::Verbosity::NORMAL;

    // Throws InvalidConfig.
    void validate() const;

    size_t worker_count() const { return threads > 2 ? static_cast<size_t>(threads - 2) : 0; }
};

struct RunStats {
    uint64_t reads = 0;
    uint64_t bytes = 0;
    int64_t elapsed_ms = 0;
};

/**
 * @brief Fault and completion signals shared by all stages
 *
 * Only the first reported fault is kept. wait() returns as soon as either a
 * fault or completion has been reported, fault first.
 */
class PipelineSignal {
public:
    void report_error(std::exception_ptr error);
    void report_done();

    bool failed() const;
    std::exception_ptr error() const;

    // Blocks until a fault or completion. Returns the fault, or nullptr.
    std::exception_ptr wait();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::exception_ptr error_ = nullptr;
    bool done_ = false;
};

class CollapsePipeline {
public:
    explicit CollapsePipeline(PipelineConfig config);

    CollapsePipeline(const CollapsePipeline&) = delete;
    CollapsePipeline& operator=(const CollapsePipeline&) = delete;

    // Validates the configuration, runs all stages and returns once the
    // writer is done. Rethrows the first stage fault.
    RunStats run();

private:
    using WorkItem = std::optional<ReadGroup>;        // nullopt = end marker
    using ResultItem = std::optional<CollapsedRead>;  // nullopt = end marker

    void reader_stage();
    void worker_stage(size_t worker_id);
    void writer_stage();
    void cancel();
    bool verbose() const;

    PipelineConfig config_;
    BoundedQueue<WorkItem> work_;
    BoundedQueue<ResultItem> results_;
    PipelineSignal signal_;
    std::atomic<bool> stop_{false};
    RunStats stats_;
};

// Validates, runs and returns the run statistics.
RunStats run_collapse(const PipelineConfig& config);

}  // namespace nanocollapse
