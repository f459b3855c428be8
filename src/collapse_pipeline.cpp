#include "nanocollapse/collapse_pipeline.hpp"
#include "nanocollapse/collapse_writer.hpp"
#include "nanocollapse/errors.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace nanocollapse {

OutputPaths make_output_paths(const std::string& outdir, const std::string& prefix) {
    const std::filesystem::path base =
        std::filesystem::path(outdir.empty() ? "." : outdir) / (prefix + "_eventalign_collapse");
    OutputPaths paths;
    paths.data = base.string() + ".tsv";
    paths.index = paths.data + ".idx";
    paths.log = base.string() + ".log";
    return paths;
}

void PipelineConfig::validate() const {
    if (threads < MIN_THREADS) {
        throw InvalidConfig("At least " + std::to_string(MIN_THREADS) +
                            " threads are required (reader, writer and one worker), got " +
                            std::to_string(threads));
    }
    if (queue_capacity == 0) {
        throw InvalidConfig("Queue capacity must be >= 1");
    }
    if (outputs.data.empty() || outputs.index.empty()) {
        throw InvalidConfig("No output file configured");
    }
    for (const auto& input : inputs) {
        if (input.empty()) throw InvalidConfig("Empty input path");
    }
    for (size_t i = 0; i < collapse.stat_fields.size(); ++i) {
        for (size_t j = i + 1; j < collapse.stat_fields.size(); ++j) {
            if (collapse.stat_fields[i] == collapse.stat_fields[j]) {
                throw InvalidConfig(std::string("Stat field '") +
                                    stat_field_name(collapse.stat_fields[i]) + "' listed twice");
            }
        }
    }
    if (collapse.samples_npoints > 0 && !collapse.write_samples) {
        throw InvalidConfig("Sample interpolation requires writing samples");
    }
}

// ============================================================================
// PipelineSignal
// ============================================================================

void PipelineSignal::report_error(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) error_ = error;
    }
    cv_.notify_all();
}

void PipelineSignal::report_done() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
    }
    cv_.notify_all();
}

bool PipelineSignal::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_ != nullptr;
}

std::exception_ptr PipelineSignal::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::exception_ptr PipelineSignal::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return error_ != nullptr || done_; });
    return error_;
}

// ============================================================================
// CollapsePipeline
// ============================================================================

CollapsePipeline::CollapsePipeline(PipelineConfig config)
    : config_(std::move(config)),
      work_(config_.queue_capacity),
      results_(config_.queue_capacity) {}

bool CollapsePipeline::verbose() const {
    return log_utils::enabled(config_.verbosity, log_utils::Verbosity::VERBOSE);
}

void CollapsePipeline::cancel() {
    stop_.store(true, std::memory_order_relaxed);
    work_.close();
    results_.close();
}

void CollapsePipeline::reader_stage() {
    const size_t n_workers = config_.worker_count();
    try {
        EventalignReader reader(config_.inputs, config_.max_reads);
        ReadGroup group;
        bool announced = false;
        while (!stop_.load(std::memory_order_relaxed) && reader.next(group)) {
            if (!announced && verbose()) {
                const OptionalColumns& opt = reader.layout().optional;
                std::cerr << "[reader] optional columns: start_idx/end_idx "
                          << (opt.signal_index ? "yes" : "no")
                          << ", samples " << (opt.samples ? "yes" : "no") << "\n";
                announced = true;
            }
            if (!work_.push(WorkItem(std::move(group)))) break;
            group = ReadGroup();
        }
        if (verbose()) {
            std::cerr << "[reader] " << reader.groups_emitted() << " read groups, "
                      << reader.lines_read() << " events from "
                      << reader.files_opened() << " input(s)\n";
        }
    } catch (...) {
        signal_.report_error(std::current_exception());
    }

    for (size_t i = 0; i < n_workers; ++i) {
        if (!work_.push(WorkItem())) break;  // closed: run cancelled
    }
}

void CollapsePipeline::worker_stage(size_t worker_id) {
    uint64_t collapsed = 0;
    try {
        ReadCollapser collapser(config_.collapse);
        WorkItem item;
        while (work_.pop(item)) {
            if (!item) break;
            CollapsedRead read = collapser.collapse(*item);
            item.reset();
            if (!results_.push(ResultItem(std::move(read)))) return;
            ++collapsed;
        }
    } catch (...) {
        signal_.report_error(std::current_exception());
    }

    if (verbose()) {
        std::ostringstream msg;
        msg << "[worker " << worker_id << "] collapsed " << collapsed << " reads\n";
        std::cerr << msg.str();
    }
    // Keeps the writer's marker count reachable even after a fault.
    if (!results_.push(ResultItem())) return;
}

void CollapsePipeline::writer_stage() {
    const auto t_start = std::chrono::steady_clock::now();
    const size_t n_workers = config_.worker_count();
    try {
        CollapseWriter writer(config_.outputs.data, config_.outputs.index);
        log_utils::ProgressLine progress("reads", 1000, verbose());

        size_t markers = 0;
        ResultItem item;
        while (markers < n_workers && results_.pop(item)) {
            if (!item) {
                ++markers;
                continue;
            }
            writer.write(*item);
            item.reset();
            progress.update(writer.reads_written());
        }
        progress.clear();

        if (markers == n_workers && !signal_.failed()) {
            writer.finish();

            const auto t_end = std::chrono::steady_clock::now();
            stats_.reads = writer.reads_written();
            stats_.bytes = writer.bytes_written();
            stats_.elapsed_ms = log_utils::elapsed_ms(t_start, t_end);

            std::ostringstream summary;
            summary << "[collapse] total reads: " << stats_.reads
                    << " [" << log_utils::format_rate(stats_.reads, stats_.elapsed_ms) << " reads/s]"
                    << " in " << log_utils::format_duration_ms(stats_.elapsed_ms) << "\n";

            if (log_utils::enabled(config_.verbosity, log_utils::Verbosity::NORMAL)) {
                std::cerr << summary.str();
            }
            if (!config_.outputs.log.empty()) {
                std::ofstream log(config_.outputs.log, std::ios::out | std::ios::trunc);
                log << summary.str()
                    << "data: " << config_.outputs.data << "\n"
                    << "index: " << config_.outputs.index << "\n"
                    << "bytes: " << stats_.bytes << "\n";
                if (!log) throw IOError("Cannot write log file: " + config_.outputs.log);
            }
        }
    } catch (...) {
        signal_.report_error(std::current_exception());
    }
    signal_.report_done();
}

RunStats CollapsePipeline::run() {
    config_.validate();

    const size_t n_workers = config_.worker_count();
    if (verbose()) {
        std::cerr << "Collapsing " << (config_.inputs.empty() ? 1 : config_.inputs.size())
                  << " input(s) with " << n_workers << " worker(s), queue capacity "
                  << work_.capacity() << "\n";
    }

    std::vector<std::thread> threads;
    threads.reserve(n_workers + 2);
    try {
        threads.emplace_back(&CollapsePipeline::reader_stage, this);
        for (size_t i = 0; i < n_workers; ++i) {
            threads.emplace_back(&CollapsePipeline::worker_stage, this, i);
        }
        threads.emplace_back(&CollapsePipeline::writer_stage, this);
    } catch (...) {
        signal_.report_error(std::current_exception());
    }

    std::exception_ptr error = signal_.wait();
    if (error) cancel();
    for (auto& t : threads) t.join();

    if (!error) error = signal_.error();
    if (error) std::rethrow_exception(error);
    return stats_;
}

RunStats run_collapse(const PipelineConfig& config) {
    CollapsePipeline pipeline(config);
    return pipeline.run();
}

}  // namespace nanocollapse
