//! # Batch Executor
//!
//! Applies the dispatcher to many files over a bounded pool of worker
//! threads.
//!
//! ## Components
//!
//! | Type            | Description                                  |
//! |-----------------|----------------------------------------------|
//! | `CancelToken`   | Run-level stop request, checked between files |
//! | `BatchCounters` | Atomic outcome counters shared by workers    |
//! | `RunStats`      | Merged result of one run                     |
//! | `BatchExecutor` | Owns the worker pool for one run at a time   |
//!
//! One file's failure never stops the run. Outcomes are merged
//! commutatively, so the result does not depend on scheduling; failures are
//! reported sorted by path.

#ifndef POLYFMT_BATCH_BATCH_EXECUTOR_HPP
#define POLYFMT_BATCH_BATCH_EXECUTOR_HPP

#include "dispatch/dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace polyfmt::batch {

/// Cooperative cancellation shared between the caller and the workers.
class CancelToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] auto is_cancelled() const -> bool {
        return cancelled_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

struct FileFailure {
    fs::path path;
    backend::FormatError error;
};

/// Outcome counters updated by every worker.
struct BatchCounters {
    std::atomic<size_t> formatted{0};
    std::atomic<size_t> unchanged{0};
    std::atomic<size_t> failed{0};
    std::chrono::steady_clock::time_point start_time;

    void reset() {
        formatted = 0;
        unchanged = 0;
        failed = 0;
        start_time = std::chrono::steady_clock::now();
    }

    [[nodiscard]] auto elapsed_ms() const -> int64_t {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
    }
};

struct RunStats {
    size_t formatted = 0;
    size_t unchanged = 0;
    size_t failed = 0;
    /// Files skipped because the run was cancelled.
    size_t skipped = 0;
    bool cancelled = false;
    int64_t elapsed_ms = 0;
    /// Sorted by path; empty unless failures are collected.
    std::vector<FileFailure> failures;
    /// Files that were (or in check mode would be) rewritten, sorted.
    std::vector<fs::path> changed;

    [[nodiscard]] auto processed() const -> size_t { return formatted + unchanged + failed; }
};

/// Persists a formatted file. Returns the number of bytes written or an error.
using WriteBack = std::function<Result<size_t, std::string>(const fs::path&, std::string_view)>;

/// Called once per finished file, serialized across workers.
using OutcomeObserver = std::function<void(const fs::path&, const dispatch::FormatOutcome&)>;

struct BatchOptions {
    /// Worker count; 0 means hardware concurrency.
    size_t jobs = 0;
    /// Report `Formatted` outcomes without writing.
    bool check = false;
    bool collect_failures = true;
    /// Defaults to `write_file` when empty.
    WriteBack write_back;
    OutcomeObserver observer;
    const CancelToken* cancel = nullptr;
};

/// Overwrites `path` with `content`.
[[nodiscard]] auto write_file(const fs::path& path, std::string_view content)
    -> Result<size_t, std::string>;

/// Resolves a requested worker count, 0 meaning hardware concurrency.
[[nodiscard]] auto effective_jobs(size_t requested) -> size_t;

class BatchExecutor {
public:
    BatchExecutor(const dispatch::Dispatcher& dispatcher, BatchOptions options);

    /// Formats every path and returns the merged statistics.
    auto run(const std::vector<fs::path>& paths, const config::FormatConfig& config) -> RunStats;

    [[nodiscard]] auto options() const -> const BatchOptions& { return options_; }

private:
    void worker(const std::vector<fs::path>& paths, const config::FormatConfig& config);
    void process(const fs::path& path, const config::FormatConfig& config);
    void record_failure(const fs::path& path, backend::FormatError error);

    const dispatch::Dispatcher& dispatcher_;
    BatchOptions options_;

    std::atomic<size_t> next_{0};
    BatchCounters counters_;
    std::mutex results_mutex_;
    std::vector<FileFailure> failures_;
    std::vector<fs::path> changed_;
};

} // namespace polyfmt::batch

#endif // POLYFMT_BATCH_BATCH_EXECUTOR_HPP
