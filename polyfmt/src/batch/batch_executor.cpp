//! # Batch Executor Implementation
//!
//! ## Work Distribution
//!
//! ```text
//! paths ─┬─ worker 0 ─┐
//!        ├─ worker 1 ─┼─→ atomic counters + failure list → RunStats
//!        └─ worker N ─┘
//! ```
//!
//! Workers claim the next index with an atomic increment, so no queue is
//! needed for a fixed file list. The cancel token is read before each claim.

#include "batch/batch_executor.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <fstream>
#include <thread>

namespace polyfmt::batch {

using dispatch::OutcomeKind;

auto write_file(const fs::path& path, std::string_view content) -> Result<size_t, std::string> {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return "cannot open " + path.string() + " for writing";
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        return "write error on " + path.string();
    }
    return content.size();
}

auto effective_jobs(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    unsigned hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 1;
}

BatchExecutor::BatchExecutor(const dispatch::Dispatcher& dispatcher, BatchOptions options)
    : dispatcher_(dispatcher), options_(std::move(options)) {
    if (!options_.write_back) {
        options_.write_back = write_file;
    }
}

auto BatchExecutor::run(const std::vector<fs::path>& paths, const config::FormatConfig& config)
    -> RunStats {
    next_ = 0;
    counters_.reset();
    failures_.clear();
    changed_.clear();

    const size_t threads = std::min(effective_jobs(options_.jobs), std::max<size_t>(paths.size(), 1));
    POLYFMT_LOG_INFO("batch", "formatting " << paths.size() << " files on " << threads
                                            << " workers" << (options_.check ? " (check)" : ""));

    if (threads == 1) {
        worker(paths, config);
    } else {
        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            workers.emplace_back(&BatchExecutor::worker, this, std::cref(paths), std::cref(config));
        }
        for (auto& thread : workers) {
            thread.join();
        }
    }

    RunStats stats;
    stats.formatted = counters_.formatted;
    stats.unchanged = counters_.unchanged;
    stats.failed = counters_.failed;
    stats.skipped = paths.size() - stats.processed();
    stats.cancelled = options_.cancel && options_.cancel->is_cancelled() && stats.skipped > 0;
    stats.elapsed_ms = counters_.elapsed_ms();

    std::sort(failures_.begin(), failures_.end(),
              [](const FileFailure& a, const FileFailure& b) { return a.path < b.path; });
    std::sort(changed_.begin(), changed_.end());
    stats.failures = std::move(failures_);
    stats.changed = std::move(changed_);
    failures_.clear();
    changed_.clear();

    POLYFMT_LOG_INFO("batch", "done in " << stats.elapsed_ms << " ms: " << stats.formatted
                                         << " formatted, " << stats.unchanged << " unchanged, "
                                         << stats.failed << " failed");
    if (stats.cancelled) {
        POLYFMT_LOG_WARN("batch", "run cancelled, " << stats.skipped << " files skipped");
    }
    return stats;
}

void BatchExecutor::worker(const std::vector<fs::path>& paths,
                           const config::FormatConfig& config) {
    while (true) {
        if (options_.cancel && options_.cancel->is_cancelled()) {
            break;
        }
        size_t index = next_.fetch_add(1);
        if (index >= paths.size()) {
            break;
        }
        process(paths[index], config);
    }
}

void BatchExecutor::process(const fs::path& path, const config::FormatConfig& config) {
    const auto type = registry::detect_file_type(path.string());
    auto outcome = dispatcher_.dispatch(path, type, config);

    if (outcome.kind == OutcomeKind::Formatted && !options_.check) {
        auto written = options_.write_back(path, outcome.text);
        if (is_err(written)) {
            outcome = dispatch::FormatOutcome::failed(
                backend::FormatError::make(backend::ErrorKind::Io, unwrap_err(written)));
        }
    }

    switch (outcome.kind) {
    case OutcomeKind::Formatted:
        counters_.formatted++;
        {
            std::lock_guard<std::mutex> lock(results_mutex_);
            changed_.push_back(path);
        }
        break;
    case OutcomeKind::Unchanged:
        counters_.unchanged++;
        break;
    case OutcomeKind::Failed:
        counters_.failed++;
        record_failure(path, *outcome.error);
        break;
    }

    if (options_.observer) {
        std::lock_guard<std::mutex> lock(results_mutex_);
        options_.observer(path, outcome);
    }
}

void BatchExecutor::record_failure(const fs::path& path, backend::FormatError error) {
    POLYFMT_LOG_DEBUG("batch", path.string() << ": " << error.to_string());
    if (!options_.collect_failures) {
        return;
    }
    std::lock_guard<std::mutex> lock(results_mutex_);
    failures_.push_back(FileFailure{path, std::move(error)});
}

} // namespace polyfmt::batch
