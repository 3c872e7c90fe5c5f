//! # Test Support
//!
//! Shared helpers: an in-memory log sink, a scoped capture that routes the
//! global logger into it, and a temporary directory that removes itself.

#ifndef POLYFMT_TESTS_TEST_SUPPORT_HPP
#define POLYFMT_TESTS_TEST_SUPPORT_HPP

#include "log/log.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace polyfmt::test {

namespace fs = std::filesystem;

class CaptureSink : public log::LogSink {
public:
    struct Entry {
        log::LogLevel level;
        std::string module;
        std::string message;
    };

    void write(const log::LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    auto records() const -> std::vector<Entry> {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    /// Records at `level` from `module` whose message contains `needle`.
    auto count(log::LogLevel level, std::string_view module, std::string_view needle = {}) const
        -> size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& entry : records_) {
            if (entry.level == level && entry.module == module &&
                entry.message.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> records_;
};

/// Sends every log record to a `CaptureSink` until destroyed, then restores
/// the default console sink at Warn.
class ScopedLogCapture {
public:
    explicit ScopedLogCapture(log::LogLevel level = log::LogLevel::Trace) {
        auto& logger = log::Logger::instance();
        auto sink = std::make_unique<CaptureSink>();
        sink_ = sink.get();
        logger.clear_sinks();
        logger.add_sink(std::move(sink));
        logger.set_level(level);
    }

    ~ScopedLogCapture() {
        log::LogConfig config;
        config.colors = false;
        log::Logger::init(config);
    }

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    auto sink() const -> const CaptureSink& { return *sink_; }

private:
    CaptureSink* sink_;
};

/// A fresh directory under the system temp directory.
class TempDir {
public:
    explicit TempDir(std::string_view prefix) {
        static std::atomic<unsigned> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                (std::string(prefix) + "_" + std::to_string(stamp) + "_" +
                 std::to_string(counter.fetch_add(1)));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    auto path() const -> const fs::path& { return path_; }

    auto write(const fs::path& relative, std::string_view content) const -> fs::path {
        fs::path target = path_ / relative;
        fs::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return target;
    }

    static auto read(const fs::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

private:
    fs::path path_;
};

} // namespace polyfmt::test

#endif // POLYFMT_TESTS_TEST_SUPPORT_HPP
