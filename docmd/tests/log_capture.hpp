//! # Log Capture Helper
//!
//! Routes the global logger into memory for the duration of a test.

#ifndef DOCMD_TESTS_LOG_CAPTURE_HPP
#define DOCMD_TESTS_LOG_CAPTURE_HPP

#include "log/log.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docmd::test_util {

/// Sink that stores records in memory.
class CaptureSink : public log::LogSink {
public:
    struct Entry {
        log::LogLevel level;
        std::string module;
        std::string message;
    };

    void write(const log::LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    /// Number of records from `module` whose message contains `needle`.
    size_t count(std::string_view module, std::string_view needle) const {
        size_t n = 0;
        for (const auto& r : records) {
            if (r.module == module && r.message.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    std::vector<Entry> records;
};

/// Installs a CaptureSink as the logger's only sink; restores a silent
/// logger on destruction.
class ScopedLogCapture {
public:
    explicit ScopedLogCapture(log::LogLevel level = log::LogLevel::Trace) {
        log::LogConfig config;
        config.console = false;
        config.level = level;
        log::Logger::init(config);

        auto sink = std::make_unique<CaptureSink>();
        sink_ = sink.get();
        log::Logger::instance().add_sink(std::move(sink));
    }

    ~ScopedLogCapture() {
        log::LogConfig config;
        config.console = false;
        log::Logger::init(config);
    }

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    const CaptureSink& sink() const {
        return *sink_;
    }

private:
    CaptureSink* sink_;
};

} // namespace docmd::test_util

#endif // DOCMD_TESTS_LOG_CAPTURE_HPP
