/**
 * @file output_capture.hpp
 * @brief Ordered capture of console output produced by a snippet
 *
 * Console calls inside the sandbox are turned into LogEntry records with
 * strictly increasing sequence numbers and forwarded to a LogSink. The sink
 * decides where entries go: an in-memory buffer when the runtime runs on a
 * thread of the host, or the result pipe when it runs in a worker process.
 *
 * Capture never alters the snippet's control flow. Once a limit is reached,
 * further calls are dropped and counted, and the console method still returns
 * `undefined`.
 *
 * @date 2025
 */

#pragma once

#include "evalbox/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace evalbox {
namespace monitors {

/**
 * @class LogSink
 * @brief Destination for captured log entries
 */
class LogSink {
public:
    virtual ~LogSink() = default;

    /**
     * @brief Accept one entry, in sequence order
     */
    virtual void Emit(const core::LogEntry& entry) = 0;
};

/**
 * @class BufferedLogSink
 * @brief Keeps entries in memory
 */
class BufferedLogSink : public LogSink {
public:
    void Emit(const core::LogEntry& entry) override;

    const std::vector<core::LogEntry>& Entries() const { return entries_; }

    /**
     * @brief Move the collected entries out, leaving the sink empty
     */
    std::vector<core::LogEntry> TakeEntries();

private:
    std::vector<core::LogEntry> entries_;
};

/**
 * @class OutputCapture
 * @brief Assigns sequence numbers and enforces capture limits
 *
 * **Thread Safety**: NOT thread-safe. One instance per evaluation, used
 * from the thread running the snippet.
 *
 * **Usage Example**:
 * @code
 * BufferedLogSink sink;
 * OutputCapture capture(OutputCapture::Limits{}, sink);
 * capture.Record(LogKind::LOG, {Json("hello")});
 * auto entries = sink.TakeEntries();
 * @endcode
 */
class OutputCapture {
public:
    /**
     * @struct Limits
     * @brief Capture bounds
     */
    struct Limits {
        std::size_t max_entries{1000};          ///< Entries kept per evaluation
        std::size_t max_bytes{1024 * 1024};     ///< Serialized argument bytes kept
    };

    OutputCapture(const Limits& limits, LogSink& sink);

    OutputCapture(const OutputCapture&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;

    /**
     * @brief Record one console call
     * @param kind Console method
     * @param arguments Converted arguments
     * @return false if the entry was dropped because a limit was reached
     */
    bool Record(core::LogKind kind, std::vector<core::Json> arguments);

    std::size_t Count() const { return count_; }
    std::size_t DroppedCount() const { return dropped_; }
    std::size_t Bytes() const { return bytes_; }

    /**
     * @brief Sequence number the next recorded entry will get
     */
    std::uint64_t NextSequence() const { return next_sequence_; }

private:
    Limits limits_;
    LogSink& sink_;
    std::uint64_t next_sequence_{0};
    std::size_t count_{0};
    std::size_t dropped_{0};
    std::size_t bytes_{0};
};

} // namespace monitors
} // namespace evalbox
