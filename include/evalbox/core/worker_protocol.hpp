/**
 * @file worker_protocol.hpp
 * @brief Line-delimited JSON protocol between a worker process and the host
 *
 * A worker writes one JSON object per line to its result pipe:
 * ```
 * {"type":"log","kind":"warn","args":["low"],"seq":0,"ts":1735689600000}
 * {"type":"log","kind":"log","args":[1,{"a":2}],"seq":1,"ts":1735689600001}
 * {"type":"outcome","status":"completed","hasValue":true,"value":42}
 * ```
 * Log lines are streamed as they are produced so that a worker killed at
 * its deadline still leaves its partial log behind. The outcome line is
 * always last; a stream without one means the worker did not finish.
 *
 * @date 2025
 */

#pragma once

#include "evalbox/core/types.hpp"
#include "evalbox/monitors/output_capture.hpp"

#include <string>

namespace evalbox {
namespace core {

/**
 * @struct WorkerMessage
 * @brief One decoded protocol line
 */
struct WorkerMessage {
    enum class Type { LOG, OUTCOME };

    Type type{Type::LOG};  ///< Line type
    LogEntry entry;        ///< Valid when type == LOG
    RawOutcome outcome;    ///< Valid when type == OUTCOME
};

/**
 * @class WorkerProtocol
 * @brief Encoding and decoding of protocol lines
 *
 * All methods are static.
 */
class WorkerProtocol {
public:
    /**
     * @brief Encode a log entry (no trailing newline)
     */
    static std::string EncodeLog(const LogEntry& entry);

    /**
     * @brief Encode the final outcome (no trailing newline)
     */
    static std::string EncodeOutcome(const RawOutcome& outcome);

    /**
     * @brief Decode one line
     * @throws std::runtime_error on malformed input
     */
    static WorkerMessage Decode(const std::string& line);

    /**
     * @brief Write a line plus newline to a file descriptor
     *
     * Retries on EINTR and short writes.
     *
     * @return false if the descriptor is no longer writable
     */
    static bool WriteLine(int fd, const std::string& line);
};

/**
 * @class ChannelLogSink
 * @brief LogSink that streams entries to a worker result pipe
 *
 * After the first failed write the sink stops writing; the host then sees a
 * stream without an outcome line.
 */
class ChannelLogSink : public monitors::LogSink {
public:
    explicit ChannelLogSink(int fd);

    void Emit(const LogEntry& entry) override;

    bool Healthy() const { return healthy_; }

private:
    int fd_;
    bool healthy_{true};
};

} // namespace core
} // namespace evalbox
