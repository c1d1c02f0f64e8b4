/**
 * @file output_capture.cpp
 * @brief Implementation of console output capture
 *
 * Byte accounting uses the compact JSON rendering of the argument array,
 * which is also what ends up on the wire.
 *
 * @date 2025
 */

#include "evalbox/monitors/output_capture.hpp"

namespace evalbox {
namespace monitors {

using core::Json;
using core::LogEntry;
using core::LogKind;

// ============================================================================
// BufferedLogSink
// ============================================================================

void BufferedLogSink::Emit(const LogEntry& entry) {
    entries_.push_back(entry);
}

std::vector<LogEntry> BufferedLogSink::TakeEntries() {
    std::vector<LogEntry> taken;
    taken.swap(entries_);
    return taken;
}

// ============================================================================
// OutputCapture
// ============================================================================

OutputCapture::OutputCapture(const Limits& limits, LogSink& sink)
    : limits_(limits)
    , sink_(sink) {
}

bool OutputCapture::Record(LogKind kind, std::vector<Json> arguments) {
    if (count_ >= limits_.max_entries) {
        ++dropped_;
        return false;
    }

    Json array(Json::value_t::array);
    for (const auto& argument : arguments) {
        array.push_back(argument);
    }
    std::size_t size = array.dump(-1, ' ', false, Json::error_handler_t::replace).size();

    if (bytes_ + size > limits_.max_bytes) {
        ++dropped_;
        return false;
    }

    LogEntry entry;
    entry.kind = kind;
    entry.arguments = std::move(arguments);
    entry.sequence_number = next_sequence_++;
    entry.timestamp_ms = core::NowMillis();

    bytes_ += size;
    ++count_;
    sink_.Emit(entry);
    return true;
}

} // namespace monitors
} // namespace evalbox
