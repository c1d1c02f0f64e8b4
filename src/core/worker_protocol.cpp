/**
 * @file worker_protocol.cpp
 * @brief Implementation of the worker result-pipe protocol
 *
 * @date 2025
 */

#include "evalbox/core/worker_protocol.hpp"

#include <cerrno>
#include <stdexcept>

#include <unistd.h>

namespace evalbox {
namespace core {

namespace {

std::string Dump(const Json& json) {
    return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace

// ============================================================================
// ENCODING
// ============================================================================

std::string WorkerProtocol::EncodeLog(const LogEntry& entry) {
    Json line = {
        {"type", "log"},
        {"kind", LogKindToString(entry.kind)},
        {"args", entry.arguments},
        {"seq", entry.sequence_number},
        {"ts", entry.timestamp_ms}
    };
    return Dump(line);
}

std::string WorkerProtocol::EncodeOutcome(const RawOutcome& outcome) {
    Json line = {
        {"type", "outcome"},
        {"status", OutcomeStatusToString(outcome.status)},
        {"hasValue", outcome.value.has_value()}
    };

    if (outcome.value) {
        line["value"] = *outcome.value;
    }
    if (outcome.error) {
        line["error"] = {
            {"category", ErrorCategoryToString(outcome.error->category)},
            {"message", outcome.error->message}
        };
    }

    return Dump(line);
}

// ============================================================================
// DECODING
// ============================================================================

WorkerMessage WorkerProtocol::Decode(const std::string& line) {
    Json json;
    try {
        json = Json::parse(line);
    } catch (const Json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed worker line: ") + e.what());
    }

    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        throw std::runtime_error("Worker line has no type");
    }

    WorkerMessage message;
    const auto type = json["type"].get<std::string>();

    try {
        if (type == "log") {
            auto kind = LogKindFromString(json.at("kind").get<std::string>());
            if (!kind || !json.at("args").is_array()) {
                throw std::runtime_error("Invalid log line");
            }
            message.type = WorkerMessage::Type::LOG;
            message.entry.kind = *kind;
            message.entry.arguments = json["args"].get<std::vector<Json>>();
            message.entry.sequence_number = json.at("seq").get<std::uint64_t>();
            message.entry.timestamp_ms = json.at("ts").get<std::int64_t>();
        } else if (type == "outcome") {
            auto status = OutcomeStatusFromString(json.at("status").get<std::string>());
            if (!status) {
                throw std::runtime_error("Invalid outcome status");
            }
            message.type = WorkerMessage::Type::OUTCOME;
            message.outcome.status = *status;

            if (json.value("hasValue", false)) {
                message.outcome.value = json.contains("value") ? json["value"] : Json();
            }

            if (json.contains("error") && json["error"].is_object()) {
                const auto& error = json["error"];
                auto category = ErrorCategoryFromString(error.at("category").get<std::string>());
                if (!category) {
                    throw std::runtime_error("Invalid error category");
                }
                message.outcome.error = ErrorDetail{*category, error.at("message").get<std::string>()};
            }
        } else {
            throw std::runtime_error("Unknown worker line type: " + type);
        }
    } catch (const Json::exception& e) {
        throw std::runtime_error(std::string("Malformed worker line: ") + e.what());
    }

    return message;
}

// ============================================================================
// TRANSPORT
// ============================================================================

bool WorkerProtocol::WriteLine(int fd, const std::string& line) {
    std::string framed = line;
    framed += '\n';

    const char* data = framed.data();
    std::size_t remaining = framed.size();

    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    return true;
}

ChannelLogSink::ChannelLogSink(int fd)
    : fd_(fd) {
}

void ChannelLogSink::Emit(const LogEntry& entry) {
    if (!healthy_) {
        return;
    }
    healthy_ = WorkerProtocol::WriteLine(fd_, WorkerProtocol::EncodeLog(entry));
}

} // namespace core
} // namespace evalbox
