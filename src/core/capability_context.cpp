/**
 * @file capability_context.cpp
 * @brief Implementation of the per-evaluation capability context
 *
 * @date 2025
 */

#include "evalbox/core/capability_context.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace evalbox {
namespace core {

// ============================================================================
// CapabilityContext
// ============================================================================

CapabilityContext::CapabilityContext(std::map<std::string, std::string> data,
                                     std::set<std::string> utilities)
    : data_(std::move(data))
    , utilities_(std::move(utilities)) {
}

bool CapabilityContext::Binds(const std::string& name) const {
    return data_.count(name) > 0 || utilities_.count(name) > 0;
}

std::vector<std::string> CapabilityContext::SymbolNames() const {
    std::vector<std::string> names;
    names.reserve(data_.size() + utilities_.size());
    for (const auto& [name, text] : data_) {
        names.push_back(name);
    }
    for (const auto& name : utilities_) {
        if (data_.count(name) == 0) {
            names.push_back(name);
        }
    }
    return names;
}

std::size_t CapabilityContext::DataBytes() const {
    std::size_t total = 0;
    for (const auto& [name, text] : data_) {
        total += text.size();
    }
    return total;
}

// ============================================================================
// CapabilityContextBuilder
// ============================================================================

CapabilityContextBuilder::CapabilityContextBuilder()
    : CapabilityContextBuilder(Config{}) {
}

CapabilityContextBuilder::CapabilityContextBuilder(const Config& config)
    : config_(config) {
    if (config_.allowed_globals.empty()) {
        config_.allowed_globals = DefaultAllowedGlobals();
    }
}

const std::set<std::string>& CapabilityContextBuilder::DefaultAllowedGlobals() {
    static const std::set<std::string> allowed = {
        "JSON", "Object", "Array", "Map", "Set", "WeakMap", "WeakSet",
        "Math", "String", "Number", "Boolean", "Date", "RegExp", "Promise",
        "Error", "TypeError", "RangeError", "SyntaxError", "ReferenceError",
        "EvalError", "URIError", "AggregateError",
        "parseInt", "parseFloat", "isNaN", "isFinite",
        "encodeURIComponent", "decodeURIComponent", "encodeURI", "decodeURI",
        "console"
    };
    return allowed;
}

CapabilityContext CapabilityContextBuilder::Build(const EvaluationContext& context) const {
    auto snapshot = [](const Json& value) {
        if (value.is_null()) {
            return std::string("{}");
        }
        return value.dump(-1, ' ', false, Json::error_handler_t::replace);
    };

    std::map<std::string, std::string> data;
    data["response"] = snapshot(context.response);
    data["request"] = snapshot(context.request);

    CapabilityContext built(std::move(data), config_.allowed_globals);

    if (built.DataBytes() > config_.max_context_bytes) {
        spdlog::warn("Context snapshot of {} bytes exceeds limit of {}",
                     built.DataBytes(), config_.max_context_bytes);
        throw std::invalid_argument("Context too large");
    }

    spdlog::debug("Capability context built: {} data bytes, {} utilities",
                  built.DataBytes(), built.UtilityBindings().size());
    return built;
}

} // namespace core
} // namespace evalbox
