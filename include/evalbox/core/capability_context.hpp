/**
 * @file capability_context.hpp
 * @brief Per-evaluation set of names a snippet may resolve
 *
 * A CapabilityContext is built fresh for every evaluation and never shared.
 * It holds two kinds of bindings:
 * - **Data bindings**: `response` and `request`, stored as serialized JSON
 *   snapshots that the runtime re-parses and deep-freezes inside the sandbox
 * - **Utility bindings**: names of the audited runtime intrinsics that stay
 *   visible (JSON, Math, Array, console, ...)
 *
 * Any global not listed here is removed before the snippet runs.
 *
 * @date 2025
 */

#pragma once

#include "evalbox/core/types.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace evalbox {
namespace core {

class CapabilityContextBuilder;

/**
 * @class CapabilityContext
 * @brief Immutable symbol table for one evaluation
 *
 * Only CapabilityContextBuilder can create instances. Copies are cheap
 * enough to hand to a worker thread; a forked worker inherits the parent's
 * instance.
 */
class CapabilityContext {
public:
    /**
     * @brief Data symbols and their JSON text
     */
    const std::map<std::string, std::string>& DataBindings() const { return data_; }

    /**
     * @brief Names of utility intrinsics kept in the global scope
     */
    const std::set<std::string>& UtilityBindings() const { return utilities_; }

    /**
     * @brief Check whether a name resolves inside the sandbox
     */
    bool Binds(const std::string& name) const;

    /**
     * @brief All bound names, data symbols first
     */
    std::vector<std::string> SymbolNames() const;

    /**
     * @brief Total size of the serialized data snapshots
     */
    std::size_t DataBytes() const;

private:
    friend class CapabilityContextBuilder;

    CapabilityContext(std::map<std::string, std::string> data,
                      std::set<std::string> utilities);

    std::map<std::string, std::string> data_;
    std::set<std::string> utilities_;
};

/**
 * @class CapabilityContextBuilder
 * @brief Builds a CapabilityContext from request data
 *
 * **Usage Example**:
 * @code
 * CapabilityContextBuilder builder;
 * auto context = builder.Build(request.context);
 * spdlog::debug("Bound symbols: {}", context.SymbolNames().size());
 * @endcode
 */
class CapabilityContextBuilder {
public:
    /**
     * @struct Config
     * @brief Builder settings
     */
    struct Config {
        std::set<std::string> allowed_globals;               ///< Empty means DefaultAllowedGlobals()
        std::size_t max_context_bytes{8 * 1024 * 1024};      ///< Limit on serialized data
    };

    explicit CapabilityContextBuilder(const Config& config);
    CapabilityContextBuilder();

    /**
     * @brief Snapshot request data into a fresh context
     *
     * Null members become `{}`. Strings that are not valid UTF-8 are
     * serialized with replacement characters.
     *
     * @param context Caller-supplied data
     * @return Immutable context
     * @throws std::invalid_argument if the snapshots exceed max_context_bytes
     */
    CapabilityContext Build(const EvaluationContext& context) const;

    /**
     * @brief Audited intrinsics visible to every snippet
     */
    static const std::set<std::string>& DefaultAllowedGlobals();

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace core
} // namespace evalbox
