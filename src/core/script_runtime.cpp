/**
 * @file script_runtime.cpp
 * @brief QuickJS-backed snippet execution
 *
 * **Setup sequence (per Run)**:
 * 1. `JS_NewRuntime` with heap and stack limits, interrupt handler and
 *    promise rejection tracker
 * 2. `JS_NewContextRaw` plus the audited intrinsics only (no std/os modules,
 *    no Proxy, no typed arrays, no module loader)
 * 3. `console` bound to OutputCapture
 * 4. `response` / `request` parsed from their snapshots and deep-frozen
 * 5. Taming: function constructors replaced, globals outside the allow-list
 *    deleted
 * 6. Snippet compiled inside the async wrapper and called
 *
 * No spdlog calls are made here: this code also runs inside forked worker
 * processes, where the host logs on the worker's behalf.
 *
 * @date 2025
 */

#include "evalbox/core/script_runtime.hpp"
#include "evalbox/utils/string_utils.hpp"

#include "quickjs.h"

#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace evalbox {
namespace core {

namespace {

// ============================================================================
// RAII HANDLES
// ============================================================================

struct RuntimeDeleter {
    void operator()(JSRuntime* rt) const { JS_FreeRuntime(rt); }
};

struct ContextDeleter {
    void operator()(JSContext* ctx) const { JS_FreeContext(ctx); }
};

using RuntimeHandle = std::unique_ptr<JSRuntime, RuntimeDeleter>;
using ContextHandle = std::unique_ptr<JSContext, ContextDeleter>;

// Owns one JSValue reference
class ScopedValue {
public:
    ScopedValue(JSContext* ctx, JSValue value) : ctx_(ctx), value_(value) {}
    ~ScopedValue() { JS_FreeValue(ctx_, value_); }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

    JSValue Get() const { return value_; }
    bool IsException() const { return JS_IsException(value_); }

    // Give up ownership
    JSValue Release() {
        JSValue value = value_;
        value_ = JS_UNDEFINED;
        return value;
    }

private:
    JSContext* ctx_;
    JSValue value_;
};

// ============================================================================
// RUN STATE
// ============================================================================

struct PendingRejection {
    void* promise;
    std::string message;
};

struct RunState {
    monitors::OutputCapture* capture{nullptr};
    ScriptRuntime::Clock::time_point deadline;
    const std::atomic<bool>* cancel{nullptr};
    bool interrupted{false};
    std::vector<PendingRejection> rejections;
};

constexpr const char* kCodeGenerationDisabled = "Code generation from strings is disabled";

const char* kDeepFreezeSource = R"JS(
(function (root) {
    var seen = new Set();
    var stack = [root];
    while (stack.length > 0) {
        var value = stack.pop();
        if (value === null || typeof value !== "object" || seen.has(value)) {
            continue;
        }
        seen.add(value);
        Object.freeze(value);
        var keys = Object.getOwnPropertyNames(value);
        for (var i = 0; i < keys.length; i++) {
            stack.push(value[keys[i]]);
        }
    }
    return root;
})
)JS";

// Evaluated as sloppy global code so that `this` is the global object
const char* kTamingSource = R"JS(
(function (global, keep, message) {
    var thrower = function () { throw new TypeError(message); };
    var prototypes = [
        Object.getPrototypeOf(function () {}),
        Object.getPrototypeOf(function* () {}),
        Object.getPrototypeOf(async function () {}),
        Object.getPrototypeOf(async function* () {})
    ];
    for (var i = 0; i < prototypes.length; i++) {
        Object.defineProperty(prototypes[i], "constructor", {
            value: thrower, writable: false, enumerable: false, configurable: false
        });
    }
    Object.freeze(thrower);

    var names = Object.getOwnPropertyNames(global);
    for (var j = 0; j < names.length; j++) {
        if (keep.indexOf(names[j]) >= 0) {
            continue;
        }
        var descriptor = Object.getOwnPropertyDescriptor(global, names[j]);
        if (descriptor && descriptor.configurable) {
            delete global[names[j]];
        }
    }
})
)JS";

int InterruptHandler(JSRuntime* /*rt*/, void* opaque) {
    auto* state = static_cast<RunState*>(opaque);
    if (state->interrupted) {
        return 1;
    }
    if ((state->cancel && state->cancel->load(std::memory_order_relaxed)) ||
        ScriptRuntime::Clock::now() >= state->deadline) {
        state->interrupted = true;
        return 1;
    }
    return 0;
}

// ============================================================================
// VALUE CONVERSION
// ============================================================================

std::optional<std::string> ToStdString(JSContext* ctx, JSValueConst value) {
    std::size_t length = 0;
    const char* text = JS_ToCStringLen(ctx, &length, value);
    if (!text) {
        return std::nullopt;
    }
    std::string result(text, length);
    JS_FreeCString(ctx, text);
    return result;
}

void ClearException(JSContext* ctx) {
    JS_FreeValue(ctx, JS_GetException(ctx));
}

std::string PropertyString(JSContext* ctx, JSValueConst object, const char* name) {
    ScopedValue property(ctx, JS_GetPropertyStr(ctx, object, name));
    if (property.IsException()) {
        ClearException(ctx);
        return "";
    }
    if (JS_IsUndefined(property.Get()) || JS_IsNull(property.Get())) {
        return "";
    }
    auto text = ToStdString(ctx, property.Get());
    if (!text) {
        ClearException(ctx);
        return "";
    }
    return *text;
}

// "TypeError: x is not a function"
std::string ErrorSummary(JSContext* ctx, JSValueConst error) {
    std::string name = PropertyString(ctx, error, "name");
    std::string message = PropertyString(ctx, error, "message");
    if (name.empty()) {
        name = "Error";
    }
    return message.empty() ? name : name + ": " + message;
}

/**
 * Convert a value for logging or as a return value.
 * Returns nullopt when execution was interrupted mid-conversion; the
 * interrupt exception is then left pending.
 */
std::optional<Json> ToJson(JSContext* ctx, RunState& state, JSValueConst value) {
    if (JS_IsUndefined(value) || JS_IsSymbol(value) || JS_IsFunction(ctx, value)) {
        return Json(nullptr);
    }

    if (JS_IsError(ctx, value)) {
        return Json(ErrorSummary(ctx, value));
    }

    ScopedValue json(ctx, JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED));
    if (json.IsException()) {
        if (state.interrupted) {
            return std::nullopt;
        }
        ClearException(ctx);

        // Cycles, BigInt and friends fall back to their string rendering
        auto rendered = ToStdString(ctx, value);
        if (!rendered) {
            if (state.interrupted) {
                return std::nullopt;
            }
            ClearException(ctx);
            return Json("[unserializable]");
        }
        return Json(*rendered);
    }

    if (JS_IsUndefined(json.Get())) {
        return Json(nullptr);
    }

    auto text = ToStdString(ctx, json.Get());
    if (!text) {
        if (state.interrupted) {
            return std::nullopt;
        }
        ClearException(ctx);
        return Json(nullptr);
    }

    auto parsed = Json::parse(*text, nullptr, false);
    if (parsed.is_discarded()) {
        return Json(*text);
    }
    return parsed;
}

// Message of a thrown value, without stack
std::string DescribeException(JSContext* ctx, JSValueConst exception) {
    if (JS_IsNull(exception) || JS_IsUndefined(exception)) {
        return "Uncaught exception";
    }

    if (JS_IsError(ctx, exception)) {
        std::string message = PropertyString(ctx, exception, "message");
        if (message.empty()) {
            message = PropertyString(ctx, exception, "name");
        }
        return message.empty() ? "Uncaught exception" : message;
    }

    if (JS_IsObject(exception)) {
        ScopedValue json(ctx, JS_JSONStringify(ctx, exception, JS_UNDEFINED, JS_UNDEFINED));
        if (!json.IsException() && JS_IsString(json.Get())) {
            if (auto text = ToStdString(ctx, json.Get())) {
                return *text;
            }
        }
        ClearException(ctx);
    }

    auto text = ToStdString(ctx, exception);
    if (!text) {
        ClearException(ctx);
        return "Uncaught exception";
    }
    return *text;
}

std::string ExceptionMessage(JSContext* ctx, JSValueConst exception) {
    return utils::StringUtils::Truncate(DescribeException(ctx, exception),
                                        ScriptRuntime::kMaxErrorMessageBytes);
}

bool IsReferenceError(JSContext* ctx, JSValueConst exception) {
    return JS_IsError(ctx, exception) &&
           PropertyString(ctx, exception, "name") == "ReferenceError";
}

// ============================================================================
// HOST CALLBACKS
// ============================================================================

// magic: 0 log, 1 info, 2 warn, 3 error, 4 debug
JSValue ConsoleCallback(JSContext* ctx, JSValueConst /*this_val*/,
                        int argc, JSValueConst* argv, int magic) {
    auto* state = static_cast<RunState*>(JS_GetContextOpaque(ctx));

    LogKind kind = LogKind::LOG;
    switch (magic) {
        case 1: kind = LogKind::INFO; break;
        case 2: kind = LogKind::WARN; break;
        case 3: kind = LogKind::ERROR; break;
        default: kind = LogKind::LOG; break;
    }

    std::vector<Json> arguments;
    arguments.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        auto converted = ToJson(ctx, *state, argv[i]);
        if (!converted) {
            return JS_EXCEPTION;
        }
        arguments.push_back(std::move(*converted));
    }

    state->capture->Record(kind, std::move(arguments));
    return JS_UNDEFINED;
}

void RejectionTracker(JSContext* ctx, JSValueConst promise, JSValueConst reason,
                      JS_BOOL is_handled, void* opaque) {
    auto* state = static_cast<RunState*>(opaque);
    void* identity = JS_VALUE_GET_PTR(promise);

    if (is_handled) {
        for (auto it = state->rejections.begin(); it != state->rejections.end(); ++it) {
            if (it->promise == identity) {
                state->rejections.erase(it);
                break;
            }
        }
        return;
    }

    state->rejections.push_back(PendingRejection{identity, ExceptionMessage(ctx, reason)});
}

// ============================================================================
// CONTEXT SETUP
// ============================================================================

JSContext* NewSandboxContext(JSRuntime* rt) {
    JSContext* ctx = JS_NewContextRaw(rt);
    if (!ctx) {
        return nullptr;
    }
    JS_AddIntrinsicBaseObjects(ctx);
    JS_AddIntrinsicDate(ctx);
    JS_AddIntrinsicEval(ctx);
    JS_AddIntrinsicStringNormalize(ctx);
    JS_AddIntrinsicRegExpCompiler(ctx);
    JS_AddIntrinsicRegExp(ctx);
    JS_AddIntrinsicJSON(ctx);
    JS_AddIntrinsicMapSet(ctx);
    JS_AddIntrinsicPromise(ctx);
    return ctx;
}

void Check(JSContext* ctx, JSValue value, const char* what) {
    ScopedValue guard(ctx, value);
    if (guard.IsException()) {
        ClearException(ctx);
        throw std::runtime_error(std::string("Sandbox setup failed: ") + what);
    }
}

void InstallConsole(JSContext* ctx, JSValueConst global, JSValueConst freeze) {
    static const char* const kMethods[] = {"log", "info", "warn", "error", "debug"};

    ScopedValue console(ctx, JS_NewObject(ctx));
    if (console.IsException()) {
        ClearException(ctx);
        throw std::runtime_error("Sandbox setup failed: console");
    }

    for (int magic = 0; magic < 5; ++magic) {
        JSValue method = JS_NewCFunctionMagic(ctx, ConsoleCallback, kMethods[magic], 0,
                                              JS_CFUNC_generic_magic, magic);
        JS_DefinePropertyValueStr(ctx, console.Get(), kMethods[magic], method, 0);
    }

    JSValueConst args[] = {console.Get()};
    Check(ctx, JS_Call(ctx, freeze, JS_UNDEFINED, 1, args), "console");
    JS_DefinePropertyValueStr(ctx, global, "console", console.Release(), 0);
}

void InstallData(JSContext* ctx, JSValueConst global, JSValueConst freeze,
                 const std::string& name, const std::string& snapshot) {
    JSValue parsed = JS_ParseJSON(ctx, snapshot.c_str(), snapshot.size(), "<context>");
    if (JS_IsException(parsed)) {
        ClearException(ctx);
        throw std::runtime_error("Sandbox setup failed: " + name);
    }

    JSValueConst args[] = {parsed};
    JSValue frozen = JS_Call(ctx, freeze, JS_UNDEFINED, 1, args);
    JS_FreeValue(ctx, parsed);
    if (JS_IsException(frozen)) {
        ClearException(ctx);
        throw std::runtime_error("Sandbox setup failed: " + name);
    }

    JS_DefinePropertyValueStr(ctx, global, name.c_str(), frozen, 0);
}

void Tame(JSContext* ctx, JSValueConst global, const std::vector<std::string>& keep) {
    std::string source = kTamingSource;
    ScopedValue tamer(ctx, JS_Eval(ctx, source.c_str(), source.size(), "<taming>",
                                   JS_EVAL_TYPE_GLOBAL));
    if (tamer.IsException()) {
        ClearException(ctx);
        throw std::runtime_error("Sandbox setup failed: taming");
    }

    Json keep_list(keep);
    for (const char* constant : {"NaN", "Infinity", "undefined"}) {
        keep_list.push_back(constant);
    }
    std::string keep_text = keep_list.dump();

    ScopedValue keep_value(ctx, JS_ParseJSON(ctx, keep_text.c_str(), keep_text.size(), "<taming>"));
    ScopedValue message(ctx, JS_NewString(ctx, kCodeGenerationDisabled));
    if (keep_value.IsException() || message.IsException()) {
        ClearException(ctx);
        throw std::runtime_error("Sandbox setup failed: taming");
    }

    JSValueConst args[] = {global, keep_value.Get(), message.Get()};
    Check(ctx, JS_Call(ctx, tamer.Get(), JS_UNDEFINED, 3, args), "taming");
}

} // namespace

// ============================================================================
// ScriptRuntime
// ============================================================================

ScriptRuntime::ScriptRuntime(const RuntimeLimits& limits, monitors::OutputCapture& capture)
    : limits_(limits)
    , capture_(capture) {
}

std::string ScriptRuntime::WrapSnippet(const std::string& code) {
    return "(function () { \"use strict\"; return (async () => {\n" + code + "\n}); })";
}

std::string ScriptRuntime::WrapSnippetInBlock(const std::string& code) {
    return "(function () { \"use strict\"; return (async () => { {\n" + code + "\n} }); })";
}

RawOutcome ScriptRuntime::Run(const std::string& code,
                              const CapabilityContext& context,
                              Clock::time_point deadline,
                              const std::atomic<bool>* cancel) {
    RunState state;
    state.capture = &capture_;
    state.deadline = deadline;
    state.cancel = cancel;
    interrupted_ = false;

    RuntimeHandle rt(JS_NewRuntime());
    if (!rt) {
        throw std::runtime_error("Failed to create script runtime");
    }
    JS_SetMemoryLimit(rt.get(), limits_.memory_limit_bytes);
    JS_SetMaxStackSize(rt.get(), limits_.max_stack_bytes);
    JS_SetInterruptHandler(rt.get(), InterruptHandler, &state);
    JS_SetHostPromiseRejectionTracker(rt.get(), RejectionTracker, &state);

    ContextHandle ctx_handle(NewSandboxContext(rt.get()));
    if (!ctx_handle) {
        throw std::runtime_error("Failed to create script context");
    }
    JSContext* ctx = ctx_handle.get();
    JS_SetContextOpaque(ctx, &state);

    RawOutcome outcome;
    {
        ScopedValue global(ctx, JS_GetGlobalObject(ctx));

        std::string freeze_source = kDeepFreezeSource;
        ScopedValue freeze(ctx, JS_Eval(ctx, freeze_source.c_str(), freeze_source.size(),
                                        "<freeze>", JS_EVAL_TYPE_GLOBAL | JS_EVAL_FLAG_STRICT));
        if (freeze.IsException()) {
            ClearException(ctx);
            throw std::runtime_error("Sandbox setup failed: freeze");
        }

        InstallConsole(ctx, global.Get(), freeze.Get());
        for (const auto& [name, snapshot] : context.DataBindings()) {
            InstallData(ctx, global.Get(), freeze.Get(), name, snapshot);
        }
        Tame(ctx, global.Get(), context.SymbolNames());

        // Compile and start; the block-nested compile must succeed first
        std::string guarded = WrapSnippetInBlock(code);
        ScopedValue guard(ctx, JS_Eval(ctx, guarded.c_str(), guarded.size(), "<snippet>",
                                       JS_EVAL_TYPE_GLOBAL | JS_EVAL_FLAG_STRICT |
                                           JS_EVAL_FLAG_COMPILE_ONLY));
        std::optional<ScopedValue> promise;
        if (!guard.IsException()) {
            std::string source = WrapSnippet(code);
            ScopedValue factory(ctx, JS_Eval(ctx, source.c_str(), source.size(), "<snippet>",
                                             JS_EVAL_TYPE_GLOBAL | JS_EVAL_FLAG_STRICT));
            if (!factory.IsException()) {
                ScopedValue function(ctx, JS_Call(ctx, factory.Get(), JS_UNDEFINED, 0, nullptr));
                if (!function.IsException()) {
                    promise.emplace(ctx, JS_Call(ctx, function.Get(), JS_UNDEFINED, 0, nullptr));
                }
            }
        }

        bool failed = !promise || promise->IsException();

        // Drain the job queue
        while (!failed && !state.interrupted) {
            JSContext* job_ctx = nullptr;
            int executed = JS_ExecutePendingJob(rt.get(), &job_ctx);
            if (executed == 0) {
                break;
            }
            if (executed < 0) {
                if (state.interrupted) {
                    break;
                }
                ClearException(job_ctx ? job_ctx : ctx);
            }
        }

        if (state.interrupted) {
            ClearException(ctx);
            outcome.status = OutcomeStatus::TIMED_OUT;
            outcome.error = ErrorDetail{ErrorCategory::TIMEOUT, "Execution timed out"};
        } else if (failed) {
            ScopedValue exception(ctx, JS_GetException(ctx));
            outcome.status = OutcomeStatus::FAULTED;
            outcome.error = ErrorDetail{
                IsReferenceError(ctx, exception.Get()) ? ErrorCategory::CAPABILITY_VIOLATION
                                                       : ErrorCategory::RUNTIME_FAULT,
                ExceptionMessage(ctx, exception.Get())};
        } else {
            JSValue settled = promise->Get();
            switch (JS_PromiseState(ctx, settled)) {
                case JS_PROMISE_FULFILLED: {
                    ScopedValue result(ctx, JS_PromiseResult(ctx, settled));
                    if (JS_IsUndefined(result.Get())) {
                        outcome.status = OutcomeStatus::COMPLETED;
                        break;
                    }
                    auto value = ToJson(ctx, state, result.Get());
                    if (!value) {
                        ClearException(ctx);
                        outcome.status = OutcomeStatus::TIMED_OUT;
                        outcome.error = ErrorDetail{ErrorCategory::TIMEOUT, "Execution timed out"};
                        break;
                    }
                    if (value->dump(-1, ' ', false, Json::error_handler_t::replace).size() >
                        limits_.max_result_bytes) {
                        outcome.status = OutcomeStatus::FAULTED;
                        outcome.error = ErrorDetail{ErrorCategory::RUNTIME_FAULT, "Result too large"};
                        break;
                    }
                    outcome.status = OutcomeStatus::COMPLETED;
                    outcome.value = std::move(*value);
                    break;
                }
                case JS_PROMISE_REJECTED: {
                    ScopedValue reason(ctx, JS_PromiseResult(ctx, settled));
                    outcome.status = OutcomeStatus::FAULTED;
                    outcome.error = ErrorDetail{
                        IsReferenceError(ctx, reason.Get()) ? ErrorCategory::CAPABILITY_VIOLATION
                                                            : ErrorCategory::RUNTIME_FAULT,
                        ExceptionMessage(ctx, reason.Get())};
                    break;
                }
                default:
                    outcome.status = OutcomeStatus::FAULTED;
                    outcome.error = ErrorDetail{ErrorCategory::RUNTIME_FAULT,
                                                "Evaluation did not settle"};
                    break;
            }
        }

        if (outcome.status != OutcomeStatus::TIMED_OUT) {
            void* main_promise = promise && !promise->IsException()
                                     ? JS_VALUE_GET_PTR(promise->Get())
                                     : nullptr;
            for (const auto& rejection : state.rejections) {
                if (rejection.promise == main_promise) {
                    continue;
                }
                capture_.Record(LogKind::ERROR,
                                {Json("Unhandled promise rejection: " + rejection.message)});
            }
        }
    }

    interrupted_ = state.interrupted;
    return outcome;
}

} // namespace core
} // namespace evalbox
