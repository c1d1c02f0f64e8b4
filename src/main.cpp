/**
 * @file main.cpp
 * @brief evalbox - Command-line interface
 *
 * Entry point for the evalbox snippet evaluator. Reads a request body (or a
 * snippet plus context given as options), runs it through the evaluation
 * engine and writes the JSON response to stdout. Logs go to stderr.
 *
 * Exit codes: 0 for an evaluated request (including failed snippets), 2 for a
 * malformed request, 1 for an internal or usage error.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "evalbox/core/evaluation_engine.hpp"
#include "evalbox/core/engine_config.hpp"
#include "evalbox/utils/string_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

using json = nlohmann::json;
using evalbox::utils::StringUtils;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cerr << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║   ███████╗██╗   ██╗ █████╗ ██╗     ██████╗  ██████╗ ██╗  ██╗   ║
║   ██╔════╝██║   ██║██╔══██╗██║     ██╔══██╗██╔═══██╗╚██╗██╔╝   ║
║   █████╗  ██║   ██║███████║██║     ██████╔╝██║   ██║ ╚███╔╝    ║
║   ██╔══╝  ╚██╗ ██╔╝██╔══██║██║     ██╔══██╗██║   ██║ ██╔██╗    ║
║   ███████╗ ╚████╔╝ ██║  ██║███████╗██████╔╝╚██████╔╝██╔╝ ██╗   ║
║   ╚══════╝  ╚═══╝  ╚═╝  ╚═╝╚══════╝╚═════╝  ╚═════╝ ╚═╝  ╚═╝   ║
║                                                               ║
║              Sandboxed JavaScript Snippet Evaluator           ║
║                              v)" EVALBOX_VERSION R"(                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

std::string ReadAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string ReadFile(const std::string& path) {
    if (path == "-") {
        return ReadAll(std::cin);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return ReadAll(file);
}

void PrintConsoleSummary(const evalbox::core::ServiceResponse& response) {
    const auto& body = response.body;

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    if (body.value("success", false)) {
        spdlog::info("[OK] Result: {}", StringUtils::Preview(body["result"].dump()));
    } else {
        spdlog::info("[{}] {}", body.value("errorCategory", std::string("Error")),
                     body.value("error", std::string()));
    }
    spdlog::info("Console entries: {}", body["console"].size());
    spdlog::info("Execution time: {} ms", body.value("executionTime", 0));
    spdlog::info("HTTP status: {}", response.http_status);
    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"evalbox - Sandboxed JavaScript Snippet Evaluator"};
    app.footer("\nThe response body is written to stdout; logs are written to stderr.");

    std::string request_path;
    std::string code;
    std::string code_file;
    std::string context_text;
    std::string config_path;
    std::string dump_config_path;
    std::string isolation;
    long timeout_ms = 0;
    std::size_t memory_limit_mb = 0;
    bool no_seccomp = false;
    bool describe = false;
    bool pretty = false;
    bool verbose = false;
    bool quiet = false;

    auto* request_opt = app.add_option("request", request_path,
                                       "Request body file ({\"code\", \"context\"}), '-' for stdin");
    auto* code_opt = app.add_option("-c,--code", code, "Snippet source");
    auto* code_file_opt = app.add_option("-f,--code-file", code_file,
                                         "File containing the snippet source")
        ->check(CLI::ExistingFile);
    app.add_option("--context", context_text,
                   "Context as JSON ({\"response\": ..., \"request\": ...})");

    request_opt->excludes(code_opt)->excludes(code_file_opt);
    code_opt->excludes(code_file_opt);

    app.add_option("--config", config_path, "Engine configuration file (JSON)")
        ->check(CLI::ExistingFile);
    app.add_option("--dump-config", dump_config_path,
                   "Write the effective configuration to a file and exit");
    app.add_option("-t,--timeout-ms", timeout_ms, "Execution timeout in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--isolation", isolation, "Isolation unit: process or thread")
        ->check(CLI::IsMember({"process", "thread"}, CLI::ignore_case));
    app.add_option("--memory-limit-mb", memory_limit_mb, "Script heap limit in MiB")
        ->check(CLI::PositiveNumber);
    app.add_flag("--no-seccomp", no_seccomp, "Disable the worker syscall filter");

    app.add_flag("--describe", describe, "Print the service descriptor and exit");
    app.add_flag("-p,--pretty", pretty, "Pretty-print the response");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("-q,--quiet", quiet, "Only log warnings and errors");

    CLI11_PARSE(app, argc, argv);

    // stdout carries the response, so logging goes to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("evalbox"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (!quiet && !describe) {
        PrintBanner();
    }

    try {
        // Assemble configuration: file, then command-line overrides
        evalbox::core::EngineConfig config;
        if (!config_path.empty()) {
            config = evalbox::core::LoadEngineConfig(config_path);
        }
        if (timeout_ms > 0) {
            config.execution.timeout = std::chrono::milliseconds(timeout_ms);
        }
        if (!isolation.empty()) {
            config.execution.isolation = *evalbox::core::IsolationModeFromString(
                evalbox::utils::StringUtils::ToLower(isolation));
        }
        if (memory_limit_mb > 0) {
            config.execution.runtime_limits.memory_limit_bytes = memory_limit_mb * 1024 * 1024;
        }
        if (no_seccomp) {
            config.execution.enable_seccomp = false;
        }
        if (verbose) {
            config.verbose_logging = true;
        }

        if (!dump_config_path.empty()) {
            evalbox::core::SaveEngineConfig(config, dump_config_path);
            return 0;
        }

        if (describe) {
            evalbox::core::EvaluationEngine engine(config);
            std::cout << engine.DescribeService().dump(2) << std::endl;
            return 0;
        }

        if (request_path.empty() && code_opt->count() == 0 && code_file.empty()) {
            spdlog::error("[ERROR] No request given: pass a request file, '-', --code or --code-file");
            std::cerr << app.help() << std::endl;
            return 1;
        }

        evalbox::core::EvaluationEngine engine(config);
        evalbox::core::ServiceResponse response;

        if (!request_path.empty()) {
            spdlog::info("[START] Request: {}", request_path == "-" ? "<stdin>" : request_path);
            response = engine.HandleRequest(ReadFile(request_path));
        } else {
            json body;
            body["code"] = code_file.empty() ? code : ReadFile(code_file);

            if (!StringUtils::IsBlank(context_text)) {
                try {
                    body["context"] = json::parse(context_text);
                } catch (const json::parse_error& e) {
                    spdlog::error("[ERROR] --context is not valid JSON: {}", e.what());
                    return 1;
                }
            }

            spdlog::info("[START] Snippet: {}",
                         StringUtils::Preview(StringUtils::Trim(body["code"].get<std::string>())));
            response = engine.HandleRequest(body);
        }

        std::cout << (pretty ? response.body.dump(2) : response.body.dump()) << std::endl;

        if (!quiet) {
            PrintConsoleSummary(response);
        }

        return response.http_status == 400 ? 2 : 0;

    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
