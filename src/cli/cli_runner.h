#pragma once

/// @file cli_runner.h
/// @brief Command-line front end: argument wiring and exit-code mapping

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <CLI/CLI.hpp>

namespace driftguard::cli {

inline constexpr const char* kVersion = "1.0.0";

/// @brief Process exit codes
enum ExitCode : int {
    kExitNoDrift = 0,
    kExitError = 1,
    kExitDrift = 2,
};

/// @brief Parsed command-line options
struct CliOptions {
    std::string reference_path;
    std::string current_path;              ///< Empty: window a single file
    std::string metric;                    ///< Empty: pipeline.metric from config
    std::optional<double> threshold;       ///< Unset: resolve from config
    std::string feature_type;              ///< Empty: pipeline.feature_type or numerical
    std::string feature;                   ///< Empty: first column
    std::string config_path;
    std::optional<int64_t> reference_window;
    std::optional<int64_t> current_window;
    char delimiter = ',';
    std::string log_level;                 ///< Empty: logging.level or info
    bool version = false;
};

/// @brief Register every option on a CLI11 app, binding into `options`
void ConfigureApp(CLI::App& app, CliOptions& options);

/// @brief Execute one drift check and print the JSON report to `out`
///
/// Every failure is logged and mapped to kExitError; the report is printed
/// only on success.
/// @return kExitNoDrift, kExitDrift or kExitError
int Run(const CliOptions& options, std::ostream& out);

/// @brief Parse argv and run; CLI parse errors map to kExitError
int Main(int argc, char** argv, std::ostream& out);

}  // namespace driftguard::cli
