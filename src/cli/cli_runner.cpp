/// @file cli_runner.cpp
/// @brief Command-line front end implementation

#include "cli/cli_runner.h"

#include <filesystem>

#include <absl/strings/str_cat.h>

#include "common/config.h"
#include "common/error.h"
#include "common/logging.h"
#include "data/csv_reader.h"
#include "drift/pipeline.h"
#include "drift/threshold_resolver.h"
#include "drift/windows.h"

namespace driftguard::cli {

namespace {

struct Inputs {
    data::Table reference;
    data::Table current;
};

absl::StatusOr<Inputs> LoadInputs(const CliOptions& options,
                                  const data::CsvOptions& csv_options) {
    const bool windowed = options.reference_window.has_value() ||
                          options.current_window.has_value();
    if (windowed && !(options.reference_window && options.current_window)) {
        return ValidationError(
            "--reference-window and --current-window must be given together");
    }

    if (options.reference_path.empty()) {
        return ValidationError("a reference file is required");
    }
    DRIFTGUARD_ASSIGN_OR_RETURN(data::Table reference,
                                data::ReadCsvFile(options.reference_path, csv_options));

    if (options.current_path.empty()) {
        if (!windowed) {
            return ValidationError(
                "a current file or --reference-window/--current-window is required");
        }
        DRIFTGUARD_ASSIGN_OR_RETURN(drift::Windows windows,
                                    drift::GetWindows(reference, *options.reference_window,
                                                      *options.current_window));
        return Inputs{std::move(windows.reference), std::move(windows.current)};
    }

    if (windowed) {
        return ValidationError("window options require a single input file");
    }

    DRIFTGUARD_ASSIGN_OR_RETURN(data::Table current,
                                data::ReadCsvFile(options.current_path, csv_options));
    return Inputs{std::move(reference), std::move(current)};
}

/// @brief Add the rotating file sink when the configuration names a log file
absl::Status ConfigureFileLogging(const Config& config) {
    if (!config.HasKey("logging.file")) {
        return OkStatus();
    }

    const int64_t max_file_size_mb = config.GetInt("logging.max_file_size_mb", 10);
    const int64_t max_files = config.GetInt("logging.max_files", 5);
    if (max_file_size_mb <= 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         "logging.max_file_size_mb must be greater than 0");
    }
    if (max_files < 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         "logging.max_files must not be negative");
    }

    LogConfig log_config;
    log_config.level = static_cast<LogLevel>(GetLogger()->level());
    log_config.enable_file = true;
    log_config.file_path = config.GetString("logging.file");
    log_config.max_file_size = static_cast<size_t>(max_file_size_mb) * 1024 * 1024;
    log_config.max_files = static_cast<size_t>(max_files);

    ShutdownLogging();
    try {
        InitLogging(log_config);
    } catch (const spdlog::spdlog_ex& e) {
        LogConfig console_only;
        console_only.level = log_config.level;
        InitLogging(console_only);
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("cannot open log file '", log_config.file_path,
                                      "': ", e.what()));
    }

    DRIFTGUARD_LOG_DEBUG("Logging to file {}", log_config.file_path);
    return OkStatus();
}

absl::StatusOr<drift::PipelineReport> Execute(const CliOptions& options) {
    std::optional<std::filesystem::path> config_path;
    if (!options.config_path.empty()) {
        config_path = options.config_path;
    }
    DRIFTGUARD_ASSIGN_OR_RETURN(Config config, Config::LoadWithEnvironment(config_path));

    if (options.log_level.empty() && config.HasKey("logging.level")) {
        SetLogLevel(ParseLogLevel(config.GetString("logging.level")));
    }
    DRIFTGUARD_RETURN_IF_ERROR(ConfigureFileLogging(config));

    const std::string metric = options.metric.empty()
                                   ? config.GetString("pipeline.metric")
                                   : options.metric;
    if (metric.empty()) {
        return ValidationError("--metric is required");
    }

    const std::string feature_type_name =
        options.feature_type.empty()
            ? config.GetString("pipeline.feature_type", "numerical")
            : options.feature_type;
    DRIFTGUARD_ASSIGN_OR_RETURN(drift::FeatureType feature_type,
                                drift::ParseFeatureType(feature_type_name));

    data::CsvOptions csv_options;
    csv_options.delimiter = options.delimiter;
    // Integer codes become labels; float columns stay floats and the metric decides
    csv_options.integers_as_text = feature_type == drift::FeatureType::kCategorical;

    DRIFTGUARD_ASSIGN_OR_RETURN(Inputs inputs, LoadInputs(options, csv_options));

    std::string feature = options.feature;
    if (!feature.empty()) {
        DRIFTGUARD_ASSIGN_OR_RETURN(inputs.reference, inputs.reference.Select(feature));
        DRIFTGUARD_ASSIGN_OR_RETURN(inputs.current, inputs.current.Select(feature));
    } else if (inputs.reference.NumColumns() > 0) {
        feature = inputs.reference.ColumnAt(0).name;
    }

    double threshold = 0.0;
    if (options.threshold.has_value()) {
        threshold = *options.threshold;
    } else if (config_path.has_value()) {
        DRIFTGUARD_ASSIGN_OR_RETURN(threshold,
                                    drift::ResolveThreshold(config, metric, feature));
        DRIFTGUARD_LOG_INFO("Resolved {} threshold for '{}' from config: {}",
                            metric, feature, threshold);
    } else {
        return ValidationError("either --threshold or --config is required");
    }

    return drift::RunDriftPipeline(inputs.reference, inputs.current, feature_type,
                                   metric, threshold);
}

}  // namespace

void ConfigureApp(CLI::App& app, CliOptions& options) {
    app.add_option("reference", options.reference_path, "Path to reference CSV file");
    app.add_option("current", options.current_path,
                   "Path to current CSV file (omit to window the reference file)");
    app.add_option("-m,--metric", options.metric, "Drift metric (psi, ks, chi_square)");
    app.add_option("-t,--threshold", options.threshold, "Drift detection threshold");
    app.add_option("--feature-type", options.feature_type,
                   "Feature type (numerical, categorical)");
    app.add_option("-f,--feature", options.feature,
                   "Column to compare (default: first column)");
    app.add_option("-c,--config", options.config_path,
                   "YAML configuration file for threshold resolution");
    app.add_option("--reference-window", options.reference_window,
                   "Rows from the head of the reference file used as reference");
    app.add_option("--current-window", options.current_window,
                   "Rows from the tail of the reference file used as current");
    app.add_option("--delimiter", options.delimiter, "CSV field delimiter");
    app.add_option("--log-level", options.log_level,
                   "Log level (trace, debug, info, warn, error)");
    app.add_flag("-v,--version", options.version, "Print version and exit");
}

int Run(const CliOptions& options, std::ostream& out) {
    if (options.version) {
        out << "driftguard v" << kVersion << std::endl;
        return kExitNoDrift;
    }

    if (!options.log_level.empty()) {
        SetLogLevel(ParseLogLevel(options.log_level));
    }

    auto report = Execute(options);
    if (!report.ok()) {
        DRIFTGUARD_LOG_ERROR("Drift check failed ({}): {}",
                             std::string(ErrorCodeToString(GetErrorCode(report.status()))),
                             std::string(report.status().message()));
        FlushLogs();
        return kExitError;
    }
    FlushLogs();

    out << drift::PipelineReportToJson(*report).dump() << std::endl;
    return report->drift_detected ? kExitDrift : kExitNoDrift;
}

int Main(int argc, char** argv, std::ostream& out) {
    CLI::App app{"DriftGuard - distribution drift detection between two datasets"};
    CliOptions options;
    ConfigureApp(app, options);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and friends exit cleanly; every real parse error is exit 1
        return app.exit(e) == 0 ? kExitNoDrift : kExitError;
    }

    return Run(options, out);
}

}  // namespace driftguard::cli
