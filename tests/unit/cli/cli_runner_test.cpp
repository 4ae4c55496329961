/// @file cli_runner_test.cpp
/// @brief Tests for the command-line front end

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cli/cli_runner.h"
#include "common/logging.h"

namespace driftguard::cli {
namespace {

using json = nlohmann::json;

class CliRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("driftguard_cli_" + std::string(
                   ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir_);

        reference_ = Write("reference.csv", "value,group\n1,a\n2,a\n3,b\n4,b\n5,c\n");
        same_ = Write("same.csv", "value,group\n1,a\n2,a\n3,b\n4,b\n5,c\n");
        shifted_ = Write("shifted.csv", "value,group\n10,a\n20,a\n30,b\n40,b\n50,c\n");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string Write(const std::string& name, const std::string& content) {
        const auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    /// Run the CLI with `args` after the program name, capturing stdout
    int Invoke(std::vector<std::string> args) {
        args.insert(args.begin(), "driftguard");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        std::ostringstream out;
        const int code = Main(static_cast<int>(argv.size()), argv.data(), out);
        output_ = out.str();
        return code;
    }

    json Report() const { return json::parse(output_); }

    std::filesystem::path dir_;
    std::string reference_;
    std::string same_;
    std::string shifted_;
    std::string output_;
};

TEST_F(CliRunnerTest, Version) {
    EXPECT_EQ(Invoke({"--version"}), kExitNoDrift);
    EXPECT_EQ(output_, "driftguard v1.0.0\n");
}

TEST_F(CliRunnerTest, NoDriftExitsZero) {
    EXPECT_EQ(Invoke({reference_, same_, "--metric", "psi", "--threshold", "0.1"}),
              kExitNoDrift);

    const json report = Report();
    EXPECT_EQ(report["drift_detected"], false);
    EXPECT_TRUE(report["alerts"].empty());
    EXPECT_DOUBLE_EQ(report["metrics"]["psi"].get<double>(), 0.0);
    EXPECT_EQ(report["window"]["reference_size"], 5);
    EXPECT_EQ(report["window"]["current_size"], 5);
}

TEST_F(CliRunnerTest, DriftExitsTwo) {
    EXPECT_EQ(Invoke({reference_, shifted_, "-m", "ks", "-t", "0.1"}), kExitDrift);

    const json report = Report();
    EXPECT_EQ(report["drift_detected"], true);
    ASSERT_EQ(report["alerts"].size(), 1u);
    EXPECT_EQ(report["alerts"][0]["severity"], "critical");
    EXPECT_DOUBLE_EQ(report["metrics"]["ks"]["statistic"].get<double>(), 1.0);
}

TEST_F(CliRunnerTest, FeatureSelectsColumn) {
    EXPECT_EQ(Invoke({reference_, shifted_, "--metric", "chi_square",
                      "--threshold", "0.05", "--feature", "group",
                      "--feature-type", "categorical"}),
              kExitNoDrift);
    const json report = Report();
    EXPECT_DOUBLE_EQ(report["metrics"]["chi_square"]["statistic"].get<double>(), 0.0);
}

TEST_F(CliRunnerTest, CategoricalKeepsFloatColumnsContinuous) {
    const std::string ref = Write("ref_codes.csv", "code\n1.5\n1.5\n1.5\n1.5\n1.5\n"
                                                   "1.5\n1.5\n1.5\n1.5\n1.5\n");
    const std::string cur = Write("cur_codes.csv", "code\n2.5\n2.5\n2.5\n2.5\n2.5\n"
                                                   "2.5\n2.5\n2.5\n2.5\n2.5\n");

    // Float columns are rejected by the chi-square test, declared categorical or not
    EXPECT_EQ(Invoke({ref, cur, "--metric", "chi_square", "--threshold", "0.05"}),
              kExitError);
    EXPECT_TRUE(output_.empty());

    EXPECT_EQ(Invoke({ref, cur, "--metric", "chi_square", "--threshold", "0.05",
                      "--feature-type", "categorical"}),
              kExitError);
    EXPECT_TRUE(output_.empty());
}

TEST_F(CliRunnerTest, CategoricalReadsIntegerCodesAsLabels) {
    // "007" and "7" are the same number but different codes
    const std::string ref = Write("ref_codes.csv", "code\n007\n007\n007\n007\n007\n"
                                                   "007\n007\n007\n007\n007\n");
    const std::string cur = Write("cur_codes.csv", "code\n7\n7\n7\n7\n7\n"
                                                   "7\n7\n7\n7\n7\n");

    EXPECT_EQ(Invoke({ref, cur, "--metric", "chi_square", "--threshold", "0.05"}),
              kExitNoDrift);
    EXPECT_DOUBLE_EQ(Report()["metrics"]["chi_square"]["p_value"].get<double>(), 1.0);

    EXPECT_EQ(Invoke({ref, cur, "--metric", "chi_square", "--threshold", "0.05",
                      "--feature-type", "categorical"}),
              kExitDrift);
}

TEST_F(CliRunnerTest, NonFiniteValuesExitOne) {
    const std::string with_nan = Write("with_nan.csv", "value\n1.5\nnan\n3.5\n");
    const std::string with_inf = Write("with_inf.csv", "value\n1.5\n2.5\ninf\n");

    EXPECT_EQ(Invoke({with_nan, same_, "--metric", "psi", "--threshold", "0.1"}),
              kExitError);
    EXPECT_TRUE(output_.empty());
    EXPECT_EQ(Invoke({reference_, with_inf, "--metric", "ks", "--threshold", "0.1"}),
              kExitError);
    EXPECT_TRUE(output_.empty());
}

TEST_F(CliRunnerTest, ThresholdFromConfig) {
    const std::string config = Write("config.yaml", R"(
metrics:
  psi:
    default_threshold: 0.1
    feature_thresholds:
      group: 100.0
)");

    EXPECT_EQ(Invoke({reference_, shifted_, "--metric", "psi", "--config", config}),
              kExitDrift);
    EXPECT_DOUBLE_EQ(Report()["alerts"][0]["details"]["threshold"].get<double>(), 0.1);
}

TEST_F(CliRunnerTest, MetricFromConfig) {
    const std::string config = Write("config.yaml", R"(
pipeline:
  metric: ks
metrics:
  ks:
    default_threshold: 0.5
)");

    EXPECT_EQ(Invoke({reference_, same_, "--config", config}), kExitNoDrift);
    EXPECT_TRUE(Report()["metrics"].contains("ks"));
}

TEST_F(CliRunnerTest, ExplicitThresholdWinsOverConfig) {
    const std::string config = Write("config.yaml",
                                     "metrics:\n  psi:\n    default_threshold: 0.1\n");

    EXPECT_EQ(Invoke({reference_, shifted_, "--metric", "psi", "--config", config,
                      "--threshold", "1000"}),
              kExitNoDrift);
}

TEST_F(CliRunnerTest, LogFileFromConfig) {
    const std::string log_path = (dir_ / "logs" / "driftguard.log").string();
    const std::string config = Write("config.yaml",
                                     "logging:\n  file: " + log_path + "\n  max_files: 2\n");

    EXPECT_EQ(Invoke({reference_, shifted_, "--metric", "psi", "--threshold", "0.1",
                      "--config", config}),
              kExitDrift);

    // The run flushes before returning, so the file is complete here
    std::ifstream in(log_path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("Drift check complete: metric=psi"), std::string::npos);
    EXPECT_EQ(contents.str().find("\"drift_detected\""), std::string::npos);

    ShutdownLogging();
    InitLogging();
}

TEST_F(CliRunnerTest, LogFileErrorsExitOne) {
    const std::string bad_size = Write("bad_size.yaml",
                                       "logging:\n  file: x.log\n  max_file_size_mb: 0\n");
    EXPECT_EQ(Invoke({reference_, same_, "--metric", "psi", "--threshold", "0.1",
                      "--config", bad_size}),
              kExitError);

    // A regular file cannot be a log directory
    const std::string unopenable = Write("unopenable.yaml",
                                         "logging:\n  file: " + reference_ + "/run.log\n");
    EXPECT_EQ(Invoke({reference_, same_, "--metric", "psi", "--threshold", "0.1",
                      "--config", unopenable}),
              kExitError);
    EXPECT_TRUE(output_.empty());
    EXPECT_NE(GetLogger(), nullptr);
}

TEST_F(CliRunnerTest, SingleFileWindows) {
    const std::string series = Write("series.csv",
                                     "value\n1\n2\n3\n4\n5\n10\n20\n30\n40\n50\n");

    EXPECT_EQ(Invoke({series, "--metric", "psi", "--threshold", "0.1",
                      "--reference-window", "5", "--current-window", "5"}),
              kExitDrift);

    const json report = Report();
    EXPECT_EQ(report["window"]["reference_size"], 5);
    EXPECT_EQ(report["window"]["current_size"], 5);
}

TEST_F(CliRunnerTest, WindowErrors) {
    // Only one window size
    EXPECT_EQ(Invoke({reference_, "--metric", "psi", "--threshold", "0.1",
                      "--reference-window", "3"}),
              kExitError);

    // Windows with two files
    EXPECT_EQ(Invoke({reference_, same_, "--metric", "psi", "--threshold", "0.1",
                      "--reference-window", "3", "--current-window", "3"}),
              kExitError);

    // Window larger than the file
    EXPECT_EQ(Invoke({reference_, "--metric", "psi", "--threshold", "0.1",
                      "--reference-window", "6", "--current-window", "3"}),
              kExitError);
}

TEST_F(CliRunnerTest, ErrorsExitOne) {
    EXPECT_EQ(Invoke({reference_, same_, "--metric", "wasserstein", "--threshold", "0.1"}),
              kExitError);
    EXPECT_TRUE(output_.empty());

    EXPECT_EQ(Invoke({reference_, same_, "--metric", "psi", "--threshold", "0"}),
              kExitError);
    EXPECT_EQ(Invoke({reference_, (dir_ / "missing.csv").string(), "--metric", "psi",
                      "--threshold", "0.1"}),
              kExitError);
    EXPECT_EQ(Invoke({reference_, same_, "--metric", "psi"}), kExitError);
    EXPECT_EQ(Invoke({reference_, same_, "--threshold", "0.1"}), kExitError);
    EXPECT_EQ(Invoke({"--metric", "psi", "--threshold", "0.1"}), kExitError);
}

TEST_F(CliRunnerTest, ParseErrorsExitOne) {
    EXPECT_EQ(Invoke({reference_, same_, "--bogus"}), kExitError);
    EXPECT_EQ(Invoke({reference_, same_, "--threshold", "abc"}), kExitError);
}

TEST_F(CliRunnerTest, RunWithOptions) {
    CliOptions options;
    options.reference_path = reference_;
    options.current_path = shifted_;
    options.metric = "psi";
    options.threshold = 0.1;

    std::ostringstream out;
    EXPECT_EQ(Run(options, out), kExitDrift);
    EXPECT_EQ(json::parse(out.str())["alerts"][0]["metric"], "psi");
}

}  // namespace
}  // namespace driftguard::cli
