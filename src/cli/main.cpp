/// @file main.cpp
/// @brief DriftGuard command-line entry point

#include <iostream>

#include "cli/cli_runner.h"
#include "common/logging.h"

int main(int argc, char* argv[]) {
    driftguard::LogConfig log_config;
    log_config.name = "driftguard";
    driftguard::InitLogging(log_config);

    const int exit_code = driftguard::cli::Main(argc, argv, std::cout);

    driftguard::ShutdownLogging();
    return exit_code;
}
