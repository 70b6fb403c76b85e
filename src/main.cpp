// =============================================================================
// saudi-id - Saudi National ID Validator and Generator
// =============================================================================
// Main entry point for the saudi-id command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: validate, generate
// - Global options: verbose, quiet, log-level, log-file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "sid/common/error.h"
#include "sid/common/logger.h"
#include "sid/core/id.h"

#include "commands/generate_command.h"
#include "commands/validate_command.h"

namespace sid::commands {
int runValidate(CLI::App* app);
int runGenerate(CLI::App* app);
}  // namespace sid::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "saudi-id: validate and generate Saudi Arabian national identification numbers\n"
    "An id is 10 digits, starts with 1 (citizen) or 2 (resident) and passes the Luhn check.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1+ = debug
    bool quiet = false;
    std::string logLevel;  // explicit level, overrides -v/-q
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Validate Command Options
// =============================================================================

struct CliValidateOptions {
    std::vector<std::string> ids;
    std::string input;
    bool failFast = false;
};

CliValidateOptions gValidateOpts;

// =============================================================================
// Generate Command Options
// =============================================================================

struct CliGenerateOptions {
    std::string type = "citizen";
    std::size_t count = 1;
    std::uint64_t seed = 0;
    bool unique = false;
};

CliGenerateOptions gGenerateOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupValidateCommand(CLI::App& app) {
    auto* validate = app.add_subcommand("validate", "Validate national ids");
    validate->alias("v");

    validate->add_option("ids", gValidateOpts.ids, "Ids to validate");

    validate->add_option("-i,--input", gValidateOpts.input,
                         "File with one id per line (or '-' for stdin)");

    validate->add_flag("--fail-fast", gValidateOpts.failFast, "Stop at the first invalid id");
}

void setupGenerateCommand(CLI::App& app) {
    auto* generate = app.add_subcommand("generate", "Generate random valid national ids");
    generate->alias("g");

    generate->add_option("-t,--type", gGenerateOpts.type, "Holder category: citizen, resident")
        ->default_val("citizen")
        ->transform(CLI::IsMember({"citizen", "resident"}, CLI::ignore_case));

    generate->add_option("-n,--count", gGenerateOpts.count, "Number of ids to generate")
        ->default_val(1)
        ->check(CLI::Range(std::size_t{1}, sid::commands::kMaxGenerateCount));

    generate->add_option("--seed", gGenerateOpts.seed, "Seed for reproducible output");

    generate->add_flag("--unique", gGenerateOpts.unique, "Do not repeat an id within the batch");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Enable debug logging");
    app.add_flag("-q,--quiet", gOptions.quiet, "Only log errors");
    app.add_option("--log-level", gOptions.logLevel,
                   "Log level: trace, debug, info, warning, error, critical")
        ->check(CLI::IsMember(
            {"trace", "debug", "info", "warning", "warn", "error", "critical", "fatal"},
            CLI::ignore_case));
    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupValidateCommand(app);
    setupGenerateCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        sid::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = sid::log::Level::kWarning;
        if (!gOptions.logLevel.empty()) {
            logConfig.level = sid::log::levelFromString(gOptions.logLevel);
        } else if (gOptions.quiet) {
            logConfig.level = sid::log::Level::kError;
        } else if (gOptions.verbosity >= 1) {
            logConfig.level = sid::log::Level::kDebug;
        }
        sid::log::init(logConfig);
        SID_LOG_DEBUG("Log level: {}", sid::log::levelToString(logConfig.level));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return sid::toExitCode(sid::ErrorCode::kInternalError);
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("validate")) {
            exitCode = sid::commands::runValidate(app.get_subcommand("validate"));
        } else if (app.got_subcommand("generate")) {
            exitCode = sid::commands::runGenerate(app.get_subcommand("generate"));
        }
    } catch (const sid::SIDException& ex) {
        SID_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        SID_LOG_CRITICAL("Unexpected error: {}", ex.what());
        exitCode = sid::toExitCode(sid::ErrorCode::kInternalError);
    }

    sid::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace sid::commands {

int runValidate(CLI::App* app) {
    ValidateOptions opts;
    opts.candidates = gValidateOpts.ids;
    if (app->count("--input") > 0) {
        opts.inputPath = gValidateOpts.input;
    }
    opts.failFast = gValidateOpts.failFast;

    ValidateCommand cmd(std::move(opts));
    return cmd.execute();
}

int runGenerate(CLI::App* app) {
    GenerateOptions opts;
    auto type = core::idTypeFromString(gGenerateOpts.type);
    if (!type) {
        throw UsageError("unknown id type: " + gGenerateOpts.type);
    }
    opts.type = *type;
    opts.count = gGenerateOpts.count;
    if (app->count("--seed") > 0) {
        opts.seed = gGenerateOpts.seed;
    }
    opts.unique = gGenerateOpts.unique;

    GenerateCommand cmd(std::move(opts));
    return cmd.execute();
}

}  // namespace sid::commands
