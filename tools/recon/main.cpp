/**
 * @file main.cpp
 * @brief recon CLI entry point
 *
 * Commands:
 *   root      - Show the resolved build root and repository root
 *   dry-run   - Classify results, write patch and summary
 *   run       - Classify results, apply them, remove emptied directories
 *   version   - Show version information
 */

#include "recon/build_root.hpp"
#include "recon/common.hpp"
#include "recon/json_io.hpp"
#include "recon/log.hpp"
#include "recon/print.hpp"
#include "recon/project.hpp"
#include "recon/report.hpp"
#include "recon/report/apply.hpp"
#include "recon/results.hpp"
#include "recon/results_io.hpp"
#include "recon/schema_validate.hpp"
#include "recon/version.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace {

constexpr const char* kDefaultOutput = "./target/rewrite";

void print_version()
{
    std::println("recon {} ({})", recon::kVersion, recon::kBuildId);
    std::println("  build_session: {}", recon::kBuildSessionSchema);
    std::println("  results:       {}", recon::kResultsSchema);
    std::println("  summary:       {}", recon::kSummarySchema);
}

void print_help()
{
    std::print(R"(recon - Reconcile the results of automated source transformations

Usage: recon <command> [options]

Commands:
  root        Show the resolved build root and repository root
  dry-run     Classify results, write rewrite.patch and summary.json
  run         Apply results to the working tree and remove emptied directories
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'recon <command> --help' for command-specific options.
)");
}

void print_root_help()
{
    std::print(R"(Usage: recon root [options]

Show the canonical build root and the enclosing repository root

Options:
  --session FILE            Path to build_session.json (required)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --config FILE             Configuration file (config.v1)
  --help, -h                Show this help
)");
}

void print_reconcile_help(std::string_view command)
{
    std::print(R"(Usage: recon {} [options]

Options:
  --session FILE            Path to build_session.json (required)
  --results FILE            Path to results.json from the transformation engine (required)
  --output DIR, -o          Output directory (default: {})
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --config FILE             Configuration file (config.v1)
  --fail-on-changes         Exit with status 1 when changes would be made (dry-run only)
  --verbose                 Enable debug logging
  --help, -h                Show this help

Output:
  <output>/rewrite.patch
  <output>/summary.json
)",
               command,
               kDefaultOutput);
}

struct CliOptions
{
    std::optional<std::string> session;
    std::optional<std::string> results;
    std::optional<std::string> output;
    std::optional<std::string> config;
    std::string schema_dir;
    std::optional<bool> fail_on_changes;
    std::optional<bool> verbose;
    bool show_help;
};

struct Settings
{
    std::string session;
    std::string results;
    std::string output;
    std::string schema_dir;
    bool fail_on_changes;
    bool verbose;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> recon::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            recon::Error::make("MissingArgument",
                               std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] auto set_value_option(std::string_view arg,
                                    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                    std::span<char*> args,
                                    std::size_t idx,
                                    CliOptions& options) -> recon::Result<bool>
{
    std::optional<std::string>* target = nullptr;
    if (arg == "--session") {
        target = &options.session;
    } else if (arg == "--results") {
        target = &options.results;
    } else if (arg == "--output" || arg == "-o") {
        target = &options.output;
    } else if (arg == "--config") {
        target = &options.config;
    } else if (arg != "--schema-dir") {
        return recon::Result<bool>{false};
    }

    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (target == nullptr) {
        options.schema_dir = *value;
    } else {
        *target = *value;
    }
    return recon::Result<bool>{true};
}

[[nodiscard]] recon::Result<CliOptions> parse_args(std::span<char*> args)
{
    CliOptions options{.session = std::nullopt,
                       .results = std::nullopt,
                       .output = std::nullopt,
                       .config = std::nullopt,
                       .schema_dir = "schemas",
                       .fail_on_changes = std::nullopt,
                       .verbose = std::nullopt,
                       .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--fail-on-changes") {
            options.fail_on_changes = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        auto handled = set_value_option(arg, args, idx, options);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                recon::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
        ++idx;
    }
    return options;
}

// Explicit flags win over the configuration file, which wins over defaults.
[[nodiscard]] recon::Result<Settings> resolve_settings(const CliOptions& options)
{
    nlohmann::json config = nlohmann::json::object();
    if (options.config) {
        auto loaded = recon::common::read_json_file(*options.config);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        if (auto valid =
                recon::common::validate_document(*loaded, options.schema_dir, recon::kConfigSchema);
            !valid) {
            return std::unexpected(valid.error());
        }
        config = std::move(*loaded);
    }

    return Settings{
        .session = options.session.value_or(config.value("session", std::string{})),
        .results = options.results.value_or(config.value("results", std::string{})),
        .output = options.output.value_or(config.value("output", std::string(kDefaultOutput))),
        .schema_dir = options.schema_dir,
        .fail_on_changes = options.fail_on_changes.value_or(config.value("fail_on_changes", false)),
        .verbose = options.verbose.value_or(config.value("verbose", false)),
    };
}

[[nodiscard]] recon::Result<recon::results::ResultsContainer>
reconcile(const Settings& settings, const recon::log::Logger& logger)
{
    auto session = recon::project::load_session(settings.session, settings.schema_dir);
    if (!session) {
        return std::unexpected(session.error());
    }
    auto repository_root = recon::project::repository_root(*session);
    if (!repository_root) {
        return std::unexpected(repository_root.error());
    }
    logger.info(std::format("Using repository root {}", repository_root->generic_string()));

    auto document = recon::results::load_results(settings.results, settings.schema_dir);
    if (!document) {
        return std::unexpected(document.error());
    }
    std::string recipes;
    for (const auto& recipe : document->active_recipes) {
        recipes += recipes.empty() ? recipe : ", " + recipe;
    }
    logger.info(std::format("Using active recipe(s) [{}]", recipes));

    auto selected = recon::results::select_results(std::move(*document), logger);
    return recon::results::ResultsContainer(*repository_root, std::move(selected), logger);
}

[[nodiscard]] int report_first_exception(const recon::results::ResultsContainer& container,
                                         const Settings& settings,
                                         const recon::log::Logger& logger)
{
    const auto first_exception = container.first_exception();
    logger.error("The recipe produced an error. Please report this to the recipe author.");
    if (auto written = recon::report::write_reports(container,
                                                    std::nullopt,
                                                    settings.output,
                                                    settings.schema_dir);
        !written) {
        logger.warn(std::format("Failed to write reports: {}", written.error().message));
    }
    std::println(stderr, "Error: {}", first_exception ? first_exception->message : "recipe error");
    return 1;
}

[[nodiscard]] int run_root(const Settings& settings)
{
    auto session = recon::project::load_session(settings.session, settings.schema_dir);
    if (!session) {
        std::println(stderr, "Error: {}", session.error().message);
        return 1;
    }
    auto build_root = recon::project::resolve_build_root(*session);
    if (!build_root) {
        std::println(stderr, "Error: {}", build_root.error().message);
        return 1;
    }
    std::println("[root] {}", build_root->generic_string());
    std::println("  repository: {}",
                 recon::project::locate_repository_root(*build_root).generic_string());
    return 0;
}

[[nodiscard]] int run_dry_run(const Settings& settings, const recon::log::Logger& logger)
{
    auto container = reconcile(settings, logger);
    if (!container) {
        std::println(stderr, "Error: {}", container.error().message);
        return 1;
    }
    if (container->first_exception()) {
        return report_first_exception(*container, settings, logger);
    }

    if (!container->is_not_empty()) {
        logger.info("Applying recipes would make no changes. No patch file generated.");
    } else {
        recon::report::log_changes(*container, recon::report::RunMode::kDryRun, logger);
    }
    if (auto written = recon::report::write_reports(*container,
                                                    std::nullopt,
                                                    settings.output,
                                                    settings.schema_dir);
        !written) {
        std::println(stderr, "Error: failed to write reports: {}", written.error().message);
        return 1;
    }
    if (!container->is_not_empty()) {
        return 0;
    }

    const auto patch = std::filesystem::path(settings.output) / recon::report::kPatchFileName;
    logger.warn("Patch file available:");
    logger.warn(std::format("    {}", patch.generic_string()));
    logger.warn("Run 'recon run' to apply the recipes.");
    if (settings.fail_on_changes) {
        std::println(stderr, "Error: Applying recipes would make changes. See logs for more details.");
        return 1;
    }
    return 0;
}

[[nodiscard]] int run_run(const Settings& settings, const recon::log::Logger& logger)
{
    auto container = reconcile(settings, logger);
    if (!container) {
        std::println(stderr, "Error: {}", container.error().message);
        return 1;
    }
    if (container->first_exception()) {
        return report_first_exception(*container, settings, logger);
    }

    std::optional<recon::results::CleanupReport> cleanup;
    if (container->is_not_empty()) {
        recon::report::log_changes(*container, recon::report::RunMode::kRun, logger);
        if (auto applied = recon::report::apply_changes(*container); !applied) {
            std::println(stderr, "Error: {}", applied.error().message);
            return 1;
        }
        cleanup = container->newly_empty_directories();
        for (const auto& dir : cleanup->removed) {
            logger.info(std::format("Deleted empty directory {}", dir.generic_string()));
        }
        for (const auto& failure : cleanup->failures) {
            logger.warn(failure.message);
        }
    } else {
        logger.info("Applying recipes made no changes.");
    }

    if (auto written = recon::report::write_reports(*container,
                                                    cleanup,
                                                    settings.output,
                                                    settings.schema_dir);
        !written) {
        std::println(stderr, "Error: failed to write reports: {}", written.error().message);
        return 1;
    }
    if (container->is_not_empty()) {
        logger.warn("Please review and commit the results.");
    }
    return 0;
}

int cmd_root(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_root_help();
        return 0;
    }
    auto settings = resolve_settings(*options);
    if (!settings) {
        std::println(stderr, "Error: {}", settings.error().message);
        return 1;
    }
    if (settings->session.empty()) {
        std::println(stderr, "Error: --session is required");
        print_root_help();
        return 1;
    }
    return run_root(*settings);
}

int cmd_reconcile(std::string_view command, int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_reconcile_help(command);
        return 0;
    }
    auto settings = resolve_settings(*options);
    if (!settings) {
        std::println(stderr, "Error: {}", settings.error().message);
        return 1;
    }
    if (settings->session.empty() || settings->results.empty()) {
        std::println(stderr, "Error: --session and --results are required");
        print_reconcile_help(command);
        return 1;
    }

    const recon::log::Logger logger(settings->verbose ? recon::log::Level::kDebug
                                                      : recon::log::Level::kInfo);
    if (command == "run") {
        return run_run(*settings, logger);
    }
    return run_dry_run(*settings, logger);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "root") {
            return cmd_root(sub_argc, sub_argv);
        }
        if (cmd == "dry-run" || cmd == "run") {
            return cmd_reconcile(cmd, sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
