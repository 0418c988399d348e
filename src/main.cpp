/// @file main.cpp
/// @brief strata_bridge entry point - runs JSON commands against a model
///
/// Reads one JSON request per line from stdin (or from --script FILE) and
/// writes one JSON response per line to stdout. Logging goes to stderr so
/// the response stream stays clean.
///
/// Configuration is layered: built-in defaults, an optional TOML file
/// (--config FILE), STRATA_* environment variables, then command-line flags.

#include <strata/bridge/config.hpp>
#include <strata/bridge/dispatcher.hpp>
#include <strata/bridge/element_operations.hpp>
#include <strata/model/memory_model.hpp>
#include <strata/ops/registry.hpp>
#include <strata/core/log.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Reads JSON requests {\"method\": ..., \"params\": {...}} one per line\n"
              << "and writes one JSON response per line.\n"
              << "\n"
              << "Options:\n"
              << "  --help, -h                       Show this help message\n"
              << "  --version, -v                    Show version information\n"
              << "  --config FILE                    Load settings from a TOML file\n"
              << "  --script FILE                    Read requests from FILE instead of stdin\n"
              << "  --log-level LEVEL                trace, debug, info, warn, error, critical, off\n"
              << "  --log-directory DIR              Directory for the rotating log file\n"
              << "  --log-file                       Enable the rotating log file\n"
              << "  --bridge.document_title NAME     Title of the in-memory document\n"
              << "  --batch.default_name NAME        Name used for unnamed batches\n"
              << "  --batch.stop_on_error BOOL       Abort batches at the first failure\n"
              << "  --batch.continue_on_warning BOOL Let warnings through at commit\n"
              << "  --batch.allow_partial_success BOOL\n"
              << "\n"
              << "Examples:\n"
              << "  echo '{\"method\":\"listMethods\"}' | " << program_name << "\n"
              << "  " << program_name << " --config strata.toml --script batch.jsonl\n";
}

void print_version() {
    std::cout << "strata_bridge 0.1.0\n";
}

/// Process request lines until end of input
std::size_t run_stream(std::istream& in, strata_bridge::CommandDispatcher& dispatcher) {
    std::size_t handled = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        std::cout << dispatcher.handle_line(line) << std::endl;
        ++handled;
    }
    return handled;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        }
    }

    strata_bridge::ConfigManager config;
    config.setup_defaults();
    config.load_environment();

    auto parsed = config.parse_args(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().message() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    auto config_path = config.get_string(strata_bridge::config_keys::CONFIG_PATH);
    if (!config_path.empty()) {
        auto loaded = config.load_toml(config_path);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().message() << "\n";
            return 1;
        }
    }

    auto settings = config.build_bridge_config();
    strata_core::configure_logging(settings.log);

    STRATA_LOG_INFO("strata_bridge starting (document '{}')", settings.document_title);
    if (!config_path.empty()) {
        STRATA_LOG_INFO("Configuration loaded from {}", config_path);
    }

    strata_model::MemoryModel model(settings.document_title);

    strata_ops::OperationRegistry registry;
    strata_bridge::register_element_operations(registry);
    STRATA_LOG_INFO("{} operations registered", registry.size());

    strata_bridge::CommandDispatcher dispatcher(registry, model, settings);

    std::size_t handled = 0;
    if (settings.script_path.empty()) {
        handled = run_stream(std::cin, dispatcher);
    } else {
        fs::path script(settings.script_path);
        std::ifstream file(script);
        if (!file) {
            STRATA_LOG_ERROR("Cannot open script: {}", script.string());
            strata_core::shutdown_logging();
            return 1;
        }
        STRATA_LOG_INFO("Running script: {}", script.string());
        handled = run_stream(file, dispatcher);
    }

    if (dispatcher.session().has_active()) {
        STRATA_LOG_WARN("Input ended with group '{}' still open, rolling back",
            dispatcher.session().status().name);
        auto rolled = dispatcher.session().rollback();
        if (!rolled) {
            STRATA_LOG_ERROR("Rollback of open group failed: {}", rolled.error().message());
        }
    }

    STRATA_LOG_DEBUG("{}", strata_core::debug::error_stats_summary());
    STRATA_LOG_INFO("Handled {} requests, {} elements in '{}'",
        handled, model.element_count(), model.title());

    strata_core::shutdown_logging();
    return 0;
}
