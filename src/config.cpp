#include "config.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

bool parse_size_arg(const std::string& key, const std::string& value, std::size_t& out, std::string& error) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        out = static_cast<std::size_t>(parsed);
        return true;
    } catch (const std::logic_error&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

std::string trim_trailing_slashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}  // namespace

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " [options] global-report [--package-path <path>]\n"
        << "  " << program_name << " [options] detailed-report --package-path <path>\n\n"
        << "Options:\n"
        << "  --root-path <dir>         Monorepo root to scan (default: current directory)\n"
        << "  --config-file-path <f>    Settings file (default: settings.json)\n"
        << "  --package-path <path>     Project to analyse, e.g. packages/manager/apps/zimbra\n"
        << "  --workers <n>             Loader threads (default: hardware concurrency)\n"
        << "  --format <text|json>      Report format (default: text)\n"
        << "  --strict                  Abort when a translation file fails to load\n"
        << "  --no-progress             Disable progress bar output\n"
        << "  -h, --help                Show this help\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "global-report" || arg == "detailed-report") {
            if (have_command) {
                error = "Only one command may be given, got extra: " + arg;
                return false;
            }
            config.command = arg == "global-report" ? Command::GlobalReport : Command::DetailedReport;
            have_command = true;
        } else if (arg == "--root-path") {
            config.root_path = require_value(arg);
        } else if (arg == "--config-file-path") {
            config.config_file_path = require_value(arg);
            config.config_file_explicit = true;
        } else if (arg == "--package-path") {
            config.package_path = trim_trailing_slashes(require_value(arg));
        } else if (arg == "--workers") {
            const std::string value = require_value(arg);
            if (!error.empty()) {
                return false;
            }
            if (!parse_size_arg(arg, value, config.workers, error)) {
                return false;
            }
        } else if (arg == "--format") {
            const std::string value = require_value(arg);
            if (value == "text") {
                config.format = OutputFormat::Text;
            } else if (value == "json") {
                config.format = OutputFormat::Json;
            } else if (error.empty()) {
                error = "Unsupported --format: " + value + " (supported: text, json)";
            }
        } else if (arg == "--strict") {
            config.strict = true;
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (!have_command) {
        error = "The command is missing. Try --help";
        return false;
    }

    if (config.command == Command::DetailedReport && config.package_path.empty()) {
        error = "detailed-report requires --package-path";
        return false;
    }

    if (config.workers == 0) {
        const auto hw = std::thread::hardware_concurrency();
        config.workers = hw == 0 ? 4 : static_cast<std::size_t>(hw);
    }

    if (config.format == OutputFormat::Json) {
        config.show_progress = false;
    }

    return true;
}
