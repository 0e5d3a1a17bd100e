#include "analysis.hpp"
#include "config.hpp"
#include "progress.hpp"
#include "settings.hpp"
#include "writer_json.hpp"
#include "writer_text.hpp"

#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>

namespace {

bool resolve_settings(const AppConfig& config, Settings& settings, std::string& error) {
    std::error_code ec;
    const bool exists = std::filesystem::exists(config.config_file_path, ec);

    if (!exists && !config.config_file_explicit) {
        std::cerr << "[info] no " << config.config_file_path.string() << " found, using default settings\n";
    } else if (!load_settings(config.config_file_path, settings, error)) {
        return false;
    }

    return validate_settings(settings, error);
}

void report_load_failures(const LoadStats& stats) {
    for (const auto& failure : stats.failures) {
        std::cerr << "[skip] " << failure.message << "\n";
    }
    if (stats.values_skipped > 0) {
        std::cerr << "[skip] " << stats.values_skipped << " non-string translation values ignored\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string error;

    if (!parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        print_usage(argv[0]);
        return error == "help" ? 0 : 1;
    }

    if (config.root_path.empty()) {
        config.root_path = std::filesystem::current_path();
    }

    Settings settings;
    if (!resolve_settings(config, settings, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return 1;
    }

    const bool text_output = config.format == OutputFormat::Text;
    if (text_output) {
        std::cout << "Root path : " << config.root_path.string() << "\n";
    }

    LoadOptions load_options;
    load_options.workers = config.workers;
    load_options.strict = config.strict;

    ProgressPrinter progress_printer(std::cerr);
    std::function<void(std::size_t, std::size_t)> progress;
    if (config.show_progress) {
        progress = [&progress_printer](std::size_t done, std::size_t total) {
            progress_printer.update(done, total);
        };
    }

    RepositoryScan scan;
    const bool scanned = scan_repository(
        config.root_path,
        settings,
        load_options,
        scan,
        error,
        progress
    );
    progress_printer.finish();
    if (!scanned) {
        std::cerr << "[fatal] " << error << "\n";
        return 1;
    }

    report_load_failures(scan.load_stats);

    if (text_output) {
        std::cout
            << "Found " << scan.files_found << " files"
            << " loaded=" << scan.load_stats.files_loaded
            << " failed=" << scan.load_stats.failures.size()
            << " translations=" << scan.load_stats.entries_total
            << " workers=" << scan.load_stats.workers_used
            << " time_ms=" << scan.load_stats.wall_time.count()
            << "\n";
    }

    const RepositoryAnalysis analysis(scan, settings);

    try {
        if (config.command == Command::DetailedReport) {
            const auto report = analysis.detailed_report_for_project(config.package_path);
            if (text_output) {
                write_detailed_text(std::cout, report, config.root_path);
            } else {
                std::cout << detailed_report_to_json(report, scan.files_found).dump(2) << "\n";
            }
        } else if (!config.package_path.empty()) {
            const auto summary = analysis.global_report_for_project(config.package_path);
            if (text_output) {
                std::cout << "Analyse project : " << config.package_path << "\n";
                write_summary_text(std::cout, summary);
            } else {
                std::cout << summary_to_json(summary, scan.files_found).dump(2) << "\n";
            }
        } else {
            const auto report = analysis.global_report_all();
            if (text_output) {
                write_global_report_text(std::cout, report);
            } else {
                std::cout << global_report_to_json(report).dump(2) << "\n";
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        // File paths that are not valid UTF-8 cannot be serialized.
        std::cerr << "[fatal] failed to serialize report: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
