#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

enum class Command {
    GlobalReport,
    DetailedReport
};

enum class OutputFormat {
    Text,
    Json
};

struct AppConfig {
    Command command = Command::GlobalReport;
    std::filesystem::path root_path;
    std::filesystem::path config_file_path = "settings.json";
    bool config_file_explicit = false;
    std::string package_path;
    std::size_t workers = 0;
    OutputFormat format = OutputFormat::Text;
    bool strict = false;
    bool show_progress = true;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);
