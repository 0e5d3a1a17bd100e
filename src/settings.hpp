#pragma once

#include <filesystem>
#include <string>
#include <vector>

struct Settings {
    std::vector<std::string> common_translations_modules_path{
        "packages/manager/modules/common-translations"
    };
    std::string translation_file_regex = R"(^Messages_fr_FR\.json$)";
    std::vector<std::string> skip_directories{
        ".git", "node_modules", "target", ".idea", ".vscode", "dist", "build", "manager-tools"
    };
    std::vector<std::string> project_markers{"apps", "modules"};
};

// Keys absent from the file keep their defaults.
bool load_settings(const std::filesystem::path& path, Settings& settings, std::string& error);

bool validate_settings(const Settings& settings, std::string& error);
