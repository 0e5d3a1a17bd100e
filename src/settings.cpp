#include "settings.hpp"

#include <exception>
#include <fstream>
#include <regex>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

bool read_string_list(
    const nlohmann::json& root,
    const char* key,
    std::vector<std::string>& out,
    std::string& error
) {
    const auto it = root.find(key);
    if (it == root.end()) {
        return true;
    }
    if (!it->is_array()) {
        error = std::string("Setting '") + key + "' must be an array of strings";
        return false;
    }

    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            error = std::string("Setting '") + key + "' must be an array of strings";
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

}  // namespace

bool load_settings(const std::filesystem::path& path, Settings& settings, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "Unable to read settings file: " + path.string();
        return false;
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(in);
    } catch (const std::exception& ex) {
        error = "Invalid JSON in settings file " + path.string() + ": " + ex.what();
        return false;
    }

    if (!root.is_object()) {
        error = "Settings file root is not a JSON object: " + path.string();
        return false;
    }

    Settings loaded = settings;

    if (!read_string_list(root, "common_translations_modules_path", loaded.common_translations_modules_path, error) ||
        !read_string_list(root, "skip_directories", loaded.skip_directories, error) ||
        !read_string_list(root, "project_markers", loaded.project_markers, error)) {
        error += " (" + path.string() + ")";
        return false;
    }

    if (const auto it = root.find("translation_file_regex"); it != root.end()) {
        if (!it->is_string()) {
            error = "Setting 'translation_file_regex' must be a string (" + path.string() + ")";
            return false;
        }
        loaded.translation_file_regex = it->get<std::string>();
    }

    settings = std::move(loaded);
    return true;
}

bool validate_settings(const Settings& settings, std::string& error) {
    if (settings.translation_file_regex.empty()) {
        error = "translation_file_regex must not be empty";
        return false;
    }

    try {
        const std::regex compiled(settings.translation_file_regex, std::regex::ECMAScript);
        (void)compiled;
    } catch (const std::regex_error& ex) {
        error = "Invalid translation_file_regex '" + settings.translation_file_regex + "': " + ex.what();
        return false;
    }

    if (settings.project_markers.empty()) {
        error = "project_markers must list at least one marker segment";
        return false;
    }
    for (const auto& marker : settings.project_markers) {
        if (marker.empty() || marker.find('/') != std::string::npos) {
            error = "Invalid project marker: '" + marker + "'";
            return false;
        }
    }

    for (const auto& path : settings.common_translations_modules_path) {
        if (path.empty()) {
            error = "common_translations_modules_path contains an empty path";
            return false;
        }
    }

    return true;
}
