#include "file_search.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

bool search_translation_files(
    const std::filesystem::path& root,
    const std::string& regex_pattern,
    const std::vector<std::string>& skip_directories,
    std::vector<std::filesystem::path>& out_files,
    std::string& error
) {
    out_files.clear();

    std::regex file_regex;
    try {
        file_regex = std::regex(regex_pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& ex) {
        error = "Invalid regex pattern: " + regex_pattern + " - " + ex.what();
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) {
        error = "Root path does not exist: " + root.string();
        return false;
    }
    if (!std::filesystem::is_directory(root, ec)) {
        error = "Root path is not a directory: " + root.string();
        return false;
    }

    const std::unordered_set<std::string> skipped(skip_directories.begin(), skip_directories.end());

    std::filesystem::recursive_directory_iterator it(
        root,
        std::filesystem::directory_options::skip_permission_denied,
        ec
    );
    if (ec) {
        error = "Unable to read path: " + root.string() + " (" + ec.message() + ")";
        return false;
    }

    const std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        std::error_code type_ec;

        if (entry.is_directory(type_ec)) {
            if (skipped.contains(entry.path().filename().string())) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(type_ec) &&
                   std::regex_search(entry.path().filename().string(), file_regex)) {
            out_files.push_back(entry.path());
        }

        it.increment(ec);
        if (ec) {
            error = "Unable to read path under " + root.string() + " (" + ec.message() + ")";
            return false;
        }
    }

    std::sort(out_files.begin(), out_files.end());
    return true;
}
