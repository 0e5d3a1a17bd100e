#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Collects regular files under root whose file name matches regex_pattern.
// Directories named in skip_directories are never entered, at any depth.
// Results are sorted.
bool search_translation_files(
    const std::filesystem::path& root,
    const std::string& regex_pattern,
    const std::vector<std::string>& skip_directories,
    std::vector<std::filesystem::path>& out_files,
    std::string& error
);
