#pragma once

#include "project_classifier.hpp"
#include "translation_entry.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

struct LoadFailure {
    std::filesystem::path path;
    std::string message;
};

struct LoadOptions {
    std::size_t workers = 1;
    // Abort on the first file that fails instead of skipping it.
    bool strict = false;
    // Relative file paths are opened below this directory and recorded as given.
    std::filesystem::path base_dir;
};

struct LoadStats {
    std::size_t files_total = 0;
    std::size_t files_loaded = 0;
    std::size_t entries_total = 0;
    // Members whose value is not a JSON string.
    std::size_t values_skipped = 0;
    std::size_t workers_used = 0;
    std::chrono::milliseconds wall_time{0};
    std::vector<LoadFailure> failures;
};

// Parses one flat JSON translation file. Members whose value is not a
// string are not translations and are left out; skipped_values, when given,
// is increased by their number.
bool load_translation_file(
    const std::filesystem::path& path,
    const ProjectClassifier& classifier,
    std::vector<TranslationEntry>& out_entries,
    std::string& error,
    const std::filesystem::path& base_dir = {},
    std::size_t* skipped_values = nullptr
);

// Loads every file on a worker pool. Output is sorted by file path, then key.
bool load_translations_parallel(
    const std::vector<std::filesystem::path>& files,
    const ProjectClassifier& classifier,
    const LoadOptions& options,
    std::vector<TranslationEntry>& out_entries,
    LoadStats& out_stats,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback = {}
);
