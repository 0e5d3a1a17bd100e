#pragma once

#include "content_index.hpp"
#include "report.hpp"
#include "settings.hpp"
#include "translation_entry.hpp"
#include "translation_loader.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

struct RepositoryScan {
    std::filesystem::path root_path;
    std::size_t files_found = 0;
    std::vector<TranslationEntry> entries;
    LoadStats load_stats;
};

// Searches root for translation files and loads all of them with paths
// relative to root. Failed files are listed in load_stats.failures unless
// options.strict is set.
bool scan_repository(
    const std::filesystem::path& root,
    const Settings& settings,
    const LoadOptions& options,
    RepositoryScan& out_scan,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback = {}
);

// The scan must stay alive and unmodified while an analysis exists.
class RepositoryAnalysis {
public:
    RepositoryAnalysis(const RepositoryScan& scan, const Settings& settings);

    DuplicationCounts global_report_for_project(const std::string& package_path) const;
    DetailedReport detailed_report_for_project(const std::string& package_path) const;
    GlobalReport global_report_all() const;

private:
    std::vector<DuplicationRecord> analyse_project(const std::string& package_path) const;

    const RepositoryScan& scan_;
    std::vector<std::string> common_paths_;
    ContentIndex index_;
};
