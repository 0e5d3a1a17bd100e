#include "analysis.hpp"

#include "duplication_analyzer.hpp"
#include "file_search.hpp"
#include "project_classifier.hpp"

bool scan_repository(
    const std::filesystem::path& root,
    const Settings& settings,
    const LoadOptions& options,
    RepositoryScan& out_scan,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback
) {
    out_scan = RepositoryScan{};
    out_scan.root_path = root;

    std::vector<std::filesystem::path> files;
    if (!search_translation_files(root, settings.translation_file_regex, settings.skip_directories, files, error)) {
        return false;
    }
    out_scan.files_found = files.size();

    // Entries carry paths relative to root.
    for (auto& file : files) {
        file = file.lexically_relative(root);
    }

    LoadOptions relative_options = options;
    relative_options.base_dir = root;

    const ProjectClassifier classifier(settings.project_markers);
    return load_translations_parallel(
        files,
        classifier,
        relative_options,
        out_scan.entries,
        out_scan.load_stats,
        error,
        progress_callback
    );
}

RepositoryAnalysis::RepositoryAnalysis(const RepositoryScan& scan, const Settings& settings)
    : scan_(scan),
      common_paths_(settings.common_translations_modules_path),
      index_(ContentIndex::build(scan.entries)) {}

std::vector<DuplicationRecord> RepositoryAnalysis::analyse_project(const std::string& package_path) const {
    const auto project_entries = translations_for_project(package_path, scan_.entries);
    return analyse_duplication(package_path, project_entries, index_, common_paths_);
}

DuplicationCounts RepositoryAnalysis::global_report_for_project(const std::string& package_path) const {
    return summarize_duplication(analyse_project(package_path));
}

DetailedReport RepositoryAnalysis::detailed_report_for_project(const std::string& package_path) const {
    return assemble_detailed_report(package_path, analyse_project(package_path));
}

GlobalReport RepositoryAnalysis::global_report_all() const {
    GlobalReport report;
    report.files_found = scan_.files_found;

    for (const auto& [package_path, project_entries] : map_translations_by_project(scan_.entries)) {
        const auto records = analyse_duplication(package_path, project_entries, index_, common_paths_);
        report.projects.push_back({package_path, summarize_duplication(records)});
    }

    return report;
}
