#pragma once

#include "duplication_analyzer.hpp"

#include <cstddef>
#include <string>
#include <vector>

struct DuplicationLocation {
    std::string file_path;
    std::string key;
    bool own_project = false;
};

struct DetailedDuplication {
    std::string value;
    // First target-project entry carrying the value.
    std::string file_path;
    std::string key;
    std::size_t occurrences_count = 0;
    // Summed over every target-project entry carrying this value.
    DuplicationCounts counts;
    std::vector<DuplicationLocation> locations;
};

struct DetailedReport {
    std::string package_path;
    DuplicationCounts summary;
    std::vector<DetailedDuplication> duplications;
};

struct ProjectSummary {
    std::string package_path;
    DuplicationCounts summary;
};

struct GlobalReport {
    std::size_t files_found = 0;
    std::vector<ProjectSummary> projects;
};

// Sum of the per-record counts in each category.
DuplicationCounts summarize_duplication(const std::vector<DuplicationRecord>& records);

// One entry per distinct value, ordered by descending occurrence count and
// then by value.
DetailedReport assemble_detailed_report(const std::string& package_path, const std::vector<DuplicationRecord>& records);

// "InterPackage", "CommonTranslation", "ExternalProjects" for each non-zero counter.
std::vector<std::string> duplication_type_names(const DuplicationCounts& counts);
