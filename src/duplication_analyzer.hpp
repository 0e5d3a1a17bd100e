#pragma once

#include "content_index.hpp"
#include "translation_entry.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Independent per-category tallies. A single value can count in several
// categories at once.
struct DuplicationCounts {
    std::size_t inter_package = 0;
    std::size_t common_translation = 0;
    std::size_t external_projects = 0;

    std::size_t total() const { return inter_package + common_translation + external_projects; }

    DuplicationCounts& operator+=(const DuplicationCounts& other) {
        inter_package += other.inter_package;
        common_translation += other.common_translation;
        external_projects += other.external_projects;
        return *this;
    }

    bool operator==(const DuplicationCounts&) const = default;
};

struct DuplicationRecord {
    const TranslationEntry* entry = nullptr;
    // Whole content index group for entry->value, sorted by file path then key.
    const EntryGroup* members = nullptr;
    std::size_t occurrences_count = 0;
    DuplicationCounts counts;
};

// One record per project entry whose value occurs more than once in the
// corpus, in project_entries order. Group members equal to the entry itself
// (same file and key) are never counted. Members without a project only add
// to occurrences_count.
std::vector<DuplicationRecord> analyse_duplication(
    const std::string& target_project,
    const EntryGroup& project_entries,
    const ContentIndex& content_index,
    const std::vector<std::string>& common_translation_paths
);
