#pragma once

#include "translation_entry.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

using EntryGroup = std::vector<const TranslationEntry*>;

// Groups every loaded entry by its exact translation value. Built once per
// scan and shared read-only by all project analyses. The indexed entries
// must outlive the index.
class ContentIndex {
public:
    ContentIndex() = default;

    static ContentIndex build(const std::vector<TranslationEntry>& entries);

    // nullptr when no entry carries this value.
    const EntryGroup* find(const std::string& value) const;

    std::size_t value_count() const { return groups_.size(); }
    std::size_t entry_count() const { return entry_count_; }

private:
    std::unordered_map<std::string, EntryGroup> groups_;
    std::size_t entry_count_ = 0;
};

// Entries whose derived project path equals target_project exactly.
// Sub-packages nested below the target are not included.
EntryGroup translations_for_project(const std::string& target_project, const std::vector<TranslationEntry>& entries);

// Classified entries keyed by project path, in path order.
// Unclassifiable entries are left out.
std::map<std::string, EntryGroup> map_translations_by_project(const std::vector<TranslationEntry>& entries);
