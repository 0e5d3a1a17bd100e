#include "content_index.hpp"

#include <algorithm>

namespace {

void sort_group(EntryGroup& group) {
    std::sort(group.begin(), group.end(), [](const TranslationEntry* a, const TranslationEntry* b) {
        return location_less(*a, *b);
    });
}

}  // namespace

ContentIndex ContentIndex::build(const std::vector<TranslationEntry>& entries) {
    ContentIndex index;
    index.entry_count_ = entries.size();

    for (const auto& entry : entries) {
        index.groups_[entry.value].push_back(&entry);
    }

    for (auto& [value, group] : index.groups_) {
        sort_group(group);
    }

    return index;
}

const EntryGroup* ContentIndex::find(const std::string& value) const {
    const auto it = groups_.find(value);
    if (it == groups_.end()) {
        return nullptr;
    }
    return &it->second;
}

EntryGroup translations_for_project(const std::string& target_project, const std::vector<TranslationEntry>& entries) {
    EntryGroup result;
    for (const auto& entry : entries) {
        if (entry.project && entry.project->project_path == target_project) {
            result.push_back(&entry);
        }
    }
    sort_group(result);
    return result;
}

std::map<std::string, EntryGroup> map_translations_by_project(const std::vector<TranslationEntry>& entries) {
    std::map<std::string, EntryGroup> by_project;
    for (const auto& entry : entries) {
        if (entry.project) {
            by_project[entry.project->project_path].push_back(&entry);
        }
    }
    for (auto& [project, group] : by_project) {
        sort_group(group);
    }
    return by_project;
}
