#include "duplication_analyzer.hpp"

#include "project_classifier.hpp"

std::vector<DuplicationRecord> analyse_duplication(
    const std::string& target_project,
    const EntryGroup& project_entries,
    const ContentIndex& content_index,
    const std::vector<std::string>& common_translation_paths
) {
    std::vector<DuplicationRecord> records;

    for (const TranslationEntry* entry : project_entries) {
        const EntryGroup* group = content_index.find(entry->value);
        if (group == nullptr || group->size() <= 1) {
            continue;
        }

        DuplicationRecord record;
        record.entry = entry;
        record.members = group;
        record.occurrences_count = group->size();

        for (const TranslationEntry* member : *group) {
            if (member == entry || same_location(*member, *entry)) {
                continue;
            }
            if (!member->project) {
                continue;
            }

            const auto& member_project = member->project->project_path;
            if (member_project == target_project) {
                ++record.counts.inter_package;
            } else if (is_common_translations(member_project, common_translation_paths)) {
                ++record.counts.common_translation;
            } else {
                ++record.counts.external_projects;
            }
        }

        records.push_back(record);
    }

    return records;
}
