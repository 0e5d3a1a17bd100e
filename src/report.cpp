#include "report.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

DuplicationCounts summarize_duplication(const std::vector<DuplicationRecord>& records) {
    DuplicationCounts summary;
    for (const auto& record : records) {
        summary += record.counts;
    }
    return summary;
}

DetailedReport assemble_detailed_report(const std::string& package_path, const std::vector<DuplicationRecord>& records) {
    DetailedReport report;
    report.package_path = package_path;
    report.summary = summarize_duplication(records);

    std::unordered_map<std::string, std::size_t> slot_by_value;

    for (const auto& record : records) {
        const auto& value = record.entry->value;
        const auto [it, inserted] = slot_by_value.try_emplace(value, report.duplications.size());
        if (!inserted) {
            report.duplications[it->second].counts += record.counts;
            continue;
        }

        DetailedDuplication item;
        item.value = value;
        item.file_path = record.entry->file_path;
        item.key = record.entry->key;
        item.occurrences_count = record.occurrences_count;
        item.counts = record.counts;
        item.locations.reserve(record.members->size());
        for (const TranslationEntry* member : *record.members) {
            DuplicationLocation location;
            location.file_path = member->file_path;
            location.key = member->key;
            location.own_project = member->project && member->project->project_path == package_path;
            item.locations.push_back(std::move(location));
        }
        report.duplications.push_back(std::move(item));
    }

    std::sort(report.duplications.begin(), report.duplications.end(), [](const auto& a, const auto& b) {
        if (a.occurrences_count != b.occurrences_count) {
            return a.occurrences_count > b.occurrences_count;
        }
        return a.value < b.value;
    });

    return report;
}

std::vector<std::string> duplication_type_names(const DuplicationCounts& counts) {
    std::vector<std::string> names;
    if (counts.inter_package > 0) {
        names.emplace_back("InterPackage");
    }
    if (counts.common_translation > 0) {
        names.emplace_back("CommonTranslation");
    }
    if (counts.external_projects > 0) {
        names.emplace_back("ExternalProjects");
    }
    return names;
}
