#include "writer_json.hpp"

nlohmann::json summary_to_json(const DuplicationCounts& summary, std::size_t files_found) {
    return nlohmann::json{
        {"files_found", files_found},
        {"inter_package_duplication", summary.inter_package},
        {"common_translation_duplication", summary.common_translation},
        {"external_projects_duplication", summary.external_projects},
        {"total_duplication", summary.total()},
    };
}

nlohmann::json detailed_report_to_json(const DetailedReport& report, std::size_t files_found) {
    auto duplications = nlohmann::json::array();
    for (const auto& item : report.duplications) {
        auto locations = nlohmann::json::array();
        for (const auto& location : item.locations) {
            locations.push_back({
                {"file_path", location.file_path},
                {"translation_key", location.key},
                {"own_project", location.own_project},
            });
        }

        duplications.push_back({
            {"translation_key", item.key},
            {"translation_value", item.value},
            {"file_path", item.file_path},
            {"duplication_type", duplication_type_names(item.counts)},
            {"occurrences_count", item.occurrences_count},
            {"locations", std::move(locations)},
        });
    }

    return nlohmann::json{
        {"files_found", files_found},
        {"package_path", report.package_path},
        {"global_report", summary_to_json(report.summary, files_found)},
        {"duplications", std::move(duplications)},
    };
}

nlohmann::json global_report_to_json(const GlobalReport& report) {
    auto projects = nlohmann::json::array();
    for (const auto& project : report.projects) {
        auto item = summary_to_json(project.summary, report.files_found);
        item["package_path"] = project.package_path;
        projects.push_back(std::move(item));
    }

    return nlohmann::json{
        {"files_found", report.files_found},
        {"projects", std::move(projects)},
    };
}
