#include "writer_text.hpp"

#include <string>

namespace {

std::string display_path(const std::string& file_path, const std::filesystem::path& root_path) {
    if (root_path.empty()) {
        return file_path;
    }

    const std::filesystem::path path(file_path);
    const auto relative = path.lexically_relative(root_path);
    if (relative.empty() || relative.native().starts_with("..")) {
        return file_path;
    }
    return relative.generic_string();
}

std::string join_types(const DuplicationCounts& counts) {
    std::string joined;
    for (const auto& name : duplication_type_names(counts)) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined.empty() ? "None" : joined;
}

}  // namespace

void write_summary_text(std::ostream& out, const DuplicationCounts& summary) {
    out << "Global duplication report :\n";
    out << "Inter-package duplication : " << summary.inter_package << "\n";
    out << "Common-translation duplication : " << summary.common_translation << "\n";
    out << "External-projects duplication : " << summary.external_projects << "\n";
    out << "Total duplication : " << summary.total() << "\n";
}

void write_detailed_text(
    std::ostream& out,
    const DetailedReport& report,
    const std::filesystem::path& root_path
) {
    out << "Analyse project : " << report.package_path << "\n";
    write_summary_text(out, report.summary);

    for (const auto& item : report.duplications) {
        out << "\n";
        out << " ========= Duplication seen : " << item.occurrences_count
            << " times, type : " << join_types(item.counts) << " ==========\n";
        out << " ========= " << item.value << " ==========\n";

        for (const auto& location : item.locations) {
            out << (location.own_project ? "** " : "   ")
                << display_path(location.file_path, root_path)
                << " - " << location.key << "\n";
        }
    }

    out << "\n";
}

void write_global_report_text(std::ostream& out, const GlobalReport& report) {
    for (const auto& project : report.projects) {
        out << "Analyse project : " << project.package_path << "\n";
        write_summary_text(out, project.summary);
        out << "\n";
    }
}
