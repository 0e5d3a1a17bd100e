#include "project_classifier.hpp"

#include <utility>

namespace {

struct PathSegment {
    std::string name;
    // Offset one past the segment's last character in the source path.
    std::size_t end = 0;
};

std::vector<PathSegment> split_segments(const std::string& path) {
    std::vector<PathSegment> segments;
    std::string current;
    for (std::size_t i = 0; i < path.size(); ++i) {
        const char c = path[i];
        if (c == '/' || c == '\\') {
            segments.push_back({current, i});
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    segments.push_back({current, path.size()});
    return segments;
}

std::string trim_trailing_separators(std::string path) {
    while (path.size() > 1 && (path.back() == '/' || path.back() == '\\')) {
        path.pop_back();
    }
    return path;
}

}  // namespace

const char* package_type_name(PackageType type) {
    switch (type) {
        case PackageType::App:
            return "apps";
        case PackageType::Module:
            return "modules";
    }
    return "modules";
}

ProjectClassifier::ProjectClassifier()
    : markers_{"apps", "modules"} {}

ProjectClassifier::ProjectClassifier(std::vector<std::string> markers)
    : markers_(std::move(markers)) {}

std::optional<ProjectInfo> ProjectClassifier::classify(const std::string& file_path) const {
    const auto segments = split_segments(file_path);

    // The last segment is the file name and can never be a project name.
    for (std::size_t i = 0; i + 2 < segments.size(); ++i) {
        const auto& segment = segments[i].name;
        bool is_marker = false;
        for (const auto& marker : markers_) {
            if (!marker.empty() && segment == marker) {
                is_marker = true;
                break;
            }
        }
        if (!is_marker || segments[i + 1].name.empty()) {
            continue;
        }

        ProjectInfo info;
        info.project_path = file_path.substr(0, segments[i + 1].end);
        info.package_type = segment == "apps" ? PackageType::App : PackageType::Module;
        return info;
    }

    return std::nullopt;
}

std::optional<std::string> ProjectClassifier::project_of(const std::string& file_path) const {
    auto info = classify(file_path);
    if (!info) {
        return std::nullopt;
    }
    return std::move(info->project_path);
}

bool is_common_translations(const std::string& project_path, const std::vector<std::string>& common_paths) {
    for (const auto& raw : common_paths) {
        const auto common = trim_trailing_separators(raw);
        if (common.empty()) {
            continue;
        }
        if (project_path == common) {
            return true;
        }
        if (project_path.size() > common.size() &&
            project_path.starts_with(common) &&
            (project_path[common.size()] == '/' || project_path[common.size()] == '\\')) {
            return true;
        }
    }
    return false;
}

TranslationEntry make_translation_entry(
    std::string file_path,
    std::string key,
    std::string value,
    const ProjectClassifier& classifier
) {
    TranslationEntry entry;
    entry.project = classifier.classify(file_path);
    entry.file_path = std::move(file_path);
    entry.key = std::move(key);
    entry.value = std::move(value);
    return entry;
}
