#pragma once

#include <optional>
#include <string>

enum class PackageType {
    App,
    Module
};

struct ProjectInfo {
    std::string project_path;
    PackageType package_type = PackageType::Module;
};

struct TranslationEntry {
    std::string file_path;
    std::string key;
    std::string value;
    // Empty when the path has no project marker segment.
    std::optional<ProjectInfo> project;
};

inline bool same_location(const TranslationEntry& a, const TranslationEntry& b) {
    return a.file_path == b.file_path && a.key == b.key;
}

// Orders by file path, then key.
inline bool location_less(const TranslationEntry& a, const TranslationEntry& b) {
    if (a.file_path != b.file_path) {
        return a.file_path < b.file_path;
    }
    return a.key < b.key;
}
