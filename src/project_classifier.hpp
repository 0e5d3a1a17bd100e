#pragma once

#include "translation_entry.hpp"

#include <optional>
#include <string>
#include <vector>

const char* package_type_name(PackageType type);

// Maps a translation file path to the package owning it. A package is the
// first path segment equal to one of the markers plus the segment after it,
// so "packages/manager/apps/zimbra/src/Messages.json" belongs to
// "packages/manager/apps/zimbra". No filesystem access.
class ProjectClassifier {
public:
    ProjectClassifier();
    explicit ProjectClassifier(std::vector<std::string> markers);

    std::optional<ProjectInfo> classify(const std::string& file_path) const;
    std::optional<std::string> project_of(const std::string& file_path) const;

private:
    std::vector<std::string> markers_;
};

// True when project_path equals one of the common paths or lives below one.
bool is_common_translations(const std::string& project_path, const std::vector<std::string>& common_paths);

TranslationEntry make_translation_entry(
    std::string file_path,
    std::string key,
    std::string value,
    const ProjectClassifier& classifier
);
