#include <catch2/catch.hpp>

#include "project_classifier.hpp"

TEST_CASE("ProjectClassifier - apps marker", "[classifier]") {
    const ProjectClassifier classifier;
    const auto info = classifier.classify("packages/manager/apps/zimbra/src/translations/Messages_fr_FR.json");

    REQUIRE(info.has_value());
    REQUIRE(info->project_path == "packages/manager/apps/zimbra");
    REQUIRE(info->package_type == PackageType::App);
}

TEST_CASE("ProjectClassifier - modules marker", "[classifier]") {
    const ProjectClassifier classifier;
    const auto info = classifier.classify("/repo/packages/manager/modules/backup-agent/Messages_fr_FR.json");

    REQUIRE(info.has_value());
    REQUIRE(info->project_path == "/repo/packages/manager/modules/backup-agent");
    REQUIRE(info->package_type == PackageType::Module);
}

TEST_CASE("ProjectClassifier - project path is a prefix of the file path", "[classifier]") {
    const ProjectClassifier classifier;
    const std::string path = "packages/manager/apps/dedicated/client/app/Messages_fr_FR.json";
    const auto project = classifier.project_of(path);

    REQUIRE(project.has_value());
    REQUIRE(path.starts_with(*project));
    REQUIRE(classifier.project_of(path) == project);
}

TEST_CASE("ProjectClassifier - backslash paths keep the prefix property", "[classifier]") {
    const ProjectClassifier classifier;
    const std::string path = "repo\\apps\\p1\\Messages.json";
    const auto project = classifier.project_of(path);

    REQUIRE(project == std::optional<std::string>("repo\\apps\\p1"));
    REQUIRE(path.starts_with(*project));

    const std::string mixed = "C:\\work/packages\\modules/common\\i18n/Messages.json";
    const auto mixed_project = classifier.project_of(mixed);
    REQUIRE(mixed_project == std::optional<std::string>("C:\\work/packages\\modules/common"));
    REQUIRE(mixed.starts_with(*mixed_project));
}

TEST_CASE("ProjectClassifier - first marker segment wins", "[classifier]") {
    const ProjectClassifier classifier;
    const auto project = classifier.project_of("packages/apps/web/modules/nested/Messages.json");

    REQUIRE(project == std::optional<std::string>("packages/apps/web"));
}

TEST_CASE("ProjectClassifier - marker must be a whole segment", "[classifier]") {
    const ProjectClassifier classifier;

    REQUIRE_FALSE(classifier.classify("packages/myapps/web/Messages.json").has_value());
    REQUIRE_FALSE(classifier.classify("packages/apps-legacy/web/Messages.json").has_value());
}

TEST_CASE("ProjectClassifier - unclassifiable paths", "[classifier]") {
    const ProjectClassifier classifier;

    REQUIRE_FALSE(classifier.classify("tools/Messages_fr_FR.json").has_value());
    REQUIRE_FALSE(classifier.classify("packages/manager/apps/Messages_fr_FR.json").has_value());
    REQUIRE_FALSE(classifier.classify("").has_value());
    REQUIRE_FALSE(classifier.project_of("Messages.json").has_value());
}

TEST_CASE("ProjectClassifier - custom markers", "[classifier]") {
    const ProjectClassifier classifier({"libs"});

    REQUIRE(classifier.project_of("repo/libs/ui/Messages.json") == std::optional<std::string>("repo/libs/ui"));
    REQUIRE_FALSE(classifier.classify("repo/apps/ui/Messages.json").has_value());
    REQUIRE(classifier.classify("repo/libs/ui/Messages.json")->package_type == PackageType::Module);
}

TEST_CASE("is_common_translations - exact match and descendants", "[classifier][common]") {
    const std::vector<std::string> common{"packages/manager/modules/common-translations"};

    REQUIRE(is_common_translations("packages/manager/modules/common-translations", common));
    REQUIRE(is_common_translations("packages/manager/modules/common-translations/sub", common));
    REQUIRE_FALSE(is_common_translations("packages/manager/modules/common-translations-legacy", common));
    REQUIRE_FALSE(is_common_translations("packages/manager/apps/zimbra", common));
}

TEST_CASE("is_common_translations - trailing separator and empty list", "[classifier][common]") {
    REQUIRE(is_common_translations("modules/common", {"modules/common/"}));
    REQUIRE_FALSE(is_common_translations("modules/common", {}));
    REQUIRE_FALSE(is_common_translations("modules/common", {""}));
}

TEST_CASE("make_translation_entry attaches project info", "[classifier]") {
    const ProjectClassifier classifier;
    const auto entry = make_translation_entry("x/apps/p1/Messages.json", "title", "Hello", classifier);

    REQUIRE(entry.key == "title");
    REQUIRE(entry.value == "Hello");
    REQUIRE(entry.project.has_value());
    REQUIRE(entry.project->project_path == "x/apps/p1");
    REQUIRE(std::string(package_type_name(entry.project->package_type)) == "apps");
}
