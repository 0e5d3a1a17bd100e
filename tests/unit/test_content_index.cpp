#include <catch2/catch.hpp>

#include "content_index.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using test_helpers::entry;

TEST_CASE("ContentIndex - groups by value, not by key", "[index]") {
    const std::vector<TranslationEntry> entries{
        entry("r/apps/p1/Messages.json", "a", "Hello"),
        entry("r/apps/p2/Messages.json", "b", "Hello"),
        entry("r/apps/p2/Messages.json", "a", "Goodbye"),
    };
    const auto index = ContentIndex::build(entries);

    REQUIRE(index.value_count() == 2);
    REQUIRE(index.entry_count() == 3);
    REQUIRE(index.find("Hello")->size() == 2);
    REQUIRE(index.find("Goodbye")->size() == 1);
    REQUIRE(index.find("Missing") == nullptr);
}

TEST_CASE("ContentIndex - empty and whitespace values are ordinary keys", "[index]") {
    const std::vector<TranslationEntry> entries{
        entry("r/apps/p1/Messages.json", "a", ""),
        entry("r/apps/p2/Messages.json", "a", ""),
        entry("r/apps/p2/Messages.json", "b", "  "),
        entry("r/apps/p3/Messages.json", "b", " "),
    };
    const auto index = ContentIndex::build(entries);

    REQUIRE(index.find("")->size() == 2);
    REQUIRE(index.find("  ")->size() == 1);
    REQUIRE(index.find(" ")->size() == 1);
}

TEST_CASE("ContentIndex - groups are sorted by file path then key", "[index]") {
    const std::vector<TranslationEntry> entries{
        entry("r/apps/p2/Messages.json", "z", "Hi"),
        entry("r/apps/p1/Messages.json", "b", "Hi"),
        entry("r/apps/p1/Messages.json", "a", "Hi"),
    };
    const auto index = ContentIndex::build(entries);
    const auto& group = *index.find("Hi");

    REQUIRE(group.size() == 3);
    REQUIRE(group[0]->key == "a");
    REQUIRE(group[1]->key == "b");
    REQUIRE(group[2]->file_path == "r/apps/p2/Messages.json");
}

TEST_CASE("ContentIndex - unclassifiable entries stay indexed", "[index]") {
    const std::vector<TranslationEntry> entries{
        entry("tools/Messages.json", "a", "Hi"),
        entry("r/apps/p1/Messages.json", "a", "Hi"),
    };
    const auto index = ContentIndex::build(entries);

    REQUIRE(index.find("Hi")->size() == 2);
}

TEST_CASE("translations_for_project - exact project match only", "[index][project]") {
    const std::vector<TranslationEntry> entries{
        entry("r/apps/p1/Messages.json", "a", "One"),
        entry("r/apps/p1/sub/Messages.json", "b", "Two"),
        entry("r/apps/p10/Messages.json", "c", "Three"),
        entry("r/modules/p1/Messages.json", "d", "Four"),
        entry("tools/Messages.json", "e", "Five"),
    };
    const auto project = translations_for_project("r/apps/p1", entries);

    REQUIRE(project.size() == 2);
    REQUIRE(project[0]->key == "a");
    REQUIRE(project[1]->key == "b");
    REQUIRE(translations_for_project("r/apps/unknown", entries).empty());
}

TEST_CASE("map_translations_by_project - ordered projects, unclassified dropped", "[index][project]") {
    const std::vector<TranslationEntry> entries{
        entry("r/modules/common/Messages.json", "a", "One"),
        entry("r/apps/p2/Messages.json", "b", "Two"),
        entry("r/apps/p1/Messages.json", "c", "Three"),
        entry("tools/Messages.json", "d", "Four"),
    };
    const auto by_project = map_translations_by_project(entries);

    REQUIRE(by_project.size() == 3);
    std::vector<std::string> keys;
    for (const auto& [project, group] : by_project) {
        keys.push_back(project);
    }
    REQUIRE(keys == std::vector<std::string>{"r/apps/p1", "r/apps/p2", "r/modules/common"});
}
