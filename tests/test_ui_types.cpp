#include <gtest/gtest.h>

#include "ui/definition_format.hpp"
#include "ui/ui_types.hpp"

using json = nlohmann::json;

namespace {

TEST(DefinitionFormatTest, DetectsShapes) {
    EXPECT_EQ(uisync::DetectDefinitionFormat(json{{"name", "A"}, {"children", json::array()}}),
              uisync::DefinitionFormat::Modern);
    EXPECT_EQ(uisync::DetectDefinitionFormat(json{{"name", "A"}, {"tabs", json::array()}, {"sections", json::array()}}),
              uisync::DefinitionFormat::Legacy);
    EXPECT_TRUE(uisync::IsLegacyDefinition(json{{"tabs", json::array()}, {"sections", json::array()}}));
}

TEST(DefinitionFormatTest, AmbiguousOrMissingShapeIsUnrecognized) {
    EXPECT_EQ(uisync::DetectDefinitionFormat(json{{"name", "A"}}), uisync::DefinitionFormat::Unrecognized);
    EXPECT_EQ(uisync::DetectDefinitionFormat(json{{"tabs", json::array()}}), uisync::DefinitionFormat::Unrecognized);
    EXPECT_EQ(uisync::DetectDefinitionFormat(json{{"children", "x"}}), uisync::DefinitionFormat::Unrecognized);
    EXPECT_EQ(uisync::DetectDefinitionFormat(json{{"children", json::array()},
                                                  {"tabs", json::array()},
                                                  {"sections", json::array()}}),
              uisync::DefinitionFormat::Unrecognized);
    EXPECT_EQ(uisync::DetectDefinitionFormat(json::array()), uisync::DefinitionFormat::Unrecognized);
    EXPECT_STREQ(uisync::ToString(uisync::DefinitionFormat::Legacy), "legacy");
    EXPECT_STREQ(uisync::ToString(uisync::DefinitionFormat::Modern), "modern");
    EXPECT_STREQ(uisync::ToString(uisync::DefinitionFormat::Unrecognized), "unrecognized");
}

TEST(UiTypesTest, ModernDefinitionKeepsUnknownFields) {
    const json j = {
        {"name", "Main"},
        {"version", 2},
        {"children", {{{"script", "QQ=="}, {"styles", ""}, {"type", "REGION"}, {"children", json::array()}}}},
    };
    auto def = uisync::UiDefFromJson(j);
    ASSERT_TRUE(def.has_value()) << def.error();
    const auto& modern = std::get<uisync::UiDefinition>(*def);
    EXPECT_EQ(modern.name, "Main");
    EXPECT_EQ(modern.attributes, (json{{"version", 2}}));
    ASSERT_EQ(modern.children.size(), 1u);
    EXPECT_EQ(modern.children[0].script, std::optional<std::string>("QQ=="));
    EXPECT_FALSE(modern.children[0].styles.has_value());
    EXPECT_EQ(modern.children[0].extra.at("styles"), "");

    EXPECT_EQ(uisync::UiDefToJson(*def), j);
}

TEST(UiTypesTest, LegacyDefinitionRoundTripsThroughJson) {
    const json j = {
        {"name", "Old"},
        {"tabs", {{{"id", 1}, {"name", "General"}, {"icon", "x"}}}},
        {"sections", {
            {{"id", 10}, {"page", 1}, {"label", "A"}, {"script", "QQ=="}},
            {{"id", 11}, {"parentId", 10}, {"page", 1}, {"label", "B"}, {"properties", {{"k", 1}}}},
            {{"id", 12}, {"parentId", nullptr}, {"page", 1}, {"label", "C"}},
        }},
    };
    auto def = uisync::UiDefFromJson(j);
    ASSERT_TRUE(def.has_value()) << def.error();
    const auto& legacy = std::get<uisync::LegacyUiDefinition>(*def);
    ASSERT_EQ(legacy.sections.size(), 3u);
    EXPECT_TRUE(legacy.sections[0].IsRoot());
    EXPECT_FALSE(legacy.sections[1].IsRoot());
    EXPECT_TRUE(legacy.sections[2].IsRoot());
    EXPECT_EQ(legacy.tabs[0].extra, (json{{"icon", "x"}}));

    EXPECT_EQ(uisync::UiDefToJson(*def), j);
}

TEST(UiTypesTest, RejectsUnrecognizedAndUnsafeNames) {
    auto a = uisync::UiDefFromJson(json{{"name", "Broken"}});
    ASSERT_FALSE(a.has_value());
    EXPECT_NE(a.error().find("Broken"), std::string::npos);

    EXPECT_FALSE(uisync::UiDefFromJson(json{{"name", "../x"}, {"children", json::array()}}).has_value());
    EXPECT_FALSE(uisync::UiDefFromJson(json{{"children", json::array()}}).has_value());
    EXPECT_FALSE(uisync::UiDefFromJson(json{{"name", "L"},
                                            {"tabs", json::array()},
                                            {"sections", {{{"id", 1}, {"page", 1}}}}}).has_value());
}

TEST(UiTypesTest, ParseUiDefsDocument) {
    auto ok = uisync::ParseUiDefsDocument(R"([{"name":"A","children":[]}])");
    ASSERT_TRUE(ok.has_value()) << ok.error();
    EXPECT_EQ(ok->size(), 1u);

    auto bad = uisync::ParseUiDefsDocument("[{");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().rfind("Syntax Error", 0), 0u);

    EXPECT_FALSE(uisync::ParseUiDefsDocument("{}").has_value());
    EXPECT_FALSE(uisync::ParseUiDefsDocument("  ").has_value());
}

TEST(UiTypesTest, PrettyJsonEndsWithNewline) {
    EXPECT_EQ(uisync::ToPrettyJson(json{{"a", 1}}), "{\n  \"a\": 1\n}\n");
}

} // namespace
