#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

TEST(ConfigTest, LoadsAllKeys) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteText(tmp.Path(), "uisync.conf", R"({
        "SourcePath": "models/",
        "StorePath": "/srv/store",
        "FolderName": "ui_docs",
        "LogLevel": "debug",
        "Members": "pml:Cato",
        "Unknown": 1
    })");

    uisync::config::SyncConfigFromFile cfg;
    auto r = cfg.LoadFile(tmp / "uisync.conf");
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cfg.source_path, std::optional<std::string>("models/"));
    EXPECT_EQ(cfg.store_path, std::optional<std::string>("/srv/store"));
    EXPECT_EQ(cfg.folder_name, std::optional<std::string>("ui_docs"));
    EXPECT_EQ(cfg.log_level, std::optional<std::string>("debug"));
    EXPECT_EQ(cfg.members, std::optional<std::string>("pml:Cato"));
}

TEST(ConfigTest, MissingKeysStayUnset) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteText(tmp.Path(), "c.json", "{}");

    uisync::config::SyncConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadFile(tmp / "c.json").is_ok());
    EXPECT_FALSE(cfg.source_path.has_value());
    EXPECT_FALSE(cfg.store_path.has_value());
    EXPECT_FALSE(cfg.members.has_value());
}

TEST(ConfigTest, RejectsInvalidFiles) {
    testutil::TemporaryDirectory tmp;
    uisync::config::SyncConfigFromFile cfg;

    EXPECT_FALSE(cfg.LoadFile(tmp / "missing.conf").is_ok());

    testutil::WriteText(tmp.Path(), "array.conf", "[]");
    EXPECT_FALSE(cfg.LoadFile(tmp / "array.conf").is_ok());

    testutil::WriteText(tmp.Path(), "broken.conf", "{");
    EXPECT_FALSE(cfg.LoadFile(tmp / "broken.conf").is_ok());

    testutil::WriteText(tmp.Path(), "type.conf", R"({"SourcePath": 3})");
    EXPECT_FALSE(cfg.LoadFile(tmp / "type.conf").is_ok());

    testutil::WriteText(tmp.Path(), "empty.conf", R"({"SourcePath": ""})");
    EXPECT_FALSE(cfg.LoadFile(tmp / "empty.conf").is_ok());

    testutil::WriteText(tmp.Path(), "level.conf", R"({"LogLevel": "loud", "StorePath": "x"})");
    EXPECT_FALSE(cfg.LoadFile(tmp / "level.conf").is_ok());
    EXPECT_FALSE(cfg.store_path.has_value());
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(uisync::ParseLogLevel("debug"), uisync::LogLevel::Debug);
    EXPECT_EQ(uisync::ParseLogLevel("WARN"), uisync::LogLevel::Warn);
    EXPECT_EQ(uisync::ParseLogLevel("none"), uisync::LogLevel::None);
    EXPECT_FALSE(uisync::ParseLogLevel("verbose").has_value());
}

TEST(LoggerTest, SetLevel) {
    auto& logger = uisync::Logger::Instance();
    const auto saved = logger.Level();
    logger.SetLevel(uisync::LogLevel::Error);
    EXPECT_EQ(logger.Level(), uisync::LogLevel::Error);
    logger.SetLevel(saved);
}

} // namespace
