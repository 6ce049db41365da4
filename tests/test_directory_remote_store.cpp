#include <gtest/gtest.h>

#include "codec/base64.hpp"
#include "sync/directory_remote_store.hpp"
#include "testing.hpp"

using json = nlohmann::json;

namespace {

class DirectoryRemoteStoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
        json records = json::array();
        records.push_back(uisync::ProductModelToJson(testutil::Record("Cato", "ui1", "pml1")));
        records.push_back(uisync::ProductModelToJson(testutil::Record("Octa", "ui2")));
        testutil::WriteText(tmp.Path(), "records.json", records.dump(2));
        testutil::WriteText(tmp / "documents", "ui1", "stored-body");
    }

    testutil::TemporaryDirectory tmp;
};

TEST_F(DirectoryRemoteStoreTest, QueriesRecordsByName) {
    uisync::DirectoryRemoteStore store(tmp.Path() + "/");

    auto all = store.QueryRecords({});
    ASSERT_TRUE(all.has_value()) << all.error();
    ASSERT_EQ(all->size(), 2u);
    EXPECT_EQ((*all)[0].name, "Cato");
    EXPECT_EQ((*all)[0].content_id, "pml1");
    EXPECT_EQ((*all)[1].ui_definitions_id, "ui2");

    auto some = store.QueryRecords({"Octa", "Missing"});
    ASSERT_TRUE(some.has_value()) << some.error();
    ASSERT_EQ(some->size(), 1u);
    EXPECT_EQ((*some)[0].name, "Octa");
}

TEST_F(DirectoryRemoteStoreTest, InvalidRecordsFileIsAnError) {
    testutil::WriteText(tmp.Path(), "records.json", R"([{"id":"x","name":"../up"}])");
    uisync::DirectoryRemoteStore store(tmp.Path());
    EXPECT_FALSE(store.QueryRecords({}).has_value());

    testutil::WriteText(tmp.Path(), "records.json", "{");
    EXPECT_FALSE(store.QueryRecords({}).has_value());
}

TEST_F(DirectoryRemoteStoreTest, FetchesStoredBodies) {
    uisync::DirectoryRemoteStore store(tmp.Path());

    auto body = store.FetchDocumentBody("ui1");
    ASSERT_TRUE(body.has_value()) << body.error();
    EXPECT_EQ(*body, "stored-body");

    EXPECT_FALSE(store.FetchDocumentBody("ui2").has_value());
    EXPECT_FALSE(store.FetchDocumentBody("../records.json").has_value());

    auto ref = store.FetchDocumentByExternalRef("ui1");
    ASSERT_TRUE(ref.has_value());
    ASSERT_TRUE(ref->has_value());
    EXPECT_EQ((*ref)->id, "ui1");

    auto none = store.FetchDocumentByExternalRef("ui2");
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none->has_value());
}

TEST_F(DirectoryRemoteStoreTest, WritesStripOneBase64Layer) {
    uisync::DirectoryRemoteStore store(tmp.Path());

    ASSERT_TRUE(store.UpdateDocument("ui1", uisync::Base64Encode("new body")).is_ok());
    EXPECT_EQ(testutil::ReadFileOrEmpty(tmp / "documents/ui1"), "new body");
    EXPECT_FALSE(store.UpdateDocument("ui1", "*not base64*").is_ok());
    EXPECT_FALSE(store.UpdateDocument("ui2", uisync::Base64Encode("x")).is_ok());
}

TEST_F(DirectoryRemoteStoreTest, CreatesDocumentsInExistingFolder) {
    uisync::DirectoryRemoteStore store(tmp.Path());

    EXPECT_FALSE(store.CreateDocument("velo", "Octa", uisync::Base64Encode("x")).has_value());

    auto folder = store.EnsureFolder("velo");
    ASSERT_TRUE(folder.has_value()) << folder.error();
    EXPECT_EQ(folder->name, "velo");
    auto again = store.EnsureFolder("velo");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->id, folder->id);
    EXPECT_FALSE(store.EnsureFolder("a/b").has_value());

    auto doc = store.CreateDocument(folder->id, "Octa", uisync::Base64Encode("created"));
    ASSERT_TRUE(doc.has_value()) << doc.error();
    EXPECT_EQ(doc->id, "doc000001");
    EXPECT_EQ(testutil::ReadFileOrEmpty(tmp / "documents/doc000001"), "created");

    const json meta = testutil::ReadJson(tmp / "documents/doc000001.meta.json");
    EXPECT_EQ(meta["name"], "Octa");
    EXPECT_EQ(meta["folderId"], "velo");

    auto second = store.CreateDocument(folder->id, "Other", uisync::Base64Encode("2"));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->id, "doc000002");
}

} // namespace
