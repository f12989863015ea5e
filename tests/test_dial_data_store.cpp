#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "store/dial_data_store.hpp"
#include "store/file_store.hpp"
#include "store/kv_store.hpp"

namespace fs = std::filesystem;

class DirectoryStoreTest : public ::testing::Test
{
protected:
    fs::path root;

    void SetUp() override
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() / ("dialcast_test_" + std::to_string(stamp));
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write_raw(const std::string& name, const std::string& content)
    {
        fs::create_directories((root / name).parent_path());
        std::ofstream {root / name} << content;
    }
};

TEST_F(DirectoryStoreTest, SaveCreatesDirectories)
{
    store::directory_file_store files {root};

    EXPECT_FALSE(files.exists("dial_data/YouTube.json"));
    EXPECT_FALSE(files.load("dial_data/YouTube.json").has_value());

    files.save("dial_data/YouTube.json", "{}");
    EXPECT_TRUE(files.exists("dial_data/YouTube.json"));
    EXPECT_EQ(files.load("dial_data/YouTube.json").value_or(""), "{}");
    EXPECT_FALSE(fs::exists(root / "dial_data/YouTube.json.tmp"));
}

TEST_F(DirectoryStoreTest, RejectsEscapingNames)
{
    store::directory_file_store files {root};

    EXPECT_THROW(files.save("../outside.json", "{}"), std::invalid_argument);
    EXPECT_THROW(files.load("/etc/passwd"), std::invalid_argument);
    EXPECT_THROW(files.exists(""), std::invalid_argument);
}

TEST_F(DirectoryStoreTest, DialDataSurvivesReopen)
{
    {
        store::directory_file_store files {root};
        store::dial_data_store data {files};
        data.save("YouTube", {{"token", "abc"}, {"user", "me & you"}});
    }

    store::directory_file_store files {root};
    store::dial_data_store data {files};
    store::dial_data loaded = data.load("YouTube");

    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded.at("token"), "abc");
    EXPECT_EQ(loaded.at("user"), "me & you");
    EXPECT_TRUE(data.load("Netflix").empty());
}

TEST_F(DirectoryStoreTest, CorruptDialDataIsIgnored)
{
    write_raw("dial_data/Broken.json", "{\"token\": ");
    write_raw("dial_data/Array.json", "[1, 2]");
    write_raw("dial_data/Mixed.json", R"({"token": "abc", "count": 3})");

    store::directory_file_store files {root};
    store::dial_data_store data {files};

    EXPECT_TRUE(data.load("Broken").empty());
    EXPECT_TRUE(data.load("Array").empty());

    store::dial_data mixed = data.load("Mixed");
    ASSERT_EQ(mixed.size(), 1u);
    EXPECT_EQ(mixed.at("token"), "abc");
}

TEST_F(DirectoryStoreTest, KeyValueStorePersists)
{
    store::directory_file_store files {root};
    store::json_kv_store_provider provider {files};
    EXPECT_EQ(store::json_kv_store_provider::file_name("YouTube"), "app_youtube.json");

    {
        auto db = provider.open("YouTube");
        db->set("last_video", "abc");
        db->set("volume", "7");
        EXPECT_TRUE(db->remove("volume"));
        EXPECT_FALSE(db->remove("volume"));
    }

    auto reopened = provider.open("YouTube");
    EXPECT_EQ(reopened->get("last_video").value_or(""), "abc");
    EXPECT_FALSE(reopened->get("volume").has_value());
}

TEST_F(DirectoryStoreTest, CorruptKeyValueFileStartsEmpty)
{
    write_raw("app_youtube.json", "not json");

    store::directory_file_store files {root};
    store::json_kv_store db {files, "app_youtube.json"};
    EXPECT_FALSE(db.get("anything").has_value());

    db.set("key", "value");
    EXPECT_EQ(db.get("key").value_or(""), "value");
}
