#include "fieldsync/storage/durable_file.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using fieldsync::ErrorKind;
using fieldsync::storage::DurableFile;
using fieldsync::testing::TempDir;

TEST(DurableFileTest, MissingFileReadsAsEmpty) {
    TempDir dir;
    DurableFile file(dir.path() / "state.json");

    auto read = file.read();
    ASSERT_TRUE(read.is_ok());
    EXPECT_FALSE(read.value().has_value());
}

TEST(DurableFileTest, WriteReplacesDocumentAndLeavesNoStagingFile) {
    TempDir dir;
    DurableFile file(dir.path() / "nested" / "state.json");

    ASSERT_TRUE(file.write(nlohmann::json{{"version", 1}}).is_ok());
    ASSERT_TRUE(file.write(nlohmann::json{{"version", 2}}).is_ok());

    auto read = file.read();
    ASSERT_TRUE(read.is_ok());
    ASSERT_TRUE(read.value().has_value());
    EXPECT_EQ((*read.value())["version"], 2);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "nested" / "state.json.tmp"));
}

TEST(DurableFileTest, CorruptDocumentIsStorageError) {
    TempDir dir;
    const auto path = dir.path() / "queue.json";
    {
        std::ofstream out(path);
        out << "{\"items\": [";
    }

    auto read = DurableFile(path).read();
    ASSERT_TRUE(read.is_error());
    EXPECT_EQ(read.error().kind, ErrorKind::Storage);
}

TEST(DurableFileTest, WriteBytesAndRemove) {
    TempDir dir;
    const auto path = dir.path() / "media" / "photo-1";

    ASSERT_TRUE(DurableFile::write_bytes(path, {0x00, 0xff, 0x10}).is_ok());
    EXPECT_EQ(std::filesystem::file_size(path), 3u);

    DurableFile file(path);
    ASSERT_TRUE(file.remove().is_ok());
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_TRUE(file.remove().is_ok());
}

TEST(DurableFileTest, InvalidUtf8DocumentIsStorageErrorAndKeepsOldContents) {
    TempDir dir;
    DurableFile file(dir.path() / "records.json");
    ASSERT_TRUE(file.write(nlohmann::json{{"name", "cafe"}}).is_ok());

    auto written = file.write(nlohmann::json{{"name", "caf\xe9"}});
    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().kind, ErrorKind::Storage);

    auto read = file.read();
    ASSERT_TRUE(read.is_ok());
    ASSERT_TRUE(read.value().has_value());
    EXPECT_EQ((*read.value())["name"], "cafe");
}

TEST(DurableFileTest, UnwritableStagingFileIsStorageError) {
    TempDir dir;
    const auto path = dir.path() / "queue.json";
    std::filesystem::create_directories(dir.path() / "queue.json.tmp");

    auto written = DurableFile(path).write(nlohmann::json{{"items", nlohmann::json::array()}});
    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().kind, ErrorKind::Storage);
    EXPECT_FALSE(std::filesystem::exists(path));
}
