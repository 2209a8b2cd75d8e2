#include "DocxFixture.hpp"

#include "styleverify/archive/ZipReader.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace styleverify {
namespace archive {

class ZipReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        bytes_ = test::DocxFixture::buildArchive({
            {"word/document.xml", "<w:document/>"},
            {"word/styles.xml", std::string(4096, 'x')},
            {"docProps/core.xml", "<cp:coreProperties/>"},
        });

        test_dir_ = std::filesystem::temp_directory_path() / "styleverify_zip_reader_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::vector<uint8_t> bytes_;
    std::filesystem::path test_dir_;
};

TEST_F(ZipReaderTest, ListsAndExtractsEntriesFromMemory) {
    auto reader = ZipReader::fromMemory(bytes_, "fixture.docx");
    ASSERT_EQ(reader.open(), ZipError::Ok);
    EXPECT_TRUE(reader.isOpen());
    EXPECT_EQ(reader.getName(), "fixture.docx");

    auto files = reader.listFiles();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files.front(), "docProps/core.xml");

    EXPECT_EQ(reader.fileExists("word/document.xml"), ZipError::Ok);
    EXPECT_EQ(reader.fileExists("word/numbering.xml"), ZipError::FileNotFound);

    std::string content;
    ASSERT_EQ(reader.extractFile("word/document.xml", content), ZipError::Ok);
    EXPECT_EQ(content, "<w:document/>");

    ZipReader::EntryInfo info;
    ASSERT_TRUE(reader.getEntryInfo("word/styles.xml", info));
    EXPECT_EQ(info.uncompressed_size, 4096u);
    EXPECT_FALSE(info.is_directory);

    std::vector<uint8_t> data;
    ASSERT_EQ(reader.extractFile("word/styles.xml", data), ZipError::Ok);
    EXPECT_EQ(data.size(), 4096u);
}

TEST_F(ZipReaderTest, ReadsFromDisk) {
    const auto path = test_dir_ / "fixture.docx";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes_.data()), static_cast<std::streamsize>(bytes_.size()));
    }

    auto reader = ZipReader::fromFile(path.string());
    ASSERT_EQ(reader.open(), ZipError::Ok);
    std::string content;
    EXPECT_EQ(reader.extractFile("docProps/core.xml", content), ZipError::Ok);
    EXPECT_EQ(content, "<cp:coreProperties/>");
}

TEST_F(ZipReaderTest, RejectsInvalidInput) {
    auto garbage = ZipReader::fromMemory({'P', 'K', 0x03, 0x04, 'j', 'u', 'n', 'k'});
    EXPECT_EQ(garbage.open(), ZipError::BadFormat);
    EXPECT_FALSE(garbage.isOpen());

    auto empty = ZipReader::fromMemory({});
    EXPECT_EQ(empty.open(), ZipError::InvalidParameter);

    auto missing = ZipReader::fromFile((test_dir_ / "missing.docx").string());
    EXPECT_EQ(missing.open(), ZipError::IoFail);
}

TEST_F(ZipReaderTest, ExtractRequiresOpenArchive) {
    auto reader = ZipReader::fromMemory(bytes_);
    std::string content;
    EXPECT_EQ(reader.extractFile("word/document.xml", content), ZipError::NotOpen);

    ASSERT_EQ(reader.open(), ZipError::Ok);
    reader.close();
    EXPECT_FALSE(reader.isOpen());
    EXPECT_EQ(reader.extractFile("word/document.xml", content), ZipError::NotOpen);
}

TEST_F(ZipReaderTest, MovedReaderKeepsOpenArchive) {
    auto reader = ZipReader::fromMemory(bytes_);
    ASSERT_EQ(reader.open(), ZipError::Ok);

    ZipReader moved = std::move(reader);
    EXPECT_TRUE(moved.isOpen());
    std::string content;
    EXPECT_EQ(moved.extractFile("word/document.xml", content), ZipError::Ok);
}

}} // namespace styleverify::archive
