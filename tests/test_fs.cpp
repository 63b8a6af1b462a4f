#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "fs.h"
#include "errors.h"
#include "test_utils.h"
#include <sys/stat.h>
#include <unistd.h>

using namespace dirpost;
using dirpost::test::TempDirectory;
using dirpost::test::read_text;

class FSTest : public ::testing::Test {
protected:
    TempDirectory temp_{"dirpost_fs"};
};

// Test directory creation and existence checks
TEST_F(FSTest, CreateDirectoryIsIdempotent) {
    std::string dir = temp_ / "single";

    EXPECT_FALSE(directory_exists(dir));
    EXPECT_TRUE(create_directory(dir));
    EXPECT_TRUE(directory_exists(dir));
    EXPECT_TRUE(create_directory(dir)) << "Existing directory should not be an error";
}

TEST_F(FSTest, CreateDirectoriesBuildsAncestors) {
    std::string deep = temp_ / "a/b/c/d";

    EXPECT_TRUE(create_directories(deep));
    EXPECT_TRUE(directory_exists(temp_ / "a"));
    EXPECT_TRUE(directory_exists(temp_ / "a/b/c"));
    EXPECT_TRUE(directory_exists(deep));
    EXPECT_TRUE(create_directories(deep));
}

TEST_F(FSTest, CreateDirectoryFailsOverFile) {
    std::string path = temp_ / "occupied";
    ASSERT_TRUE(create_file(path, "data"));

    EXPECT_FALSE(create_directory(path));
    EXPECT_FALSE(create_directories(temp_ / "occupied/child"));
    EXPECT_TRUE(file_exists(path));
    EXPECT_FALSE(directory_exists(path));
}

// Test whole-file helpers
TEST_F(FSTest, CreateAndReadBinaryFile) {
    std::vector<uint8_t> payload = {0x00, 0x01, 0xFE, 0xFF, 0x00};
    std::string path = temp_ / "binary.bin";

    ASSERT_TRUE(create_file_binary(path, payload.data(), payload.size()));

    std::vector<uint8_t> read_back;
    ASSERT_TRUE(read_file_binary(path, read_back));
    EXPECT_EQ(read_back, payload);
}

TEST_F(FSTest, ReadMissingFileFails) {
    std::vector<uint8_t> data;
    EXPECT_FALSE(read_file_binary(temp_ / "missing", data));
}

TEST_F(FSTest, CombinePaths) {
    EXPECT_EQ(combine_paths("root", "a/b"), "root/a/b");
    EXPECT_EQ(combine_paths("root/", "a"), "root/a");
    EXPECT_EQ(combine_paths("", "a"), "a");
    EXPECT_EQ(combine_paths("root", ""), "root");
}

TEST_F(FSTest, CanonicalPathResolvesDots) {
    ASSERT_TRUE(create_directories(temp_ / "x/y"));

    std::string expected;
    ASSERT_TRUE(canonical_path(temp_ / "x/y", expected));

    std::string resolved;
    ASSERT_TRUE(canonical_path(temp_ / "x/./y/../y", resolved));
    EXPECT_EQ(resolved, expected);

    EXPECT_FALSE(canonical_path(temp_ / "does/not/exist", resolved));
}

// Test directory listing
TEST_F(FSTest, ListDirectorySortedWithTypes) {
    ASSERT_TRUE(create_file(temp_ / "b.txt", "12345"));
    ASSERT_TRUE(create_file(temp_ / "a.txt", ""));
    ASSERT_TRUE(create_directory(temp_ / "c"));
    ASSERT_EQ(symlink("a.txt", (temp_ / "d.link").c_str()), 0);

    std::vector<DirectoryEntry> entries;
    ASSERT_TRUE(list_directory(temp_.path(), entries));
    ASSERT_EQ(entries.size(), 4u);

    EXPECT_EQ(entries[0].name, "a.txt");
    EXPECT_EQ(entries[0].type, FileType::Regular);
    EXPECT_EQ(entries[0].size, 0u);

    EXPECT_EQ(entries[1].name, "b.txt");
    EXPECT_EQ(entries[1].size, 5u);

    EXPECT_EQ(entries[2].name, "c");
    EXPECT_EQ(entries[2].type, FileType::Directory);

    EXPECT_EQ(entries[3].name, "d.link");
    EXPECT_EQ(entries[3].type, FileType::Symlink);
}

TEST_F(FSTest, ListDirectoryReportsSpecialFiles) {
    ASSERT_EQ(mkfifo((temp_ / "pipe").c_str(), 0600), 0);

    std::vector<DirectoryEntry> entries;
    ASSERT_TRUE(list_directory(temp_.path(), entries));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, FileType::Other);
}

TEST_F(FSTest, ListMissingDirectoryFails) {
    std::vector<DirectoryEntry> entries;
    EXPECT_FALSE(list_directory(temp_ / "nope", entries));
}

// Test remove_tree
TEST_F(FSTest, RemoveTreeDoesNotFollowSymlinks) {
    TempDirectory outside("dirpost_fs_outside");
    ASSERT_TRUE(create_file(outside / "keep.txt", "keep"));

    ASSERT_TRUE(create_directories(temp_ / "victim/sub"));
    ASSERT_TRUE(create_file(temp_ / "victim/sub/file", "x"));
    ASSERT_EQ(symlink(outside.path().c_str(), (temp_ / "victim/link").c_str()), 0);

    EXPECT_TRUE(remove_tree(temp_ / "victim"));
    EXPECT_FALSE(file_exists(temp_ / "victim"));
    EXPECT_EQ(read_text(outside / "keep.txt"), "keep");

    EXPECT_TRUE(remove_tree(temp_ / "victim")) << "Missing path counts as removed";
}

// Test FileReader / FileWriter
TEST_F(FSTest, FileWriterThenReader) {
    std::string path = temp_ / "stream.bin";
    auto payload = dirpost::test::make_payload(100000);

    {
        auto writer = create_or_truncate(path);
        writer->write(payload.data(), 60000);
        writer->write(payload.data() + 60000, payload.size() - 60000);
        EXPECT_EQ(writer->bytes_written(), payload.size());
        writer->close();
        writer->close();
    }

    auto reader = open_for_read(path);
    EXPECT_EQ(reader->size(), payload.size());
    EXPECT_EQ(reader->path(), path);

    std::vector<uint8_t> read_back;
    uint8_t buffer[4096];
    size_t n;
    while ((n = reader->read(buffer, sizeof(buffer))) > 0) {
        read_back.insert(read_back.end(), buffer, buffer + n);
    }
    EXPECT_EQ(read_back, payload);
}

TEST_F(FSTest, CreateOrTruncateOverwrites) {
    std::string path = temp_ / "existing.txt";
    ASSERT_TRUE(create_file(path, "a much longer original content"));

    auto writer = create_or_truncate(path);
    const uint8_t data[] = {'n', 'e', 'w'};
    writer->write(data, sizeof(data));
    writer->close();

    EXPECT_EQ(read_text(path), "new");
}

TEST_F(FSTest, ReaderErrorsThrowIoError) {
    EXPECT_THROW(open_for_read(temp_ / "missing"), IoError);
    EXPECT_THROW(open_for_read(temp_.path()), IoError) << "Directories are not regular files";
}

TEST_F(FSTest, WriterErrorsThrowIoError) {
    EXPECT_THROW(create_or_truncate(temp_ / "no/such/dir/file"), IoError);

    ASSERT_TRUE(create_directory(temp_ / "dir"));
    EXPECT_THROW(create_or_truncate(temp_ / "dir"), IoError);

    auto writer = create_or_truncate(temp_ / "closed");
    writer->close();
    const uint8_t byte = 0;
    EXPECT_THROW(writer->write(&byte, 1), IoError);
}

TEST_F(FSTest, IsSymlinkDoesNotFollow) {
    ASSERT_TRUE(create_file(temp_ / "target", "t"));
    ASSERT_EQ(symlink("target", (temp_ / "link").c_str()), 0);
    ASSERT_EQ(symlink("nowhere", (temp_ / "dangling").c_str()), 0);

    EXPECT_TRUE(is_symlink(temp_ / "link"));
    EXPECT_TRUE(is_symlink(temp_ / "dangling"));
    EXPECT_FALSE(is_symlink(temp_ / "target"));
    EXPECT_FALSE(is_symlink(temp_ / "missing"));
}

TEST_F(FSTest, WriterRefusesSymlinkTarget) {
    TempDirectory outside("dirpost_fs_outside");
    ASSERT_TRUE(create_file(outside / "secret", "secret"));
    ASSERT_EQ(symlink((outside / "secret").c_str(), (temp_ / "link").c_str()), 0);

    EXPECT_THROW(create_or_truncate(temp_ / "link"), IoError);
    EXPECT_EQ(read_text(outside / "secret"), "secret");
}
