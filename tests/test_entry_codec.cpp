#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "entry_codec.h"
#include <stdexcept>

using namespace dirpost;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class EntryCodecTest : public ::testing::Test {
protected:
    // Build a raw frame without going through the encoder's checks
    std::vector<uint8_t> raw_frame(uint8_t kind, const std::string& path, bool with_size = false,
                                   uint64_t size = 0) {
        std::vector<uint8_t> data;
        data.push_back(kind);
        uint32_t len = static_cast<uint32_t>(path.size());
        data.push_back(static_cast<uint8_t>(len >> 24));
        data.push_back(static_cast<uint8_t>(len >> 16));
        data.push_back(static_cast<uint8_t>(len >> 8));
        data.push_back(static_cast<uint8_t>(len));
        data.insert(data.end(), path.begin(), path.end());
        if (with_size) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                data.push_back(static_cast<uint8_t>(size >> shift));
            }
        }
        return data;
    }

    void expect_decode_error(const std::vector<uint8_t>& data, const std::string& fragment) {
        try {
            EntryDecoder::decode(data);
            FAIL() << "Expected DecodeError containing '" << fragment << "'";
        } catch (const DecodeError& e) {
            EXPECT_THAT(e.what(), HasSubstr(fragment));
            EXPECT_EQ(e.kind(), ErrorKind::Decode);
        }
    }
};

//=============================================================================
// Wire layout
//=============================================================================

TEST_F(EntryCodecTest, DirectoryFrameLayout) {
    auto data = EntryEncoder::encode_entry(Entry::directory("a/b"));

    EXPECT_THAT(data, ElementsAre(0x00, 0x00, 0x00, 0x00, 0x03, 'a', '/', 'b'));
}

TEST_F(EntryCodecTest, FileFrameLayout) {
    auto data = EntryEncoder::encode_entry(Entry::file("x.txt", 0x0102030405060708ULL));

    std::vector<uint8_t> expected = {
        0x01, 0x00, 0x00, 0x00, 0x05, 'x', '.', 't', 'x', 't',
        0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08
    };
    EXPECT_EQ(data, expected);
}

TEST_F(EntryCodecTest, SentinelIsFiveBytes) {
    EXPECT_THAT(EntryEncoder::encode_sentinel(), ElementsAre(0x02, 0x00, 0x00, 0x00, 0x00));
    EXPECT_EQ(EntryEncoder::encode(Frame::sentinel()), EntryEncoder::encode_sentinel());
}

TEST_F(EntryCodecTest, DecodeFileFrame) {
    Entry original = Entry::file("docs/readme.md", 1234);
    auto data = EntryEncoder::encode_entry(original);

    size_t consumed = 0;
    auto frame = EntryDecoder::decode(data, &consumed);

    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->kind, FrameKind::File);
    EXPECT_EQ(frame->entry, original);
    EXPECT_EQ(frame->entry.size, 1234u);
    EXPECT_THAT(frame->entry.relative_path, ElementsAre("docs", "readme.md"));
    EXPECT_EQ(consumed, data.size());
}

TEST_F(EntryCodecTest, DecodeUtf8Path) {
    Entry original = Entry::directory("caf\xc3\xa9/\xe6\x97\xa5\xe6\x9c\xac");
    auto frame = EntryDecoder::decode(EntryEncoder::encode_entry(original));

    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->entry, original);
}

TEST_F(EntryCodecTest, DecodeSentinel) {
    auto frame = EntryDecoder::decode(EntryEncoder::encode_sentinel());
    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(frame->is_sentinel());
}

TEST_F(EntryCodecTest, DecodeStopsAtFrameBoundary) {
    auto data = EntryEncoder::encode_entry(Entry::directory("first"));
    auto second = EntryEncoder::encode_sentinel();
    size_t first_size = data.size();
    data.insert(data.end(), second.begin(), second.end());

    size_t consumed = 0;
    auto frame = EntryDecoder::decode(data, &consumed);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(consumed, first_size);

    frame = EntryDecoder::decode(data.data() + consumed, data.size() - consumed, &consumed);
    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(frame->is_sentinel());
}

TEST_F(EntryCodecTest, IncompleteFrameReturnsNullopt) {
    auto data = EntryEncoder::encode_entry(Entry::file("partial.bin", 10));

    for (size_t length = 0; length < data.size(); ++length) {
        EXPECT_FALSE(EntryDecoder::decode(data.data(), length).has_value()) << "length " << length;
    }
    EXPECT_TRUE(EntryDecoder::decode(data.data(), data.size()).has_value());
}

//=============================================================================
// Rejections
//=============================================================================

TEST_F(EntryCodecTest, RejectsParentTraversal) {
    expect_decode_error(raw_frame(1, "../escape", true, 4), "traversal");
    expect_decode_error(raw_frame(0, "a/../../b"), "traversal");
    expect_decode_error(raw_frame(0, "a/./b"), "traversal");
}

TEST_F(EntryCodecTest, RejectsAbsolutePath) {
    expect_decode_error(raw_frame(0, "/etc"), "absolute");
}

TEST_F(EntryCodecTest, RejectsEmptyPathAndSegments) {
    expect_decode_error(raw_frame(0, ""), "empty path");
    expect_decode_error(raw_frame(0, "a//b"), "empty path segment");
    expect_decode_error(raw_frame(0, "a/"), "empty path segment");
}

TEST_F(EntryCodecTest, RejectsNulAndBackslash) {
    expect_decode_error(raw_frame(0, std::string("a\0b", 3)), "NUL");
    expect_decode_error(raw_frame(0, "..\\escape"), "backslash");
}

TEST_F(EntryCodecTest, RejectedPathIsEscapedInMessage) {
    expect_decode_error(raw_frame(0, std::string("a\0b", 3)), "'a\\x00b'");

    try {
        EntryDecoder::decode(raw_frame(0, "\x1b[2J/../x"));
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& e) {
        std::string message = e.what();
        EXPECT_EQ(message.find('\x1b'), std::string::npos);
        EXPECT_THAT(message, HasSubstr("\\x1b[2J/../x"));
        EXPECT_THAT(message, HasSubstr("traversal"));
    }
}

TEST_F(EntryCodecTest, EncoderEscapesRejectedPath) {
    Entry entry(EntryKind::Directory, {"\x1b[0m", ".."});
    try {
        EntryEncoder::encode_entry(entry);
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        std::string message = e.what();
        EXPECT_EQ(message.find('\x1b'), std::string::npos);
        EXPECT_THAT(message, HasSubstr("\\x1b[0m/.."));
    }
}

TEST_F(EntryCodecTest, PrintablePathEscapesControlBytes) {
    EXPECT_EQ(printable_path("plain/name.txt"), "plain/name.txt");
    EXPECT_EQ(printable_path(std::string("a\0b", 3)), "a\\x00b");
    EXPECT_EQ(printable_path("tab\there\x7f"), "tab\\x09here\\x7f");
    EXPECT_EQ(printable_path("a\\b"), "a\\x5cb");
    EXPECT_EQ(printable_path("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST_F(EntryCodecTest, RejectsInvalidUtf8) {
    expect_decode_error(raw_frame(0, "bad\xff"), "UTF-8");
    // Overlong encoding of '/'
    expect_decode_error(raw_frame(0, "a\xc0\xaf"), "UTF-8");
}

TEST_F(EntryCodecTest, RejectsOversizedPathLength) {
    std::vector<uint8_t> data = {0x00, 0x00, 0x00, 0x10, 0x01};
    expect_decode_error(data, "exceeds limit");

    data = {0x01, 0xFF, 0xFF, 0xFF, 0xFF};
    expect_decode_error(data, "exceeds limit");
}

TEST_F(EntryCodecTest, RejectsUnknownKind) {
    expect_decode_error({0x07}, "unknown frame kind");
}

TEST_F(EntryCodecTest, RejectsSentinelWithPath) {
    expect_decode_error(raw_frame(2, "x"), "sentinel");
}

TEST_F(EntryCodecTest, RejectsSizeAboveInt64Max) {
    expect_decode_error(raw_frame(1, "big", true, 0x8000000000000000ULL), "out of range");

    auto frame = EntryDecoder::decode(raw_frame(1, "big", true, MAX_FILE_SIZE));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->entry.size, MAX_FILE_SIZE);
}

TEST_F(EntryCodecTest, EncoderRefusesInvalidEntries) {
    EXPECT_THROW(EntryEncoder::encode_entry(Entry(EntryKind::File, {"..", "x"}, 1)), std::invalid_argument);
    EXPECT_THROW(EntryEncoder::encode_entry(Entry(EntryKind::Directory, {})), std::invalid_argument);
    EXPECT_THROW(EntryEncoder::encode_entry(Entry(EntryKind::Directory, {"bad\xfe"})), std::invalid_argument);
    EXPECT_THROW(EntryEncoder::encode_entry(Entry(EntryKind::Directory, {std::string(MAX_PATH_LENGTH + 1, 'a')})),
                 std::invalid_argument);
    EXPECT_THROW(EntryEncoder::encode_entry(Entry(EntryKind::File, {"f"}, MAX_FILE_SIZE + 1)), std::invalid_argument);
}

TEST_F(EntryCodecTest, ConfinedPathReasons) {
    std::string reason;
    EXPECT_TRUE(is_confined_path("a/b/c.txt", &reason));
    EXPECT_TRUE(is_confined_path("...", &reason));
    EXPECT_FALSE(is_confined_path("..", &reason));
    EXPECT_THAT(reason, HasSubstr(".."));
}
