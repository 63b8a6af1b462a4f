#pragma once

/**
 * @file entry.h
 * @brief Transfer entries, wire frames and protocol constants
 */

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>

namespace dirpost {

//=============================================================================
// Protocol constants
//=============================================================================

// Bumped whenever the frame layout or termination convention changes
constexpr uint32_t PROTOCOL_VERSION = 1;

// Payload is streamed in chunks of at most this many bytes
constexpr size_t CHUNK_SIZE = 64 * 1024;

// Longest relative path accepted on the wire, in bytes
constexpr uint32_t MAX_PATH_LENGTH = 4096;

// Largest file size accepted on the wire (fits in off_t)
constexpr uint64_t MAX_FILE_SIZE = 0x7FFFFFFFFFFFFFFFULL;

// Fixed part of a metadata frame: kind (1) + path length (4)
constexpr size_t FRAME_HEADER_SIZE = 5;

// Size field that follows the path of a File frame
constexpr size_t FRAME_SIZE_FIELD = 8;

//=============================================================================
// Entries
//=============================================================================

enum class EntryKind : uint8_t {
    Directory = 0,
    File = 1
};

/**
 * @brief Relative path as an ordered list of segments ("a/b/c.txt" -> {a, b, c.txt})
 */
using RelativePath = std::vector<std::string>;

/**
 * @brief One filesystem object to transfer
 */
struct Entry {
    EntryKind kind;
    RelativePath relative_path;
    uint64_t size;                  // Meaningful only for File

    Entry() : kind(EntryKind::Directory), size(0) {}
    Entry(EntryKind k, RelativePath path, uint64_t s = 0)
        : kind(k), relative_path(std::move(path)), size(s) {}

    static Entry directory(const std::string& path);
    static Entry file(const std::string& path, uint64_t size);

    bool is_directory() const { return kind == EntryKind::Directory; }
    bool is_file() const { return kind == EntryKind::File; }

    // Path segments joined with '/'
    std::string path_string() const;

    bool operator==(const Entry& other) const {
        return kind == other.kind &&
               relative_path == other.relative_path &&
               (kind == EntryKind::Directory || size == other.size);
    }

    bool operator!=(const Entry& other) const {
        return !(*this == other);
    }
};

//=============================================================================
// Frames
//=============================================================================

/**
 * @brief Kind byte of a metadata frame
 */
enum class FrameKind : uint8_t {
    Directory = 0,
    File = 1,
    Sentinel = 2
};

const char* frame_kind_to_string(FrameKind kind);

/**
 * @brief One metadata unit on the wire: an entry, or the end-of-transfer sentinel
 */
struct Frame {
    FrameKind kind;
    Entry entry;                    // Unused for Sentinel

    Frame() : kind(FrameKind::Sentinel) {}
    explicit Frame(const Entry& e)
        : kind(e.is_file() ? FrameKind::File : FrameKind::Directory), entry(e) {}

    static Frame sentinel() { return Frame(); }

    bool is_sentinel() const { return kind == FrameKind::Sentinel; }
};

//=============================================================================
// Path helpers
//=============================================================================

/**
 * @brief Join segments with '/'
 */
std::string join_relative_path(const RelativePath& path);

/**
 * @brief Split on '/' keeping empty segments, so validation can see them
 */
RelativePath split_relative_path(const std::string& path);

/**
 * @brief Check that a wire path is confined to the transfer root
 *
 * Rejects empty paths, absolute paths, empty, "." and ".." segments,
 * and segments containing NUL or backslash.
 *
 * @param path Path as received
 * @param reason Set to a description of the problem on failure
 * @return true if the path is safe to append to the transfer root
 */
bool is_confined_path(const std::string& path, std::string* reason = nullptr);

/**
 * @brief Render a path for messages, with control bytes and backslash as \xNN
 */
std::string printable_path(const std::string& path);

/**
 * @brief Check that a byte string is well-formed UTF-8
 */
bool is_valid_utf8(const std::string& data);

} // namespace dirpost
