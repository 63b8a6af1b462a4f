#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <cstdio>

namespace dirpost {

// File/Directory existence check (symlinks are followed)
bool file_exists(const std::string& path);
bool directory_exists(const std::string& path);

// True if the path itself is a symbolic link (not followed)
bool is_symlink(const std::string& path);

// Directory operations. Both succeed if the directory already exists,
// and fail if the path exists but is not a directory.
bool create_directory(const std::string& path);
bool create_directories(const std::string& path);

// Remove a file or a whole directory tree, without following symlinks
bool remove_tree(const std::string& path);

// Whole-file helpers
bool create_file_binary(const std::string& path, const void* data, size_t size);
inline bool create_file(const std::string& path, const std::string& content) {
    return create_file_binary(path, content.data(), content.size());
}
bool read_file_binary(const std::string& path, std::vector<uint8_t>& data);

// Path utilities
std::string combine_paths(const std::string& base, const std::string& relative);
bool canonical_path(const std::string& path, std::string& resolved);

// Directory listing
enum class FileType {
    Regular,
    Directory,
    Symlink,
    Other           // fifo, socket, device
};

struct DirectoryEntry {
    std::string name;
    FileType type;      // From lstat, links are not followed
    uint64_t size;

    DirectoryEntry() : type(FileType::Other), size(0) {}
};

/**
 * List a directory, sorted by name (byte-wise), without "." and ".."
 * @param path Directory to list
 * @param entries Output list
 * @return false if the directory cannot be opened or read (errno is preserved)
 */
bool list_directory(const std::string& path, std::vector<DirectoryEntry>& entries);

/**
 * Byte source over a regular file opened for reading. Throws IoError.
 */
class FileReader {
public:
    explicit FileReader(const std::string& path);
    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    // Size of the file when it was opened
    uint64_t size() const { return size_; }
    const std::string& path() const { return path_; }

    /**
     * Read up to `length` bytes
     * @return Bytes read, 0 at end of file
     */
    size_t read(uint8_t* buffer, size_t length);

private:
    std::string path_;
    FILE* file_;
    uint64_t size_;
};

/**
 * Byte sink over a file created or truncated for writing. Throws IoError.
 */
class FileWriter {
public:
    explicit FileWriter(const std::string& path);
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    const std::string& path() const { return path_; }
    uint64_t bytes_written() const { return bytes_written_; }

    void write(const uint8_t* data, size_t length);

    // Flush and close, reporting deferred write errors
    void close();

private:
    std::string path_;
    FILE* file_;
    uint64_t bytes_written_;
};

std::unique_ptr<FileReader> open_for_read(const std::string& path);
std::unique_ptr<FileWriter> create_or_truncate(const std::string& path);

} // namespace dirpost
