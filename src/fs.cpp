#include "fs.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

#define LOG_FS_DEBUG(message) LOG_DEBUG("fs", message)
#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace dirpost {

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool directory_exists(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    return false;
}

bool is_symlink(const std::string& path) {
    struct stat st;
    return lstat(path.c_str(), &st) == 0 && S_ISLNK(st.st_mode);
}

bool create_directory(const std::string& path) {
    if (path.empty()) return false;

    if (mkdir(path.c_str(), 0755) == 0) {
        LOG_FS_DEBUG("Created directory " << path);
        return true;
    }

    int err = errno;
    if (err == EEXIST && directory_exists(path)) {
        return true; // Already exists
    }
    errno = err;
    return false;
}

bool create_directories(const std::string& path) {
    if (path.empty()) return false;

    if (directory_exists(path)) {
        return true;
    }

    // Create each prefix that ends at a separator, then the full path
    for (size_t i = 1; i < path.size(); ++i) {
        if (path[i] == '/' && path[i - 1] != '/') {
            std::string prefix = path.substr(0, i);
            if (!create_directory(prefix)) {
                return false;
            }
        }
    }
    return create_directory(path);
}

bool remove_tree(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }

    if (!S_ISDIR(st.st_mode)) {
        return unlink(path.c_str()) == 0;
    }

    std::vector<DirectoryEntry> children;
    if (!list_directory(path, children)) {
        return false;
    }
    for (const auto& child : children) {
        if (!remove_tree(combine_paths(path, child.name))) {
            return false;
        }
    }
    return rmdir(path.c_str()) == 0;
}

bool create_file_binary(const std::string& path, const void* data, size_t size) {
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create binary file: " << path);
        return false;
    }

    bool ok = true;
    if (data && size > 0) {
        ok = fwrite(data, 1, size, file) == size;
    }
    if (fclose(file) != 0) {
        ok = false;
    }
    if (!ok) {
        LOG_FS_ERROR("Failed to write complete binary data to file: " << path);
    }
    return ok;
}

bool read_file_binary(const std::string& path, std::vector<uint8_t>& data) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        return false;
    }

    data.clear();
    uint8_t buffer[8192];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        data.insert(data.end(), buffer, buffer + n);
    }
    bool ok = ferror(file) == 0;
    fclose(file);
    return ok;
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;
    if (base.back() == '/') return base + relative;
    return base + "/" + relative;
}

bool canonical_path(const std::string& path, std::string& resolved) {
    char buffer[PATH_MAX];
    if (!realpath(path.c_str(), buffer)) {
        return false;
    }
    resolved = buffer;
    return true;
}

bool list_directory(const std::string& path, std::vector<DirectoryEntry>& entries) {
    entries.clear();

    DIR* dir = opendir(path.c_str());
    if (!dir) {
        return false;
    }

    errno = 0;
    struct dirent* ent;
    while ((ent = readdir(dir)) != nullptr) {
        if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) {
            continue;
        }

        DirectoryEntry entry;
        entry.name = ent->d_name;

        struct stat st;
        std::string full_path = combine_paths(path, entry.name);
        if (lstat(full_path.c_str(), &st) == 0) {
            if (S_ISLNK(st.st_mode)) {
                entry.type = FileType::Symlink;
            } else if (S_ISDIR(st.st_mode)) {
                entry.type = FileType::Directory;
            } else if (S_ISREG(st.st_mode)) {
                entry.type = FileType::Regular;
                entry.size = static_cast<uint64_t>(st.st_size);
            } else {
                entry.type = FileType::Other;
            }
        } else {
            // Vanished between readdir and lstat
            LOG_FS_DEBUG("Skipping " << full_path << ": " << strerror(errno));
            errno = 0;
            continue;
        }

        entries.push_back(entry);
        errno = 0;
    }

    int err = errno;
    closedir(dir);
    if (err != 0) {
        errno = err;
        return false;
    }

    std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
        return a.name < b.name;
    });
    return true;
}

//=============================================================================
// FileReader
//=============================================================================

FileReader::FileReader(const std::string& path) : path_(path), file_(nullptr), size_(0) {
    file_ = fopen(path.c_str(), "rb");
    if (!file_) {
        throw IoError(errno_message("cannot open '" + path + "' for reading", errno));
    }

    struct stat st;
    if (fstat(fileno(file_), &st) != 0) {
        int err = errno;
        fclose(file_);
        file_ = nullptr;
        throw IoError(errno_message("cannot stat '" + path + "'", err));
    }
    if (!S_ISREG(st.st_mode)) {
        fclose(file_);
        file_ = nullptr;
        throw IoError("'" + path + "' is not a regular file");
    }
    size_ = static_cast<uint64_t>(st.st_size);
}

FileReader::~FileReader() {
    if (file_) {
        fclose(file_);
    }
}

size_t FileReader::read(uint8_t* buffer, size_t length) {
    size_t n = fread(buffer, 1, length, file_);
    if (n < length && ferror(file_)) {
        throw IoError(errno_message("read from '" + path_ + "' failed", errno));
    }
    return n;
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::FileWriter(const std::string& path) : path_(path), file_(nullptr), bytes_written_(0) {
    // A symlink at the final component is refused rather than written through
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw IoError(errno_message("cannot create '" + path + "'", errno));
    }
    file_ = fdopen(fd, "wb");
    if (!file_) {
        int err = errno;
        ::close(fd);
        throw IoError(errno_message("cannot create '" + path + "'", err));
    }
}

FileWriter::~FileWriter() {
    if (file_) {
        fclose(file_);
    }
}

void FileWriter::write(const uint8_t* data, size_t length) {
    if (!file_) {
        throw IoError("write to closed file '" + path_ + "'");
    }
    if (length == 0) {
        return;
    }
    if (fwrite(data, 1, length, file_) != length) {
        throw IoError(errno_message("write to '" + path_ + "' failed", errno));
    }
    bytes_written_ += length;
}

void FileWriter::close() {
    if (!file_) {
        return;
    }
    FILE* file = file_;
    file_ = nullptr;
    if (fclose(file) != 0) {
        throw IoError(errno_message("closing '" + path_ + "' failed", errno));
    }
}

std::unique_ptr<FileReader> open_for_read(const std::string& path) {
    return std::make_unique<FileReader>(path);
}

std::unique_ptr<FileWriter> create_or_truncate(const std::string& path) {
    return std::make_unique<FileWriter>(path);
}

} // namespace dirpost
