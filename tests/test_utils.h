#pragma once

#include "channel.h"
#include "errors.h"
#include "fs.h"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include <cstdlib>
#include <stdexcept>

namespace dirpost {
namespace test {

// Fresh directory under $TMPDIR (or /tmp), removed on destruction
class TempDirectory {
public:
    explicit TempDirectory(const std::string& tag = "dirpost") {
        const char* base = std::getenv("TMPDIR");
        std::string pattern = std::string(base && *base ? base : "/tmp") + "/" + tag + "_XXXXXX";
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (!mkdtemp(buffer.data())) {
            throw std::runtime_error("mkdtemp failed for " + pattern);
        }
        path_ = buffer.data();
    }

    ~TempDirectory() {
        remove_tree(path_);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::string& path() const { return path_; }
    std::string operator/(const std::string& relative) const { return combine_paths(path_, relative); }

private:
    std::string path_;
};

inline std::string read_text(const std::string& path) {
    std::vector<uint8_t> data;
    if (!read_file_binary(path, data)) {
        return std::string();
    }
    return std::string(data.begin(), data.end());
}

// Deterministic non-repeating-ish payload
inline std::vector<uint8_t> make_payload(size_t size, uint32_t seed = 1) {
    std::vector<uint8_t> data(size);
    uint32_t state = seed;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        data[i] = static_cast<uint8_t>(state >> 16);
    }
    return data;
}

// In-memory channel that hands out at most `max_read` bytes per read.
// Reads return 0 once `incoming` is exhausted.
class MemoryChannel : public Channel {
public:
    explicit MemoryChannel(size_t max_read = SIZE_MAX)
        : max_read_(max_read), read_pos_(0), shut_down_(false), closed_(false) {}

    size_t read(uint8_t* buffer, size_t length) override {
        size_t n = std::min({length, max_read_, incoming.size() - read_pos_});
        std::copy(incoming.begin() + read_pos_, incoming.begin() + read_pos_ + n, buffer);
        read_pos_ += n;
        return n;
    }

    void write(const uint8_t* data, size_t length) override {
        if (shut_down_) {
            throw TransportError("write after shutdown");
        }
        outgoing.insert(outgoing.end(), data, data + length);
    }

    void shutdown_write() override { shut_down_ = true; }
    void close() override { shut_down_ = true; closed_ = true; }

    bool shut_down() const { return shut_down_; }
    bool closed() const { return closed_; }

    std::vector<uint8_t> incoming;
    std::vector<uint8_t> outgoing;

private:
    size_t max_read_;
    size_t read_pos_;
    bool shut_down_;
    bool closed_;
};

} // namespace test
} // namespace dirpost
