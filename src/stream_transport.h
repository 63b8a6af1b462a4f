#pragma once

/**
 * @file stream_transport.h
 * @brief Frames and payload bytes over one ordered channel
 */

#include "channel.h"
#include "entry.h"
#include "entry_codec.h"
#include "errors.h"

#include <vector>
#include <cstdint>

namespace dirpost {

/**
 * @brief Reads and writes metadata frames and raw payload on a shared channel
 *
 * No buffering beyond the frame being assembled: a read never pulls bytes
 * past the end of the frame or payload chunk requested, so frames and
 * payload can be interleaved freely by the caller.
 *
 * Channel failures throw TransportError. A clean close in the middle of a
 * read throws ChannelClosedError with the number of bytes that did arrive.
 */
class StreamTransport {
public:
    explicit StreamTransport(Channel& channel);

    void write_frame(const Frame& frame);

    /**
     * @brief Read one metadata frame
     * @throws DecodeError on a malformed frame, as soon as the bad field is read
     */
    Frame read_frame();

    void write_bytes(const uint8_t* data, size_t length);
    void write_bytes(const std::vector<uint8_t>& data) { write_bytes(data.data(), data.size()); }

    /**
     * @brief Read exactly `length` payload bytes
     */
    void read_exact(uint8_t* buffer, size_t length);
    std::vector<uint8_t> read_exact(size_t length);

    /**
     * @brief Close the write side after the last frame
     */
    void finish();

    uint64_t bytes_written() const { return bytes_written_; }
    uint64_t bytes_read() const { return bytes_read_; }

private:
    Channel& channel_;
    uint64_t bytes_written_;
    uint64_t bytes_read_;
};

} // namespace dirpost
