#pragma once

/**
 * @file entry_codec.h
 * @brief Metadata frame encoding and decoding
 *
 * Wire layout of a metadata frame (all integers big-endian):
 *
 *   [kind: u8] [path_len: u32] [path: path_len bytes UTF-8] [size: u64, File only]
 *
 * kind is 0 (Directory), 1 (File) or 2 (Sentinel). The sentinel carries
 * path_len = 0 and nothing else. File payload is not part of the frame; it
 * follows a File frame as exactly `size` raw bytes.
 */

#include "entry.h"
#include "errors.h"

#include <vector>
#include <cstdint>
#include <optional>

namespace dirpost {

//=============================================================================
// Encoder
//=============================================================================

/**
 * @brief Encodes frames to wire format
 */
class EntryEncoder {
public:
    /**
     * @brief Encode a Directory or File entry
     * @throws std::invalid_argument if the entry would be rejected by a decoder
     */
    static std::vector<uint8_t> encode_entry(const Entry& entry);

    /**
     * @brief Encode the end-of-transfer sentinel
     */
    static std::vector<uint8_t> encode_sentinel();

    /**
     * @brief Encode any frame
     */
    static std::vector<uint8_t> encode(const Frame& frame);

private:
    static void write_uint32(std::vector<uint8_t>& buf, uint32_t value);
    static void write_uint64(std::vector<uint8_t>& buf, uint64_t value);
};

//=============================================================================
// Decoder
//=============================================================================

/**
 * @brief Decodes frames from wire format
 *
 * Every rejection throws DecodeError. The field-level functions let a
 * streaming reader validate each field as soon as it has been read, before
 * pulling the next one off the channel.
 */
class EntryDecoder {
public:
    /**
     * @brief Validate the kind byte
     */
    static FrameKind decode_kind(uint8_t byte);

    /**
     * @brief Read and validate the path length that follows the kind byte
     * @param kind Already decoded kind (the sentinel must have length 0)
     * @param data 4 bytes
     */
    static uint32_t decode_path_length(FrameKind kind, const uint8_t* data);

    /**
     * @brief Validate a path and split it into segments
     *
     * Rejects non-UTF-8 bytes and anything is_confined_path() rejects.
     */
    static RelativePath decode_path(const uint8_t* data, size_t length);

    /**
     * @brief Read and validate a File size field
     * @param data 8 bytes
     */
    static uint64_t decode_size(const uint8_t* data);

    /**
     * @brief Decode one complete frame from a buffer
     *
     * @param data Buffer starting at a kind byte
     * @param length Buffer length
     * @param consumed Set to the frame length on success
     * @return Decoded frame, or nullopt if the buffer holds an incomplete frame
     */
    static std::optional<Frame> decode(const uint8_t* data, size_t length, size_t* consumed = nullptr);

    static std::optional<Frame> decode(const std::vector<uint8_t>& data, size_t* consumed = nullptr);

    static uint32_t read_uint32(const uint8_t* data);
    static uint64_t read_uint64(const uint8_t* data);
};

} // namespace dirpost
