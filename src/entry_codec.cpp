#include "entry_codec.h"
#include <stdexcept>

namespace dirpost {

//=============================================================================
// Encoder
//=============================================================================

void EntryEncoder::write_uint32(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

void EntryEncoder::write_uint64(std::vector<uint8_t>& buf, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buf.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

std::vector<uint8_t> EntryEncoder::encode_entry(const Entry& entry) {
    std::string path = entry.path_string();

    std::string reason;
    if (!is_confined_path(path, &reason)) {
        throw std::invalid_argument("cannot encode entry '" + printable_path(path) + "': " + reason);
    }
    if (!is_valid_utf8(path)) {
        throw std::invalid_argument("cannot encode entry: path is not valid UTF-8");
    }
    if (path.size() > MAX_PATH_LENGTH) {
        throw std::invalid_argument("cannot encode entry: path longer than " +
                                    std::to_string(MAX_PATH_LENGTH) + " bytes");
    }
    if (entry.is_file() && entry.size > MAX_FILE_SIZE) {
        throw std::invalid_argument("cannot encode entry '" + printable_path(path) + "': size out of range");
    }

    std::vector<uint8_t> frame;
    frame.reserve(FRAME_HEADER_SIZE + path.size() + FRAME_SIZE_FIELD);

    frame.push_back(static_cast<uint8_t>(entry.is_file() ? FrameKind::File : FrameKind::Directory));
    write_uint32(frame, static_cast<uint32_t>(path.size()));
    frame.insert(frame.end(), path.begin(), path.end());

    if (entry.is_file()) {
        write_uint64(frame, entry.size);
    }
    return frame;
}

std::vector<uint8_t> EntryEncoder::encode_sentinel() {
    std::vector<uint8_t> frame;
    frame.push_back(static_cast<uint8_t>(FrameKind::Sentinel));
    write_uint32(frame, 0);
    return frame;
}

std::vector<uint8_t> EntryEncoder::encode(const Frame& frame) {
    if (frame.is_sentinel()) {
        return encode_sentinel();
    }
    return encode_entry(frame.entry);
}

//=============================================================================
// Decoder
//=============================================================================

uint32_t EntryDecoder::read_uint32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

uint64_t EntryDecoder::read_uint64(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<uint64_t>(data[i]);
    }
    return value;
}

FrameKind EntryDecoder::decode_kind(uint8_t byte) {
    switch (byte) {
        case static_cast<uint8_t>(FrameKind::Directory): return FrameKind::Directory;
        case static_cast<uint8_t>(FrameKind::File): return FrameKind::File;
        case static_cast<uint8_t>(FrameKind::Sentinel): return FrameKind::Sentinel;
        default:
            throw DecodeError("unknown frame kind " + std::to_string(byte));
    }
}

uint32_t EntryDecoder::decode_path_length(FrameKind kind, const uint8_t* data) {
    uint32_t length = read_uint32(data);

    if (kind == FrameKind::Sentinel) {
        if (length != 0) {
            throw DecodeError("sentinel frame with non-empty path (" + std::to_string(length) + " bytes)");
        }
        return 0;
    }
    if (length == 0) {
        throw DecodeError(std::string(frame_kind_to_string(kind)) + " frame with empty path");
    }
    if (length > MAX_PATH_LENGTH) {
        throw DecodeError("path length " + std::to_string(length) + " exceeds limit of " +
                          std::to_string(MAX_PATH_LENGTH));
    }
    return length;
}

RelativePath EntryDecoder::decode_path(const uint8_t* data, size_t length) {
    std::string path(reinterpret_cast<const char*>(data), length);

    if (!is_valid_utf8(path)) {
        throw DecodeError("path is not valid UTF-8");
    }

    std::string reason;
    if (!is_confined_path(path, &reason)) {
        throw DecodeError("rejected path '" + printable_path(path) + "': " + reason);
    }
    return split_relative_path(path);
}

uint64_t EntryDecoder::decode_size(const uint8_t* data) {
    uint64_t size = read_uint64(data);
    if (size > MAX_FILE_SIZE) {
        throw DecodeError("file size " + std::to_string(size) + " out of range");
    }
    return size;
}

std::optional<Frame> EntryDecoder::decode(const uint8_t* data, size_t length, size_t* consumed) {
    if (length < 1) {
        return std::nullopt;
    }

    // Validate the kind before waiting for more bytes
    FrameKind kind = decode_kind(data[0]);

    if (length < FRAME_HEADER_SIZE) {
        return std::nullopt;
    }

    uint32_t path_length = decode_path_length(kind, data + 1);
    size_t total = FRAME_HEADER_SIZE + path_length + (kind == FrameKind::File ? FRAME_SIZE_FIELD : 0);
    if (length < total) {
        return std::nullopt;
    }

    Frame frame;
    frame.kind = kind;

    if (kind != FrameKind::Sentinel) {
        frame.entry.kind = kind == FrameKind::File ? EntryKind::File : EntryKind::Directory;
        frame.entry.relative_path = decode_path(data + FRAME_HEADER_SIZE, path_length);
        if (kind == FrameKind::File) {
            frame.entry.size = decode_size(data + FRAME_HEADER_SIZE + path_length);
        }
    }

    if (consumed) {
        *consumed = total;
    }
    return frame;
}

std::optional<Frame> EntryDecoder::decode(const std::vector<uint8_t>& data, size_t* consumed) {
    return decode(data.data(), data.size(), consumed);
}

} // namespace dirpost
