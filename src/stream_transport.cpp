#include "stream_transport.h"
#include "logger.h"

#define LOG_TRANSPORT_DEBUG(message) LOG_DEBUG("transport", message)

namespace dirpost {

StreamTransport::StreamTransport(Channel& channel)
    : channel_(channel), bytes_written_(0), bytes_read_(0) {}

void StreamTransport::write_frame(const Frame& frame) {
    std::vector<uint8_t> data = EntryEncoder::encode(frame);
    LOG_TRANSPORT_DEBUG("-> " << frame_kind_to_string(frame.kind) << " frame"
                        << (frame.is_sentinel() ? "" : " '" + frame.entry.path_string() + "'")
                        << " (" << data.size() << " bytes)");
    write_bytes(data);
}

Frame StreamTransport::read_frame() {
    uint8_t header[FRAME_HEADER_SIZE];

    try {
        read_exact(header, 1);
    } catch (const ChannelClosedError&) {
        throw ChannelClosedError("channel closed before end-of-transfer sentinel", 0);
    }

    Frame frame;
    frame.kind = EntryDecoder::decode_kind(header[0]);

    read_exact(header + 1, FRAME_HEADER_SIZE - 1);
    uint32_t path_length = EntryDecoder::decode_path_length(frame.kind, header + 1);

    if (frame.kind != FrameKind::Sentinel) {
        std::vector<uint8_t> path(path_length);
        read_exact(path.data(), path.size());

        frame.entry.kind = frame.kind == FrameKind::File ? EntryKind::File : EntryKind::Directory;
        frame.entry.relative_path = EntryDecoder::decode_path(path.data(), path.size());

        if (frame.kind == FrameKind::File) {
            uint8_t size_field[FRAME_SIZE_FIELD];
            read_exact(size_field, sizeof(size_field));
            frame.entry.size = EntryDecoder::decode_size(size_field);
        }
    }

    LOG_TRANSPORT_DEBUG("<- " << frame_kind_to_string(frame.kind) << " frame"
                        << (frame.is_sentinel() ? "" : " '" + frame.entry.path_string() + "'"));
    return frame;
}

void StreamTransport::write_bytes(const uint8_t* data, size_t length) {
    if (length == 0) {
        return;
    }
    channel_.write(data, length);
    bytes_written_ += length;
}

void StreamTransport::read_exact(uint8_t* buffer, size_t length) {
    size_t received = 0;
    while (received < length) {
        size_t n = channel_.read(buffer + received, length - received);
        if (n == 0) {
            bytes_read_ += received;
            throw ChannelClosedError("channel closed after " + std::to_string(received) + " of " +
                                     std::to_string(length) + " bytes", received);
        }
        received += n;
    }
    bytes_read_ += received;
}

std::vector<uint8_t> StreamTransport::read_exact(size_t length) {
    std::vector<uint8_t> buffer(length);
    read_exact(buffer.data(), buffer.size());
    return buffer;
}

void StreamTransport::finish() {
    LOG_TRANSPORT_DEBUG("Closing write side after " << bytes_written_ << " bytes");
    channel_.shutdown_write();
}

} // namespace dirpost
