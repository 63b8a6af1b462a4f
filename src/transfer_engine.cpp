#include "transfer_engine.h"
#include "errors.h"
#include "fs.h"
#include "logger.h"
#include <algorithm>
#include <cerrno>
#include <vector>

// Engine module logging macros
#define LOG_ENGINE_DEBUG(message) LOG_DEBUG("engine", message)
#define LOG_ENGINE_INFO(message)  LOG_INFO("engine", message)
#define LOG_ENGINE_WARN(message)  LOG_WARN("engine", message)
#define LOG_ENGINE_ERROR(message) LOG_ERROR("engine", message)

namespace dirpost {

const char* sender_state_to_string(SenderState state) {
    switch (state) {
        case SenderState::Idle: return "idle";
        case SenderState::Walking: return "walking";
        case SenderState::EmittingDirectory: return "emitting directory";
        case SenderState::EmittingFile: return "emitting file";
        case SenderState::Closing: return "closing";
        case SenderState::Done: return "done";
        default: return "unknown";
    }
}

const char* receiver_state_to_string(ReceiverState state) {
    switch (state) {
        case ReceiverState::Idle: return "idle";
        case ReceiverState::AwaitingFrame: return "awaiting frame";
        case ReceiverState::MaterializingDirectory: return "materializing directory";
        case ReceiverState::MaterializingFile: return "materializing file";
        case ReceiverState::Done: return "done";
        default: return "unknown";
    }
}

//=============================================================================
// DirectorySender
//=============================================================================

DirectorySender::DirectorySender(const std::string& root, StreamTransport& transport)
    : walker_(root), transport_(transport), state_(SenderState::Idle) {}

TransferStats DirectorySender::run() {
    walker_.reset();
    stats_ = TransferStats();
    state_ = SenderState::Walking;

    Entry entry;
    while (walker_.next(entry)) {
        if (entry.is_directory()) {
            state_ = SenderState::EmittingDirectory;
            emit_directory(entry);
        } else {
            state_ = SenderState::EmittingFile;
            emit_file(entry);
        }
        state_ = SenderState::Walking;
    }

    state_ = SenderState::Closing;
    transport_.write_frame(Frame::sentinel());
    transport_.finish();

    if (walker_.skipped_count() > 0) {
        LOG_ENGINE_INFO("Skipped " << walker_.skipped_count() << " symlinks or special files");
    }

    state_ = SenderState::Done;
    return stats_;
}

void DirectorySender::emit_directory(const Entry& entry) {
    transport_.write_frame(Frame(entry));
    ++stats_.directories;
    entry_completed(entry);
}

void DirectorySender::emit_file(const Entry& entry) {
    std::string path = walker_.local_path(entry);

    // Opened before the frame is written so a failed open leaves no half entry on the wire
    std::unique_ptr<FileReader> reader = open_for_read(path);

    Entry sized = entry;
    sized.size = reader->size();
    if (sized.size != entry.size) {
        LOG_ENGINE_DEBUG("Size of " << entry.path_string() << " changed from " << entry.size
                         << " to " << sized.size << " since it was listed");
    }
    transport_.write_frame(Frame(sized));

    std::vector<uint8_t> buffer(static_cast<size_t>(std::min<uint64_t>(CHUNK_SIZE, std::max<uint64_t>(sized.size, 1))));
    uint64_t remaining = sized.size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        size_t n = reader->read(buffer.data(), want);
        if (n == 0) {
            throw IoError("file '" + path + "' shrank while being sent: " +
                          std::to_string(sized.size - remaining) + " of " +
                          std::to_string(sized.size) + " bytes read");
        }
        transport_.write_bytes(buffer.data(), n);
        remaining -= n;
        stats_.bytes += n;
    }

    ++stats_.files;
    entry_completed(sized);
}

void DirectorySender::entry_completed(const Entry& entry) {
    LOG_ENGINE_INFO("sending: " << entry.path_string() << (entry.is_directory() ? "/" : "") << " ... DONE");
    if (entry_callback_) {
        entry_callback_(entry, stats_);
    }
}

//=============================================================================
// DirectoryReceiver
//=============================================================================

DirectoryReceiver::DirectoryReceiver(const std::string& root, StreamTransport& transport)
    : root_(root), transport_(transport), state_(ReceiverState::Idle) {
    validate_transfer_root(root_);
}

std::string DirectoryReceiver::local_path(const Entry& entry) const {
    return combine_paths(root_, entry.path_string());
}

TransferStats DirectoryReceiver::run() {
    stats_ = TransferStats();

    while (true) {
        state_ = ReceiverState::AwaitingFrame;
        Frame frame = transport_.read_frame();

        if (frame.is_sentinel()) {
            break;
        }

        if (frame.entry.is_directory()) {
            state_ = ReceiverState::MaterializingDirectory;
            materialize_directory(frame.entry);
        } else {
            state_ = ReceiverState::MaterializingFile;
            materialize_file(frame.entry);
        }
    }

    LOG_ENGINE_DEBUG("End-of-transfer sentinel received");
    transport_.finish();
    state_ = ReceiverState::Done;
    return stats_;
}

void DirectoryReceiver::ensure_directory(const std::string& path) {
    if (!create_directories(path)) {
        int err = errno;
        if (file_exists(path) && !directory_exists(path)) {
            throw IoError("cannot create directory '" + path + "': a file is in the way");
        }
        throw IoError(errno_message("cannot create directory '" + path + "'", err));
    }
}

// Existing symlinks anywhere along the entry's path could lead outside the root
void DirectoryReceiver::refuse_symlinks(const Entry& entry) const {
    std::string path = root_;
    for (const auto& segment : entry.relative_path) {
        path = combine_paths(path, segment);
        if (is_symlink(path)) {
            throw IoError("refusing to follow symlink '" + path + "' inside transfer root");
        }
    }
}

void DirectoryReceiver::materialize_directory(const Entry& entry) {
    refuse_symlinks(entry);
    ensure_directory(local_path(entry));
    ++stats_.directories;
    entry_completed(entry);
}

void DirectoryReceiver::materialize_file(const Entry& entry) {
    refuse_symlinks(entry);
    if (entry.relative_path.size() > 1) {
        RelativePath parent(entry.relative_path.begin(), entry.relative_path.end() - 1);
        ensure_directory(combine_paths(root_, join_relative_path(parent)));
    }

    std::string path = local_path(entry);
    if (directory_exists(path)) {
        throw IoError("cannot write file '" + path + "': a directory is in the way");
    }

    std::unique_ptr<FileWriter> writer = create_or_truncate(path);

    std::vector<uint8_t> buffer(static_cast<size_t>(std::min<uint64_t>(CHUNK_SIZE, std::max<uint64_t>(entry.size, 1))));
    uint64_t remaining = entry.size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        try {
            transport_.read_exact(buffer.data(), want);
        } catch (const ChannelClosedError& e) {
            uint64_t received = entry.size - remaining + e.bytes_received();
            writer->write(buffer.data(), e.bytes_received());
            writer->close();
            stats_.bytes += e.bytes_received();
            throw TruncatedTransferError(path, entry.size, received);
        }
        writer->write(buffer.data(), want);
        remaining -= want;
        stats_.bytes += want;
    }
    writer->close();

    ++stats_.files;
    entry_completed(entry);
}

void DirectoryReceiver::entry_completed(const Entry& entry) {
    LOG_ENGINE_INFO("receiving: " << entry.path_string() << (entry.is_directory() ? "/" : "") << " ... DONE");
    if (entry_callback_) {
        entry_callback_(entry, stats_);
    }
}

//=============================================================================
// TransferEngine
//=============================================================================

TransferEngine::TransferEngine(Session& session) : session_(session) {}

TransferStats TransferEngine::run() {
    if (!session_.channel) {
        throw TransportError("session has no channel");
    }

    StreamTransport transport(*session_.channel);
    LOG_ENGINE_DEBUG("Starting transfer as " << direction_to_string(session_.direction)
                     << " side, root " << session_.root);

    try {
        switch (session_.direction) {
            case Direction::Send:
                stats_ = run_sender(transport);
                break;
            case Direction::Receive:
                stats_ = run_receiver(transport);
                break;
        }
    } catch (const TransferError& e) {
        LOG_ENGINE_ERROR("Transfer aborted (" << error_kind_to_string(e.kind()) << ") after "
                         << stats_.directories << " directories, " << stats_.files << " files, "
                         << stats_.bytes << " bytes");
        session_.channel->close();
        throw;
    }

    session_.channel->close();
    LOG_ENGINE_INFO("Transfer complete: " << stats_.directories << " directories, "
                    << stats_.files << " files, " << stats_.bytes << " bytes");
    return stats_;
}

TransferStats TransferEngine::run_sender(StreamTransport& transport) {
    DirectorySender sender(session_.root, transport);
    sender.set_entry_callback([this](const Entry& entry, const TransferStats& stats) {
        stats_ = stats;
        if (entry_callback_) {
            entry_callback_(entry, stats);
        }
    });
    return sender.run();
}

TransferStats TransferEngine::run_receiver(StreamTransport& transport) {
    DirectoryReceiver receiver(session_.root, transport);
    receiver.set_entry_callback([this](const Entry& entry, const TransferStats& stats) {
        stats_ = stats;
        if (entry_callback_) {
            entry_callback_(entry, stats);
        }
    });
    return receiver.run();
}

} // namespace dirpost
