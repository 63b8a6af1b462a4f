#pragma once

/**
 * @file transfer_engine.h
 * @brief Sender and receiver sides of a directory tree transfer
 */

#include "entry.h"
#include "session.h"
#include "stream_transport.h"
#include "tree_walker.h"

#include <functional>
#include <string>
#include <cstdint>

namespace dirpost {

/**
 * @brief Counters reported at the end of a transfer
 */
struct TransferStats {
    uint64_t directories;
    uint64_t files;
    uint64_t bytes;             // Payload bytes, frames not included

    TransferStats() : directories(0), files(0), bytes(0) {}
};

/**
 * @brief Called once an entry has been fully sent or materialized
 */
using EntryCompletedCallback = std::function<void(const Entry& entry, const TransferStats& stats)>;

//=============================================================================
// Sender
//=============================================================================

enum class SenderState {
    Idle,
    Walking,
    EmittingDirectory,
    EmittingFile,
    Closing,
    Done
};

const char* sender_state_to_string(SenderState state);

/**
 * @brief Walks a root and pushes every entry through a transport
 *
 * For each entry a metadata frame is written; a File frame is followed by
 * exactly `size` payload bytes, where `size` is the file size when it was
 * opened. The sentinel frame ends the stream and the write side is closed.
 */
class DirectorySender {
public:
    /**
     * @throws WalkError if root is not a directory
     */
    DirectorySender(const std::string& root, StreamTransport& transport);

    /**
     * @brief Send the whole tree
     * @throws WalkError, IoError, TransportError
     */
    TransferStats run();

    void set_entry_callback(EntryCompletedCallback callback) { entry_callback_ = std::move(callback); }

    SenderState state() const { return state_; }
    const TransferStats& stats() const { return stats_; }

private:
    void emit_directory(const Entry& entry);
    void emit_file(const Entry& entry);
    void entry_completed(const Entry& entry);

    TreeWalker walker_;
    StreamTransport& transport_;
    SenderState state_;
    TransferStats stats_;
    EntryCompletedCallback entry_callback_;
};

//=============================================================================
// Receiver
//=============================================================================

enum class ReceiverState {
    Idle,
    AwaitingFrame,
    MaterializingDirectory,
    MaterializingFile,
    Done
};

const char* receiver_state_to_string(ReceiverState state);

/**
 * @brief Reads frames and recreates the tree under a root
 *
 * Directories are created idempotently. Files are truncated and rewritten.
 * A file whose payload is cut short is left on disk as received.
 */
class DirectoryReceiver {
public:
    /**
     * @throws WalkError if root is not a directory
     */
    DirectoryReceiver(const std::string& root, StreamTransport& transport);

    /**
     * @brief Receive until the sentinel frame
     * @throws DecodeError, TransportError, IoError, TruncatedTransferError
     */
    TransferStats run();

    void set_entry_callback(EntryCompletedCallback callback) { entry_callback_ = std::move(callback); }

    ReceiverState state() const { return state_; }
    const TransferStats& stats() const { return stats_; }

    /**
     * @brief Local path an entry is materialized at
     */
    std::string local_path(const Entry& entry) const;

private:
    void materialize_directory(const Entry& entry);
    void materialize_file(const Entry& entry);
    void ensure_directory(const std::string& path);
    void refuse_symlinks(const Entry& entry) const;
    void entry_completed(const Entry& entry);

    std::string root_;
    StreamTransport& transport_;
    ReceiverState state_;
    TransferStats stats_;
    EntryCompletedCallback entry_callback_;
};

//=============================================================================
// Engine
//=============================================================================

/**
 * @brief Runs the side of the transfer a session's direction selects
 *
 * The channel is closed when the transfer ends, successfully or not.
 */
class TransferEngine {
public:
    explicit TransferEngine(Session& session);

    /**
     * @brief Run the transfer to completion
     * @throws TransferError subclasses, all fatal to the session
     */
    TransferStats run();

    void set_entry_callback(EntryCompletedCallback callback) { entry_callback_ = std::move(callback); }

    const TransferStats& stats() const { return stats_; }

private:
    TransferStats run_sender(StreamTransport& transport);
    TransferStats run_receiver(StreamTransport& transport);

    Session& session_;
    TransferStats stats_;
    EntryCompletedCallback entry_callback_;
};

} // namespace dirpost
