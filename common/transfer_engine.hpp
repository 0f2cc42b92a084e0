#pragma once

// ============================================================
// transfer_engine.hpp -- Byte-level send / receive loops
//
// The engine never retries. Every failure propagates as a
// TransferError subclass; RetryController decides what happens next.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "progress.hpp"
#include "hash.hpp"
#include <chrono>
#include <string>

class Stream;
namespace file_io { class FileReader; }

// One attempt's view of a transfer
struct TransferSession {
    std::string    peer;
    TransferHeader header;
    u64            bytes_done{0};
    std::string    path;        // destination (receiver) or source (sender)
    int            attempt{0};
};

// What a receiver has already written, carried across the attempts of
// one top-level transfer call.
struct ResumeState {
    bool                 have_header{false};
    TransferHeader       header;
    std::string          dest_path;
    u64                  accumulated{0};  // payload bytes on disk
    hash::StreamHasher64 prefix;          // xxh3 of those bytes

    // Forget the written prefix; the next attempt starts at byte 0
    void restart() {
        accumulated = 0;
        prefix.reset();
    }
};

struct SendResult {
    u64  bytes_sent{0};
    bool complete{false};   // false when the source ran short of header.size
};

class TransferEngine {
public:
    explicit TransferEngine(size_t chunk_size = CHUNK_SIZE,
                            std::chrono::milliseconds progress_interval =
                                std::chrono::milliseconds(PROGRESS_INTERVAL_MS));

    // Write the header line, then the source in chunk_size blocks.
    // on_progress runs after every chunk. Throws TransportError.
    SendResult send(Stream& stream,
                    const TransferHeader& header,
                    file_io::FileReader& source,
                    const ProgressFn& on_progress) const;

    // Receive one file into 'destination' from scratch (truncating).
    u64 receive(Stream& stream,
                const std::string& destination,
                const ProgressFn& on_progress) const;

    // One receive attempt. When resume.accumulated > 0 and the stream
    // announces the same file, the first accumulated payload bytes are
    // verified against resume.prefix instead of being rewritten, and new
    // bytes are appended. Returns the declared size on success.
    // Throws HeaderError, PrematureCloseError, TransportError,
    // ResumeMismatchError.
    u64 receive(Stream& stream,
                const std::string& destination,
                ResumeState& resume,
                TransferSession& session,
                const ProgressFn& on_progress) const;

    size_t chunk_size() const { return chunk_size_; }

private:
    size_t                    chunk_size_;
    std::chrono::milliseconds progress_interval_;
};
