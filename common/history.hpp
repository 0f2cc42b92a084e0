#pragma once

// ============================================================
// history.hpp -- In-memory, append-only transfer ledger
// ============================================================

#include "platform.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

enum class TransferStatus {
    COMPLETE,
    INCOMPLETE,
    FAILED,
};

// Final outcome of one top-level transfer call (never one per retry)
struct HistoryRecord {
    std::string    timestamp;    // "YYYY-mm-dd HH:MM:SS"
    std::string    file_name;    // logical name from the header
    std::string    peer;         // "ip:port"
    u64            byte_count{0};
    TransferStatus status{TransferStatus::FAILED};
    u64            received{0};  // INCOMPLETE: bytes that made it
    u64            total{0};     // INCOMPLETE: declared size
    std::string    reason;       // error text for INCOMPLETE / FAILED
    std::string    local_path;   // saved path (receiver) or source path (sender)

    // "Complete", "Incomplete (r/t bytes)[: reason]" or "Failed: reason"
    std::string status_text() const;

    static HistoryRecord complete(const std::string& file_name, const std::string& peer,
                                  u64 size, const std::string& local_path);
    static HistoryRecord incomplete(const std::string& file_name, const std::string& peer,
                                    u64 received, u64 total, const std::string& reason,
                                    const std::string& local_path);
    static HistoryRecord failed(const std::string& file_name, const std::string& peer,
                                u64 size, const std::string& reason,
                                const std::string& local_path);
};

class HistoryLedger {
public:
    using Listener = std::function<void(const HistoryRecord&)>;

    // Pure append; no dedup, no size cap. The listener (if any) runs on
    // the calling thread after the record is stored.
    void record(HistoryRecord rec);

    void clear();

    // Ordered copy for rendering
    std::vector<HistoryRecord> snapshot() const;

    size_t size() const;

    void set_listener(Listener fn);

    // Fixed-width table of all records, oldest first
    std::string render_table() const;

private:
    mutable std::mutex         mutex_;
    std::vector<HistoryRecord> records_;
    Listener                   listener_;
};
