// ============================================================
// history.cpp
// ============================================================

#include "history.hpp"
#include "utils.hpp"
#include <iomanip>
#include <sstream>

std::string HistoryRecord::status_text() const {
    switch (status) {
        case TransferStatus::COMPLETE:
            return "Complete";
        case TransferStatus::INCOMPLETE: {
            std::string s = "Incomplete (" + std::to_string(received) + "/" +
                            std::to_string(total) + " bytes)";
            if (!reason.empty()) s += ": " + reason;
            return s;
        }
        case TransferStatus::FAILED:
            return "Failed: " + reason;
    }
    return "Unknown";
}

HistoryRecord HistoryRecord::complete(const std::string& file_name, const std::string& peer,
                                      u64 size, const std::string& local_path) {
    HistoryRecord r;
    r.timestamp  = utils::timestamp();
    r.file_name  = file_name;
    r.peer       = peer;
    r.byte_count = size;
    r.status     = TransferStatus::COMPLETE;
    r.received   = size;
    r.total      = size;
    r.local_path = local_path;
    return r;
}

HistoryRecord HistoryRecord::incomplete(const std::string& file_name, const std::string& peer,
                                        u64 received, u64 total, const std::string& reason,
                                        const std::string& local_path) {
    HistoryRecord r;
    r.timestamp  = utils::timestamp();
    r.file_name  = file_name;
    r.peer       = peer;
    r.byte_count = received;
    r.status     = TransferStatus::INCOMPLETE;
    r.received   = received;
    r.total      = total;
    r.reason     = reason;
    r.local_path = local_path;
    return r;
}

HistoryRecord HistoryRecord::failed(const std::string& file_name, const std::string& peer,
                                    u64 size, const std::string& reason,
                                    const std::string& local_path) {
    HistoryRecord r;
    r.timestamp  = utils::timestamp();
    r.file_name  = file_name;
    r.peer       = peer;
    r.byte_count = size;
    r.status     = TransferStatus::FAILED;
    r.reason     = reason;
    r.local_path = local_path;
    return r;
}

void HistoryLedger::record(HistoryRecord rec) {
    Listener listener;
    HistoryRecord copy;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        records_.push_back(std::move(rec));
        if (listener_) {
            listener = listener_;
            copy     = records_.back();
        }
    }
    if (listener) listener(copy);
}

void HistoryLedger::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    records_.clear();
}

std::vector<HistoryRecord> HistoryLedger::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return records_;
}

size_t HistoryLedger::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return records_.size();
}

void HistoryLedger::set_listener(Listener fn) {
    std::lock_guard<std::mutex> lk(mutex_);
    listener_ = std::move(fn);
}

std::string HistoryLedger::render_table() const {
    auto rows = snapshot();
    std::ostringstream ss;
    ss << std::left
       << std::setw(20) << "Timestamp" << "  "
       << std::setw(24) << "File" << "  "
       << std::setw(10) << "Size" << "  "
       << std::setw(22) << "Peer" << "  "
       << "Status\n";
    for (const auto& r : rows) {
        ss << std::setw(20) << r.timestamp << "  "
           << std::setw(24) << r.file_name << "  "
           << std::setw(10) << utils::format_bytes(r.byte_count) << "  "
           << std::setw(22) << r.peer << "  "
           << r.status_text() << "\n";
    }
    return ss.str();
}
