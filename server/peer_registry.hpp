#pragma once

// ============================================================
// peer_registry.hpp -- Active peer connections on the server
//
// The accept loop adds entries; each peer's transfer thread removes
// its own entry when done. stop() closes every stream still listed.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct PeerInfo {
    u64         id{0};
    std::string addr;
};

class PeerRegistry {
public:
    PeerRegistry() = default;
    ~PeerRegistry() = default;

    // Register a connection; returns its id (never 0)
    u64 add(std::shared_ptr<Stream> stream, const std::string& addr);

    // Returns false if the id is unknown (already removed)
    bool remove(u64 id);

    // nullptr if the id is unknown
    std::shared_ptr<Stream> get(u64 id) const;

    // Ordered by id, i.e. by accept order
    std::vector<PeerInfo> list() const;

    // Close every registered stream. Entries stay until their owners
    // remove them.
    void close_all();

    size_t size() const;

    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

private:
    struct Entry {
        std::shared_ptr<Stream> stream;
        std::string             addr;
    };

    mutable std::mutex    mutex_;
    std::map<u64, Entry>  peers_;
    std::atomic<u64>      next_id_{1};
};
