// ============================================================
// peer_registry.cpp
// ============================================================

#include "peer_registry.hpp"
#include "../common/logger.hpp"

u64 PeerRegistry::add(std::shared_ptr<Stream> stream, const std::string& addr) {
    u64 id = next_id_.fetch_add(1);
    std::lock_guard<std::mutex> lk(mutex_);
    peers_[id] = Entry{std::move(stream), addr};
    LOG_DEBUG("Peer " + std::to_string(id) + " registered: " + addr);
    return id;
}

bool PeerRegistry::remove(u64 id) {
    std::lock_guard<std::mutex> lk(mutex_);
    return peers_.erase(id) > 0;
}

std::shared_ptr<Stream> PeerRegistry::get(u64 id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = peers_.find(id);
    return it != peers_.end() ? it->second.stream : nullptr;
}

std::vector<PeerInfo> PeerRegistry::list() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<PeerInfo> out;
    out.reserve(peers_.size());
    for (const auto& kv : peers_) {
        out.push_back(PeerInfo{kv.first, kv.second.addr});
    }
    return out;
}

void PeerRegistry::close_all() {
    std::vector<std::shared_ptr<Stream>> streams;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& kv : peers_) streams.push_back(kv.second.stream);
    }
    // Close outside the lock; close() may block briefly in shutdown()
    for (auto& s : streams) {
        if (s) s->close();
    }
}

size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return peers_.size();
}
