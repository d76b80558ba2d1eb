#include "node/peer_registry.h"

bool PeerRegistry::touch(const std::string& nodeId, double seenAt,
                         const std::vector<std::string>& neighbors) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = peers_.find(nodeId);
    bool fresh = it == peers_.end();
    if (fresh)
        it = peers_.emplace(nodeId, PeerInfo{nodeId, seenAt, {}, 0}).first;
    it->second.lastSeen = seenAt;
    it->second.neighbors = neighbors;
    ++it->second.beacons;
    return fresh;
}

bool PeerRegistry::markDead(const std::string& nodeId) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (dead_.count(nodeId))
        return false;
    PeerInfo last{nodeId, 0.0, {}, 0};
    auto it = peers_.find(nodeId);
    if (it != peers_.end()) {
        last = std::move(it->second);
        peers_.erase(it);
    }
    dead_.emplace(nodeId, std::move(last));
    return true;
}

bool PeerRegistry::recover(const std::string& nodeId) {
    std::lock_guard<std::mutex> lock(mtx_);
    return dead_.erase(nodeId) > 0;
}

bool PeerRegistry::isDead(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dead_.count(nodeId) > 0;
}

bool PeerRegistry::isActive(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return peers_.count(nodeId) > 0;
}

std::optional<PeerInfo> PeerRegistry::find(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = peers_.find(nodeId);
    if (it == peers_.end())
        return std::nullopt;
    return it->second;
}

std::vector<PeerInfo> PeerRegistry::activePeers() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<PeerInfo> out;
    out.reserve(peers_.size());
    for (const auto& kv : peers_)
        out.push_back(kv.second);
    return out;
}

std::vector<std::string> PeerRegistry::activeIds() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    out.reserve(peers_.size());
    for (const auto& kv : peers_)
        out.push_back(kv.first);
    return out;
}

std::vector<PeerInfo> PeerRegistry::deadPeerInfo() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<PeerInfo> out;
    out.reserve(dead_.size());
    for (const auto& kv : dead_)
        out.push_back(kv.second);
    return out;
}

std::size_t PeerRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return peers_.size();
}

std::size_t PeerRegistry::deadCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dead_.size();
}
