#ifndef PEER_REGISTRY_H
#define PEER_REGISTRY_H

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct PeerInfo {
    std::string nodeId;
    double lastSeen{0.0};
    std::vector<std::string> neighbors;
    uint64_t beacons{0};
};

// Active peers keyed by node id, plus the set of peers this node currently
// believes dead. A dead peer is removed from the active map and comes back
// only through recover().
class PeerRegistry {
public:
    // Registers the peer or refreshes its last_seen and neighbour list.
    // Returns true when the peer was not registered before.
    bool touch(const std::string& nodeId, double seenAt,
               const std::vector<std::string>& neighbors);

    // Moves the peer from the active map to the dead set. Returns false if it
    // was already dead.
    bool markDead(const std::string& nodeId);
    // Clears the dead flag. Returns true if the peer had been dead.
    bool recover(const std::string& nodeId);

    bool isDead(const std::string& nodeId) const;
    bool isActive(const std::string& nodeId) const;
    std::optional<PeerInfo> find(const std::string& nodeId) const;

    std::vector<PeerInfo> activePeers() const;
    std::vector<std::string> activeIds() const;
    // Last known state of each dead peer, as it was when it was marked dead.
    std::vector<PeerInfo> deadPeerInfo() const;
    std::size_t activeCount() const;
    std::size_t deadCount() const;

private:
    mutable std::mutex mtx_;
    std::map<std::string, PeerInfo> peers_;
    std::map<std::string, PeerInfo> dead_;
};

#endif // PEER_REGISTRY_H
