#pragma once
#include "constants.h"
#include <optional>
#include <string>
#include <vector>

struct PeerEndpoint {
    std::string host;
    unsigned short port = 0;
};

struct MeshConfig {
    std::string node_id = "node-01";
    unsigned short listen_port = DEFAULT_LISTEN_PORT;
    std::vector<PeerEndpoint> peers;            // peer=host:port, repeatable

    // --- Quorum ---
    int total_nodes = DEFAULT_TOTAL_NODES;
    double quorum_threshold = DEFAULT_QUORUM_THRESHOLD;
    double pending_event_ttl = 0.0;             // seconds; 0 keeps pending events forever

    // --- Liveness ---
    double peer_timeout = DEFAULT_PEER_TIMEOUT;
    double health_check_interval = DEFAULT_HEALTH_CHECK_INTERVAL;
    double beacon_interval = DEFAULT_BEACON_INTERVAL;
    bool require_signed_beacons = true;

    // --- Gossip ---
    std::size_t rate_limit_per_second = DEFAULT_RATE_LIMIT_PER_SECOND;
    double quarantine_seconds = DEFAULT_QUARANTINE_SECONDS;
    double key_rotation_interval = 0.0;         // seconds; 0 disables rotation

    // --- Stigmergy ---
    double pheromone_decay_rate = DEFAULT_PHEROMONE_DECAY_RATE;
    double pheromone_boost = DEFAULT_PHEROMONE_BOOST;
    double pheromone_min = DEFAULT_PHEROMONE_MIN;
    double decay_interval = DEFAULT_DECAY_INTERVAL;
    std::string acl_policy_file;                // JSON, empty = open mode

    double metrics_interval = 30.0;             // seconds; 0 disables the metrics log
    std::string log_level = "info";
};

MeshConfig& getMeshConfig();
// Returns false if the file could not be opened. Malformed values are
// skipped with a warning and the previous value stays.
bool loadConfigFile(const std::string &path, MeshConfig &cfg = getMeshConfig());
void applyEnvOverrides(MeshConfig &cfg = getMeshConfig());
std::optional<PeerEndpoint> parsePeerEndpoint(const std::string &text);
