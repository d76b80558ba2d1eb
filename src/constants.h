#pragma once
#include <cstddef>

// Peer liveness
constexpr double DEFAULT_PEER_TIMEOUT = 30.0;          // seconds without a beacon
constexpr double DEFAULT_HEALTH_CHECK_INTERVAL = 5.0;
constexpr double DEFAULT_BEACON_INTERVAL = 5.0;

// Quorum
constexpr int DEFAULT_TOTAL_NODES = 10;
constexpr double DEFAULT_QUORUM_THRESHOLD = 0.67;

// Stigmergy
constexpr double DEFAULT_PHEROMONE_DECAY_RATE = 0.9;
constexpr double DEFAULT_PHEROMONE_BOOST = 10.0;
constexpr double DEFAULT_PHEROMONE_MIN = 1.0;
constexpr double DEFAULT_DECAY_INTERVAL = 1.0;
constexpr double PHEROMONE_PRUNE_THRESHOLD = 0.1;
constexpr double PHEROMONE_FAILURE_FACTOR = 0.5;
constexpr std::size_t DEFAULT_REDUNDANT_PATHS = 3;

// Reputation / quarantine
constexpr double REPUTATION_INITIAL = 1.0;
constexpr double REPUTATION_PENALTY_FACTOR = 0.9;
constexpr double REPUTATION_REWARD_FACTOR = 1.05;
constexpr double REPUTATION_QUARANTINE_THRESHOLD = 0.3;
constexpr double DEFAULT_QUARANTINE_SECONDS = 300.0;

// Gossip
constexpr std::size_t DEFAULT_RATE_LIMIT_PER_SECOND = 100;
constexpr double RATE_LIMIT_WINDOW_SECONDS = 1.0;
constexpr std::size_t REPLAY_WINDOW_NONCES = 4096;     // per sender epoch
constexpr std::size_t REPLAY_WINDOW_EPOCHS = 3;        // per sender
constexpr std::size_t MAX_WIRE_PAYLOAD = 64 * 1024;   // one UDP datagram
constexpr unsigned short DEFAULT_LISTEN_PORT = 7946;
