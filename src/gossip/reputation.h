#ifndef REPUTATION_H
#define REPUTATION_H

#include "constants.h"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class Violation {
    RATE_LIMIT_EXCEEDED,
    REPLAY_ATTACK,
    STALE_EPOCH,
    INVALID_SIGNATURE
};

std::string violationToString(Violation v);

struct ReputationEntry {
    std::string nodeId;
    double score{REPUTATION_INITIAL};
    uint64_t violations{0};
    std::string lastViolation;
    std::optional<double> quarantineUntil;
};

// Per-node reputation in [0,1] plus the quarantine it triggers. Scores start
// at 1.0, shrink x0.9 per violation and grow x1.05 (capped) per accepted
// message; dropping below 0.3 quarantines the node for quarantineSeconds.
// Not synchronized; SignedGossip guards it.
class ReputationTable {
public:
    explicit ReputationTable(double quarantineSeconds = DEFAULT_QUARANTINE_SECONDS);

    double score(const std::string& nodeId) const;

    // Returns true when this violation put the node into quarantine.
    bool penalize(const std::string& nodeId, Violation v, double now);
    void reward(const std::string& nodeId);

    // Lazily drops quarantine entries whose deadline has passed.
    bool isQuarantined(const std::string& nodeId, double now);
    std::vector<std::string> quarantinedNodes(double now);

    std::optional<ReputationEntry> entry(const std::string& nodeId) const;
    double quarantineSeconds() const { return quarantineSeconds_; }

private:
    double quarantineSeconds_;
    std::unordered_map<std::string, ReputationEntry> entries_;
};

#endif // REPUTATION_H
