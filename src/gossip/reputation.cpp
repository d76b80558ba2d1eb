#include "gossip/reputation.h"
#include "logging.h"
#include <algorithm>

std::string violationToString(Violation v) {
    switch (v) {
    case Violation::RATE_LIMIT_EXCEEDED:
        return "rate_limit_exceeded";
    case Violation::REPLAY_ATTACK:
        return "replay_attack";
    case Violation::STALE_EPOCH:
        return "stale_epoch";
    case Violation::INVALID_SIGNATURE:
        return "invalid_signature";
    }
    return "unknown";
}

ReputationTable::ReputationTable(double quarantineSeconds)
    : quarantineSeconds_(quarantineSeconds) {}

double ReputationTable::score(const std::string& nodeId) const {
    auto it = entries_.find(nodeId);
    return it == entries_.end() ? REPUTATION_INITIAL : it->second.score;
}

bool ReputationTable::penalize(const std::string& nodeId, Violation v, double now) {
    auto& e = entries_[nodeId];
    e.nodeId = nodeId;
    e.score = std::max(0.0, e.score * REPUTATION_PENALTY_FACTOR);
    e.violations++;
    e.lastViolation = violationToString(v);

    LOG_D("[reputation]") << nodeId << " " << e.lastViolation << " -> score "
                          << e.score;

    if (e.score < REPUTATION_QUARANTINE_THRESHOLD) {
        e.quarantineUntil = now + quarantineSeconds_;
        LOG_W("[reputation]") << "🚫 " << nodeId << " quarantined for "
                              << quarantineSeconds_ << "s (score " << e.score
                              << ", last violation " << e.lastViolation << ")";
        return true;
    }
    return false;
}

void ReputationTable::reward(const std::string& nodeId) {
    auto it = entries_.find(nodeId);
    if (it == entries_.end())
        return; // already at the 1.0 cap
    it->second.score = std::min(1.0, it->second.score * REPUTATION_REWARD_FACTOR);
}

bool ReputationTable::isQuarantined(const std::string& nodeId, double now) {
    auto it = entries_.find(nodeId);
    if (it == entries_.end() || !it->second.quarantineUntil)
        return false;
    if (now >= *it->second.quarantineUntil) {
        it->second.quarantineUntil.reset();
        LOG_I("[reputation]") << "quarantine lapsed for " << nodeId;
        return false;
    }
    return true;
}

std::vector<std::string> ReputationTable::quarantinedNodes(double now) {
    std::vector<std::string> out;
    for (auto& kv : entries_) {
        if (isQuarantined(kv.first, now))
            out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<ReputationEntry> ReputationTable::entry(const std::string& nodeId) const {
    auto it = entries_.find(nodeId);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}
