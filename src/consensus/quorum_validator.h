#ifndef QUORUM_VALIDATOR_H
#define QUORUM_VALIDATOR_H

#include "clock.h"
#include "consensus/critical_event.h"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Collects independent validator signatures over critical events. An event
// becomes validated once it carries quorumSize() distinct signatures and
// stays validated from then on. All mutation goes through one mutex, so
// concurrent validate() calls on the same event cannot lose signatures.
class QuorumValidator {
public:
    // pendingTtlSeconds <= 0 keeps unvalidated events forever.
    QuorumValidator(int totalNodes, double quorumThreshold,
                    const Clock& clock = SystemClock::instance(),
                    double pendingTtlSeconds = 0.0);

    static std::size_t computeQuorumSize(int totalNodes, double quorumThreshold);

    // Creates the pending event for (type, target) or returns the existing one.
    CriticalEvent report(EventType type, const std::string& target, Evidence evidence);

    // Adds validatorId's signature (idempotent per validator) and returns the
    // validated flag afterwards. Empty signatures are ignored.
    bool validate(const CriticalEvent& event, const std::string& validatorId,
                  const Bytes& signature);

    std::optional<CriticalEvent> find(EventType type, const std::string& target) const;
    std::vector<CriticalEvent> pendingEvents() const;
    std::size_t pendingCount() const;

    // Drops pending events older than the TTL; returns how many were removed.
    std::size_t evictExpired();

    std::size_t quorumSize() const { return quorumSize_; }
    int totalNodes() const { return totalNodes_; }

private:
    const int totalNodes_;
    const double quorumThreshold_;
    const std::size_t quorumSize_;
    const Clock& clock_;
    const double pendingTtl_;

    mutable std::mutex mtx_;
    std::map<std::string, CriticalEvent> events_;
};

#endif // QUORUM_VALIDATOR_H
