#ifndef REPLAY_GUARD_H
#define REPLAY_GUARD_H

#include "constants.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

// sender -> epoch -> nonces already accepted. A (sender, epoch, nonce) triple
// is admitted at most once. Each sender epoch keeps a bounded window of nonces;
// anything at or below the window floor counts as seen. Likewise only the
// newest epochs of a sender are kept and older ones count as seen.
class ReplayGuard {
public:
    explicit ReplayGuard(std::size_t maxNoncesPerEpoch = REPLAY_WINDOW_NONCES,
                         std::size_t maxEpochsPerSender = REPLAY_WINDOW_EPOCHS);

    bool hasSeen(const std::string& sender, uint64_t epoch, uint64_t nonce) const;
    void record(const std::string& sender, uint64_t epoch, uint64_t nonce);
    // Drops every epoch below minEpoch. Callers pass the oldest epoch the
    // stale-epoch rule still admits.
    void pruneBelow(uint64_t minEpoch);
    std::size_t size() const;

private:
    struct EpochWindow {
        std::set<uint64_t> nonces;
        std::optional<uint64_t> floor;
    };
    struct SenderWindow {
        std::map<uint64_t, EpochWindow> epochs;
        std::optional<uint64_t> epochFloor;
    };

    const std::size_t maxNonces_;
    const std::size_t maxEpochs_;
    std::unordered_map<std::string, SenderWindow> seen_;
};

#endif // REPLAY_GUARD_H
