#include "gossip/replay_guard.h"

#include <algorithm>

ReplayGuard::ReplayGuard(std::size_t maxNoncesPerEpoch, std::size_t maxEpochsPerSender)
    : maxNonces_(std::max<std::size_t>(1, maxNoncesPerEpoch)),
      maxEpochs_(std::max<std::size_t>(1, maxEpochsPerSender)) {}

bool ReplayGuard::hasSeen(const std::string& sender, uint64_t epoch, uint64_t nonce) const {
    auto s = seen_.find(sender);
    if (s == seen_.end())
        return false;
    if (s->second.epochFloor && epoch <= *s->second.epochFloor)
        return true;
    auto e = s->second.epochs.find(epoch);
    if (e == s->second.epochs.end())
        return false;
    if (e->second.floor && nonce <= *e->second.floor)
        return true;
    return e->second.nonces.count(nonce) > 0;
}

void ReplayGuard::record(const std::string& sender, uint64_t epoch, uint64_t nonce) {
    SenderWindow& sw = seen_[sender];
    EpochWindow& ew = sw.epochs[epoch];
    ew.nonces.insert(nonce);
    while (ew.nonces.size() > maxNonces_) {
        auto oldest = ew.nonces.begin();
        ew.floor = std::max(ew.floor.value_or(0), *oldest);
        ew.nonces.erase(oldest);
    }
    while (sw.epochs.size() > maxEpochs_) {
        auto oldest = sw.epochs.begin();
        sw.epochFloor = std::max(sw.epochFloor.value_or(0), oldest->first);
        sw.epochs.erase(oldest);
    }
}

void ReplayGuard::pruneBelow(uint64_t minEpoch) {
    for (auto it = seen_.begin(); it != seen_.end();) {
        auto& epochs = it->second.epochs;
        epochs.erase(epochs.begin(), epochs.lower_bound(minEpoch));
        if (epochs.empty())
            it = seen_.erase(it);
        else
            ++it;
    }
}

std::size_t ReplayGuard::size() const {
    std::size_t total = 0;
    for (const auto& s : seen_)
        for (const auto& e : s.second.epochs)
            total += e.second.nonces.size();
    return total;
}
