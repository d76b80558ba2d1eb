#include "consensus/quorum_validator.h"
#include "logging.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

QuorumValidator::QuorumValidator(int totalNodes, double quorumThreshold,
                                 const Clock& clock, double pendingTtlSeconds)
    : totalNodes_(totalNodes),
      quorumThreshold_(quorumThreshold),
      quorumSize_(computeQuorumSize(totalNodes, quorumThreshold)),
      clock_(clock),
      pendingTtl_(pendingTtlSeconds) {
    LOG_I("[quorum]") << "quorum " << quorumSize_ << "/" << totalNodes_
                      << " (threshold " << quorumThreshold_ << ")";
}

std::size_t QuorumValidator::computeQuorumSize(int totalNodes, double quorumThreshold) {
    if (totalNodes <= 0)
        throw std::invalid_argument("total_nodes must be positive");
    if (!(quorumThreshold > 0.0 && quorumThreshold <= 1.0))
        throw std::invalid_argument("quorum_threshold must be in (0, 1]");

    // 10 * 0.67 is 6.7000000000000002 in binary; shave float noise before ceil
    // so exact products such as 100 * 0.67 do not round up a whole vote.
    double raw = static_cast<double>(totalNodes) * quorumThreshold;
    auto size = static_cast<std::size_t>(std::ceil(raw - 1e-9));
    return std::clamp<std::size_t>(size, 1, static_cast<std::size_t>(totalNodes));
}

CriticalEvent QuorumValidator::report(EventType type, const std::string& target,
                                      Evidence evidence) {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::string k = eventKey(type, target);
    auto it = events_.find(k);
    if (it != events_.end())
        return it->second;

    CriticalEvent ev;
    ev.eventType = type;
    ev.target = target;
    ev.evidence = std::move(evidence);
    ev.timestamp = clock_.now();
    events_.emplace(k, ev);

    LOG_I("[quorum]") << "📢 " << ev.key() << " reported, awaiting " << quorumSize_
                      << " signatures";
    return ev;
}

bool QuorumValidator::validate(const CriticalEvent& event, const std::string& validatorId,
                               const Bytes& signature) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = events_.find(event.key());
    if (it == events_.end()) {
        // Adopt an event first seen through a peer's report; its signature set
        // is rebuilt from our own observations only.
        CriticalEvent adopted;
        adopted.eventType = event.eventType;
        adopted.target = event.target;
        adopted.evidence = event.evidence;
        adopted.timestamp = clock_.now();
        it = events_.emplace(adopted.key(), std::move(adopted)).first;
    }

    CriticalEvent& ev = it->second;
    if (validatorId.empty() || signature.empty()) {
        LOG_D("[quorum]") << "ignoring unsigned validation for " << ev.key();
        return ev.validated;
    }

    ev.signatures.emplace(validatorId, signature);
    if (!ev.validated && ev.signatures.size() >= quorumSize_) {
        ev.validated = true;
        ev.validatedAt = clock_.now();
        LOG_W("[quorum]") << "✅ " << ev.key() << " validated by quorum ("
                          << ev.signatures.size() << "/" << quorumSize_ << ")";
    } else if (!ev.validated) {
        LOG_D("[quorum]") << ev.key() << " has " << ev.signatures.size() << "/"
                          << quorumSize_ << " signatures";
    }
    return ev.validated;
}

std::optional<CriticalEvent> QuorumValidator::find(EventType type,
                                                   const std::string& target) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = events_.find(eventKey(type, target));
    if (it == events_.end())
        return std::nullopt;
    return it->second;
}

std::vector<CriticalEvent> QuorumValidator::pendingEvents() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<CriticalEvent> out;
    for (const auto& kv : events_)
        if (!kv.second.validated)
            out.push_back(kv.second);
    return out;
}

std::size_t QuorumValidator::pendingCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [](const auto& kv) { return !kv.second.validated; }));
}

std::size_t QuorumValidator::evictExpired() {
    if (pendingTtl_ <= 0.0)
        return 0;
    std::lock_guard<std::mutex> lock(mtx_);
    const double now = clock_.now();
    std::size_t removed = 0;
    for (auto it = events_.begin(); it != events_.end();) {
        if (!it->second.validated && now - it->second.timestamp >= pendingTtl_) {
            LOG_I("[quorum]") << "⌛ evicting stale pending event " << it->first
                              << " (" << it->second.signatures.size() << "/"
                              << quorumSize_ << " signatures)";
            it = events_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}
