#ifndef HEALTH_MONITOR_H
#define HEALTH_MONITOR_H

#include "clock.h"
#include "consensus/critical_event.h"

#include <functional>
#include <string>
#include <vector>

class PeerRegistry;
class MeshByzantineProtection;
class StigmergyRouter;

struct NodeHealthStatus {
    bool isHealthy{true};
    std::string reason;
    std::size_t checkedPeers{0};
    std::size_t skippedQuarantined{0};
    std::size_t deadPeers{0};
    std::vector<std::string> newlyDead;
    std::size_t evictedEvents{0};
    std::vector<std::string> callbackErrors;
};

// One health-check pass over the peer registry. A peer silent for longer
// than peerTimeout becomes locally dead: it leaves the registry, its
// next-hop routes are dropped and a NODE_FAILURE event is reported once.
// Quarantined peers are skipped entirely.
class HealthMonitor {
public:
    using FailureCallback = std::function<void(const CriticalEvent&)>;

    HealthMonitor(PeerRegistry& peers, MeshByzantineProtection& protection,
                  StigmergyRouter& router, double peerTimeout,
                  const Clock& clock = SystemClock::instance());

    // Never throws; an exception inside the pass is logged and reported as
    // an unhealthy status.
    NodeHealthStatus checkHealth();
    void logStatus(const NodeHealthStatus& status) const;

    // Invoked for every newly reported failure, after the event exists. A
    // callback that throws is retried with the same event on the next pass.
    void setFailureCallback(FailureCallback cb) { onFailure_ = std::move(cb); }
    double peerTimeout() const { return peerTimeout_; }

private:
    void runPass(NodeHealthStatus& status);
    void notifyFailure(const CriticalEvent& event, NodeHealthStatus& status);

    PeerRegistry& peers_;
    MeshByzantineProtection& protection_;
    StigmergyRouter& router_;
    const double peerTimeout_;
    const Clock& clock_;
    FailureCallback onFailure_;
    std::vector<CriticalEvent> retry_;
};

#endif // HEALTH_MONITOR_H
