#include "self_healing/health_monitor.h"
#include "byzantine/mesh_byzantine_protection.h"
#include "logging.h"
#include "node/peer_registry.h"
#include "routing/stigmergy_router.h"

#include <exception>
#include <limits>
#include <sstream>

HealthMonitor::HealthMonitor(PeerRegistry& peers, MeshByzantineProtection& protection,
                             StigmergyRouter& router, double peerTimeout,
                             const Clock& clock)
    : peers_(peers), protection_(protection), router_(router),
      peerTimeout_(peerTimeout), clock_(clock) {}

NodeHealthStatus HealthMonitor::checkHealth() {
    NodeHealthStatus status;
    status.reason = "All peers responsive";
    try {
        runPass(status);
    } catch (const std::exception& e) {
        LOG_E("[health]") << "❌ health check failed: " << e.what();
        status.isHealthy = false;
        status.reason = std::string("Health check error: ") + e.what();
    }
    return status;
}

void HealthMonitor::runPass(NodeHealthStatus& status) {
    const double now = clock_.now();

    std::vector<CriticalEvent> retry;
    retry.swap(retry_);
    for (const auto& event : retry)
        notifyFailure(event, status);

    for (const auto& peer : peers_.activePeers()) {
        if (protection_.isNodeQuarantined(peer.nodeId)) {
            ++status.skippedQuarantined;
            continue;
        }
        ++status.checkedPeers;

        const double elapsed = now - peer.lastSeen;
        if (elapsed <= peerTimeout_)
            continue;
        if (peers_.isDead(peer.nodeId) || protection_.isValidatedFailure(peer.nodeId))
            continue;

        peers_.markDead(peer.nodeId);
        std::size_t dropped = router_.dropNextHop(peer.nodeId);
        LOG_W("[health]") << "💀 peer " << peer.nodeId << " silent for " << elapsed
                          << "s, marked dead (" << dropped << " route(s) dropped)";

        Evidence evidence{
            LatencyEvidence{std::numeric_limits<double>::infinity()},
            PacketLossEvidence{1.0},
            SilenceEvidence{peer.lastSeen, elapsed},
        };
        CriticalEvent event = protection_.reportNodeFailure(peer.nodeId, std::move(evidence));
        status.newlyDead.push_back(peer.nodeId);

        notifyFailure(event, status);
    }

    status.evictedEvents = protection_.evictExpiredEvents();
    status.deadPeers = peers_.deadCount();

    if (!status.newlyDead.empty()) {
        status.isHealthy = false;
        status.reason = "Peer(s) timed out";
    } else if (status.deadPeers > 0) {
        status.reason = "Waiting on dead peer(s)";
    }
    if (!status.callbackErrors.empty()) {
        status.isHealthy = false;
        status.reason = "Failure broadcast pending for " +
                        std::to_string(status.callbackErrors.size()) + " peer(s)";
    }
}

void HealthMonitor::notifyFailure(const CriticalEvent& event, NodeHealthStatus& status) {
    if (!onFailure_)
        return;
    try {
        onFailure_(event);
    } catch (const std::exception& e) {
        LOG_E("[health]") << "❌ failure callback for " << event.target << " failed: "
                          << e.what() << ", retrying next pass";
        status.callbackErrors.push_back(event.target);
        retry_.push_back(event);
    }
}

void HealthMonitor::logStatus(const NodeHealthStatus& status) const {
    std::ostringstream log;
    log << "🩺 " << (status.isHealthy ? "✅ Healthy" : "⚠️ Unhealthy")
        << " - Reason: " << status.reason
        << " | checked=" << status.checkedPeers
        << " quarantined=" << status.skippedQuarantined
        << " dead=" << status.deadPeers;
    if (!status.newlyDead.empty()) {
        log << " newly_dead=[";
        for (std::size_t i = 0; i < status.newlyDead.size(); ++i)
            log << (i ? "," : "") << status.newlyDead[i];
        log << "]";
    }
    if (status.evictedEvents > 0)
        log << " evicted_events=" << status.evictedEvents;

    if (status.isHealthy)
        LOG_D("[health]") << log.str();
    else
        LOG_I("[health]") << log.str();
}
