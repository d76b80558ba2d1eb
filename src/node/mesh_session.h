#ifndef MESH_SESSION_H
#define MESH_SESSION_H

#include "byzantine/mesh_byzantine_protection.h"
#include "config.h"
#include "node/peer_registry.h"
#include "routing/stigmergy_router.h"
#include "self_healing/health_monitor.h"

#include <atomic>
#include <boost/asio.hpp>
#include <functional>
#include <json/json.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct SessionOptions {
    std::string nodeId;
    int totalNodes{DEFAULT_TOTAL_NODES};
    double quorumThreshold{DEFAULT_QUORUM_THRESHOLD};
    double pendingEventTtl{0.0};
    double peerTimeout{DEFAULT_PEER_TIMEOUT};
    double healthCheckInterval{DEFAULT_HEALTH_CHECK_INTERVAL};
    double beaconInterval{DEFAULT_BEACON_INTERVAL};
    double decayInterval{DEFAULT_DECAY_INTERVAL};
    double keyRotationInterval{0.0};
    double metricsInterval{0.0};
    bool requireSignedBeacons{true};
    GossipLimits limits;
    PheromoneParams pheromone;

    static SessionOptions fromConfig(const MeshConfig& cfg);
};

struct BeaconResult {
    bool accepted{false};
    std::string reason;
};

struct ReportResult {
    bool accepted{false};
    bool validated{false};
    std::string reason;
};

struct RouteDecision {
    enum class Status { DELIVERED, ROUTED, DIRECT, UNREACHABLE };

    Status status{Status::UNREACHABLE};
    std::optional<std::string> nextHop;
    std::vector<std::string> alternates;
    std::string error;

    Json::Value toJson() const;
};

std::string routeStatusToString(RouteDecision::Status status);

struct PeerStatus {
    std::string nodeId;
    double lastSeen{0.0};
    double elapsed{0.0};
    bool alive{false};
    std::vector<std::string> neighbors;
    double reputation{REPUTATION_INITIAL};
    bool quarantined{false};
    bool validatedFailure{false};

    Json::Value toJson() const;
};

struct SessionStatus {
    std::string nodeId;
    std::size_t peers{0};
    std::size_t deadPeers{0};
    std::size_t validatedFailures{0};
    uint64_t beaconsReceived{0};
    std::size_t routes{0};
    ProtectionStats protection;
    std::vector<CriticalEvent> pendingEvents;

    Json::Value toJson() const;
};

// One mesh node: owns the peer registry, Byzantine protection, the
// pheromone router and the health monitor, and drives their periodic
// loops on a single io_context thread.
class MeshSession {
public:
    using OutboundSink = std::function<void(const SignedEnvelope&)>;

    // Throws if the signer cannot produce a keypair.
    MeshSession(SessionOptions options, Signer& signer,
                const Clock& clock = SystemClock::instance());
    ~MeshSession();

    MeshSession(const MeshSession&) = delete;
    MeshSession& operator=(const MeshSession&) = delete;

    // Where signed envelopes (beacons, failure attestations) are sent.
    void setOutboundSink(OutboundSink sink) { outbound_ = std::move(sink); }
    void applyAclPolicy(const AclPolicySet& policy);

    // Inbound
    void dispatch(const SignedEnvelope& envelope);
    BeaconResult receiveBeacon(const SignedEnvelope& envelope);
    ReportResult receiveFailureReport(const SignedEnvelope& envelope);
    ReportResult receiveLinkDownReport(const SignedEnvelope& envelope);

    // Local link observation; signs, self-validates and broadcasts.
    CriticalEvent reportLinkDown(const std::string& to, Evidence evidence = {});

    RouteDecision routeMessage(const std::string& destination);

    // Loop bodies, also callable directly.
    NodeHealthStatus runHealthCheck();
    std::size_t runEvaporation();
    SignedEnvelope broadcastBeacon();
    void rotateKeys();
    void updateMetrics();

    // Arms the periodic loops. Only the first call has any effect.
    void start(boost::asio::io_context& io);
    // Cancels every loop timer; a tick already running finishes first.
    void stop();
    bool running() const { return running_.load(); }

    SessionStatus status();
    std::vector<PeerStatus> peers();

    const std::string& nodeId() const { return options_.nodeId; }
    const SessionOptions& options() const { return options_; }
    PeerRegistry& registry() { return registry_; }
    MeshByzantineProtection& protection() { return protection_; }
    StigmergyRouter& router() { return router_; }
    HealthMonitor& healthMonitor() { return health_; }
    uint64_t beaconsReceived() const { return beaconsReceived_.load(); }

private:
    struct Loop {
        std::string name;
        double interval;
        std::function<void()> tick;
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    void attestLocalFailure(const CriticalEvent& event);
    void onValidatedFailure(const std::string& node);
    void send(const SignedEnvelope& envelope);
    void addLoop(boost::asio::io_context& io, const std::string& name, double interval,
                 std::function<void()> tick);
    void schedule(Loop& loop);

    const SessionOptions options_;
    const Clock& clock_;

    PeerRegistry registry_;
    MeshByzantineProtection protection_;
    StigmergyRouter router_;
    HealthMonitor health_;

    OutboundSink outbound_;
    std::atomic<uint64_t> beaconsReceived_{0};
    std::atomic<bool> running_{false};
    bool started_{false};
    std::vector<std::unique_ptr<Loop>> loops_;
};

#endif // MESH_SESSION_H
