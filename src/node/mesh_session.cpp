#include "node/mesh_session.h"
#include "logging.h"
#include "metrics/metrics.h"

#include <chrono>

SessionOptions SessionOptions::fromConfig(const MeshConfig& cfg) {
    SessionOptions o;
    o.nodeId = cfg.node_id;
    o.totalNodes = cfg.total_nodes;
    o.quorumThreshold = cfg.quorum_threshold;
    o.pendingEventTtl = cfg.pending_event_ttl;
    o.peerTimeout = cfg.peer_timeout;
    o.healthCheckInterval = cfg.health_check_interval;
    o.beaconInterval = cfg.beacon_interval;
    o.decayInterval = cfg.decay_interval;
    o.keyRotationInterval = cfg.key_rotation_interval;
    o.metricsInterval = cfg.metrics_interval;
    o.requireSignedBeacons = cfg.require_signed_beacons;
    o.limits.rateLimitPerSecond = cfg.rate_limit_per_second;
    o.limits.quarantineSeconds = cfg.quarantine_seconds;
    o.pheromone.decayRate = cfg.pheromone_decay_rate;
    o.pheromone.boost = cfg.pheromone_boost;
    o.pheromone.minScore = cfg.pheromone_min;
    return o;
}

std::string routeStatusToString(RouteDecision::Status status) {
    switch (status) {
    case RouteDecision::Status::DELIVERED:
        return "delivered";
    case RouteDecision::Status::ROUTED:
        return "routed";
    case RouteDecision::Status::DIRECT:
        return "direct";
    case RouteDecision::Status::UNREACHABLE:
        return "unreachable";
    }
    return "unknown";
}

Json::Value RouteDecision::toJson() const {
    Json::Value j;
    j["status"] = routeStatusToString(status);
    j["next_hop"] = nextHop ? Json::Value(*nextHop) : Json::Value(Json::nullValue);
    j["alternates"] = Json::Value(Json::arrayValue);
    for (const auto& a : alternates)
        j["alternates"].append(a);
    if (!error.empty())
        j["error"] = error;
    return j;
}

Json::Value PeerStatus::toJson() const {
    Json::Value j;
    j["node_id"] = nodeId;
    j["last_seen"] = lastSeen;
    j["elapsed"] = elapsed;
    j["alive"] = alive;
    j["neighbors"] = Json::Value(Json::arrayValue);
    for (const auto& n : neighbors)
        j["neighbors"].append(n);
    j["reputation"] = reputation;
    j["quarantined"] = quarantined;
    j["validated_failure"] = validatedFailure;
    return j;
}

Json::Value SessionStatus::toJson() const {
    Json::Value j;
    j["node_id"] = nodeId;
    j["peers"] = static_cast<Json::UInt64>(peers);
    j["dead_peers"] = static_cast<Json::UInt64>(deadPeers);
    j["validated_failures"] = static_cast<Json::UInt64>(validatedFailures);
    j["beacons_received"] = static_cast<Json::UInt64>(beaconsReceived);
    j["routes"] = static_cast<Json::UInt64>(routes);
    j["byzantine_protection"] = protection.toJson();
    j["pending_events"] = Json::Value(Json::arrayValue);
    for (const auto& ev : pendingEvents)
        j["pending_events"].append(ev.toJson());
    return j;
}

MeshSession::MeshSession(SessionOptions options, Signer& signer, const Clock& clock)
    : options_(std::move(options)),
      clock_(clock),
      protection_(options_.nodeId, signer, options_.totalNodes, options_.quorumThreshold,
                  clock, options_.limits, options_.pendingEventTtl),
      router_(options_.nodeId, clock, options_.pheromone),
      health_(registry_, protection_, router_, options_.peerTimeout, clock) {
    health_.setFailureCallback([this](const CriticalEvent& event) { attestLocalFailure(event); });
    LOG_I("[mesh]") << "🚀 session " << options_.nodeId << " ready (signer "
                    << signer.name() << ", peer timeout " << options_.peerTimeout << "s)";
}

MeshSession::~MeshSession() {
    stop();
}

void MeshSession::applyAclPolicy(const AclPolicySet& policy) {
    router_.updatePolicies(policy.rules, policy.peerTags);
}

void MeshSession::send(const SignedEnvelope& envelope) {
    if (outbound_)
        outbound_(envelope);
}

void MeshSession::dispatch(const SignedEnvelope& envelope) {
    switch (envelope.msgType) {
    case MessageType::BEACON: {
        auto r = receiveBeacon(envelope);
        if (!r.accepted)
            LOG_D("[mesh]") << "beacon from " << envelope.sender << " rejected: " << r.reason;
        break;
    }
    case MessageType::FAILURE_REPORT: {
        auto r = receiveFailureReport(envelope);
        if (!r.accepted)
            LOG_D("[mesh]") << "failure report from " << envelope.sender
                            << " rejected: " << r.reason;
        break;
    }
    case MessageType::LINK_DOWN_REPORT: {
        auto r = receiveLinkDownReport(envelope);
        if (!r.accepted)
            LOG_D("[mesh]") << "link report from " << envelope.sender
                            << " rejected: " << r.reason;
        break;
    }
    }
}

BeaconResult MeshSession::receiveBeacon(const SignedEnvelope& envelope) {
    const std::string& peer = envelope.sender;
    if (envelope.msgType != MessageType::BEACON)
        return {false, "Expected BEACON, got " + messageTypeToString(envelope.msgType)};
    if (peer.empty())
        return {false, "Beacon without sender"};
    if (peer == options_.nodeId)
        return {false, "Ignoring own beacon"};

    if (protection_.isNodeQuarantined(peer))
        return {false, "Node " + peer + " is quarantined"};
    if (!protection_.shouldAcceptMessage(peer))
        return {false, "Node " + peer + " has insufficient reputation"};

    if (envelope.signature.empty()) {
        if (options_.requireSignedBeacons)
            return {false, "Unsigned beacon from " + peer};
    } else {
        VerifyResult v = protection_.verifyBeacon(envelope);
        if (!v.ok)
            return {false, v.error};
    }

    ++beaconsReceived_;

    // A quorum-confirmed failure outranks any later beacon.
    if (protection_.isValidatedFailure(peer))
        return {false, "Node " + peer + " is a validated failure"};

    std::vector<std::string> neighbors;
    const Json::Value& list = envelope.payload["neighbors"];
    if (list.isArray()) {
        for (const auto& n : list)
            if (n.isString())
                neighbors.push_back(n.asString());
    }

    if (registry_.recover(peer))
        LOG_I("[mesh]") << "💚 peer " << peer << " recovered";
    if (registry_.touch(peer, clock_.now(), neighbors))
        LOG_I("[mesh]") << "🤝 new peer " << peer << " (" << neighbors.size()
                        << " neighbour(s))";

    router_.reinforce(peer, peer, true);
    for (const auto& n : neighbors) {
        if (n == options_.nodeId || n == peer)
            continue;
        router_.reinforce(n, peer, true);
    }
    return {true, "ok"};
}

ReportResult MeshSession::receiveFailureReport(const SignedEnvelope& envelope) {
    const std::string& sender = envelope.sender;
    if (envelope.msgType != MessageType::FAILURE_REPORT)
        return {false, false,
                "Expected FAILURE_REPORT, got " + messageTypeToString(envelope.msgType)};
    if (!protection_.shouldAcceptMessage(sender))
        return {false, false, "Node " + sender + " is quarantined or untrusted"};

    VerifyResult v = protection_.verifyMessage(envelope);
    if (!v.ok)
        return {false, false, v.error};

    const Json::Value& failed = envelope.payload["failed_node"];
    if (!failed.isString() || failed.asString().empty())
        return {false, false, "Missing failed_node"};
    const std::string target = failed.asString();
    if (target == options_.nodeId)
        return {false, false, "Refusing failure report about the local node"};

    CriticalEvent event =
        protection_.reportNodeFailure(target, evidenceFromJson(envelope.payload["evidence"]));
    bool validated = protection_.validateNodeFailureFrom(event, sender, envelope.signature);
    LOG_I("[mesh]") << "📨 failure report for " << target << " from " << sender
                    << (validated ? " (quorum reached)" : "");
    if (validated)
        onValidatedFailure(target);
    return {true, validated, validated ? "validated" : "pending"};
}

ReportResult MeshSession::receiveLinkDownReport(const SignedEnvelope& envelope) {
    const std::string& sender = envelope.sender;
    if (envelope.msgType != MessageType::LINK_DOWN_REPORT)
        return {false, false,
                "Expected LINK_DOWN_REPORT, got " + messageTypeToString(envelope.msgType)};
    if (!protection_.shouldAcceptMessage(sender))
        return {false, false, "Node " + sender + " is quarantined or untrusted"};

    VerifyResult v = protection_.verifyMessage(envelope);
    if (!v.ok)
        return {false, false, v.error};

    const Json::Value& from = envelope.payload["from"];
    const Json::Value& to = envelope.payload["to"];
    if (!from.isString() || !to.isString() || from.asString().empty() ||
        to.asString().empty())
        return {false, false, "Missing link endpoints"};

    // reportLinkDown appends the link itself
    Evidence evidence;
    for (auto& item : evidenceFromJson(envelope.payload["evidence"]))
        if (!std::holds_alternative<LinkEvidence>(item))
            evidence.push_back(std::move(item));

    CriticalEvent event =
        protection_.reportLinkDown(from.asString(), to.asString(), std::move(evidence));
    bool validated = protection_.validateLinkDown(event, sender, envelope.signature);
    if (validated && from.asString() == options_.nodeId) {
        std::size_t dropped = router_.dropNextHop(to.asString());
        LOG_W("[mesh]") << "✂️ link to " << to.asString() << " confirmed down, " << dropped
                        << " route(s) dropped";
    }
    return {true, validated, validated ? "validated" : "pending"};
}

CriticalEvent MeshSession::reportLinkDown(const std::string& to, Evidence evidence) {
    CriticalEvent event = protection_.reportLinkDown(options_.nodeId, to, std::move(evidence));
    SignedEnvelope env = protection_.signLinkDownReport(event);
    if (protection_.validateLinkDown(event, options_.nodeId, env.signature))
        router_.dropNextHop(to);
    send(env);
    return event;
}

void MeshSession::attestLocalFailure(const CriticalEvent& event) {
    SignedEnvelope env = protection_.signFailureReport(event);
    if (protection_.validateNodeFailure(event, env.signature))
        onValidatedFailure(event.target);
    send(env);
}

void MeshSession::onValidatedFailure(const std::string& node) {
    if (router_.isUnroutable(node))
        return;
    router_.markUnroutable(node);
    registry_.markDead(node);
}

RouteDecision MeshSession::routeMessage(const std::string& destination) {
    RouteDecision d;
    if (destination == options_.nodeId) {
        d.status = RouteDecision::Status::DELIVERED;
        d.nextHop = destination;
        return d;
    }
    if (protection_.isValidatedFailure(destination)) {
        d.error = "Destination " + destination + " is a validated failure";
        return d;
    }
    if (registry_.isDead(destination)) {
        d.error = "Destination " + destination + " is unreachable";
        return d;
    }

    auto paths = router_.getRedundantPaths(destination, DEFAULT_REDUNDANT_PATHS);
    if (!paths.empty()) {
        d.status = RouteDecision::Status::ROUTED;
        d.nextHop = paths.front();
        d.alternates.assign(paths.begin() + 1, paths.end());
        return d;
    }
    if (registry_.isActive(destination)) {
        d.status = RouteDecision::Status::DIRECT;
        d.nextHop = destination;
        return d;
    }
    d.error = "No route to " + destination;
    return d;
}

NodeHealthStatus MeshSession::runHealthCheck() {
    NodeHealthStatus status = health_.checkHealth();
    health_.logStatus(status);
    return status;
}

std::size_t MeshSession::runEvaporation() {
    return router_.evaporate();
}

SignedEnvelope MeshSession::broadcastBeacon() {
    SignedEnvelope env = protection_.signBeacon(registry_.activeIds());
    send(env);
    return env;
}

void MeshSession::rotateKeys() {
    protection_.rotateKeys();
    LOG_I("[mesh]") << "🔑 keys rotated, epoch " << protection_.gossip().currentEpoch();
}

void MeshSession::updateMetrics() {
    ProtectionStats s = protection_.getProtectionStats();
    std::lock_guard<std::mutex> lk(metrics::gaugeMutex);
    metrics::mesh_peers_count.set(static_cast<double>(registry_.activeCount()));
    metrics::mesh_dead_peers_count.set(static_cast<double>(registry_.deadCount()));
    metrics::mesh_validated_failures_count.set(static_cast<double>(s.validatedFailures.size()));
    metrics::mesh_quarantined_nodes_count.set(static_cast<double>(s.quarantinedNodes.size()));
    metrics::mesh_routes_count.set(static_cast<double>(router_.routeCount()));
    metrics::mesh_beacons_total.set(static_cast<double>(beaconsReceived_.load()));
    metrics::mesh_pending_events_count.set(static_cast<double>(s.pendingEvents));
}

void MeshSession::addLoop(boost::asio::io_context& io, const std::string& name,
                          double interval, std::function<void()> tick) {
    if (interval <= 0.0) {
        LOG_D("[mesh]") << name << " loop disabled";
        return;
    }
    auto loop = std::make_unique<Loop>();
    loop->name = name;
    loop->interval = interval;
    loop->tick = std::move(tick);
    loop->timer = std::make_unique<boost::asio::steady_timer>(io);
    schedule(*loop);
    loops_.push_back(std::move(loop));
}

void MeshSession::schedule(Loop& loop) {
    auto delay = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(loop.interval));
    loop.timer->expires_after(delay);
    loop.timer->async_wait([this, &loop](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_.load())
            return;
        try {
            loop.tick();
        } catch (const std::exception& e) {
            LOG_E("[mesh]") << "❌ " << loop.name << " tick failed: " << e.what();
        }
        if (running_.load())
            schedule(loop);
    });
}

void MeshSession::start(boost::asio::io_context& io) {
    // Queued timer handlers hold references into loops_, so a stopped
    // session is not restarted.
    if (started_) {
        LOG_W("[mesh]") << "session " << options_.nodeId << " already started, ignoring start()";
        return;
    }
    started_ = true;
    running_ = true;
    addLoop(io, "health", options_.healthCheckInterval, [this] { runHealthCheck(); });
    addLoop(io, "evaporation", options_.decayInterval, [this] { runEvaporation(); });
    addLoop(io, "beacon", options_.beaconInterval, [this] { broadcastBeacon(); });
    addLoop(io, "key-rotation", options_.keyRotationInterval, [this] { rotateKeys(); });
    addLoop(io, "metrics", options_.metricsInterval, [this] {
        updateMetrics();
        LOG_D("[metrics]") << "\n" << metrics::toPrometheus();
    });
    LOG_I("[mesh]") << "▶️ " << loops_.size() << " loop(s) started";
}

void MeshSession::stop() {
    if (!running_.exchange(false))
        return;
    for (auto& loop : loops_)
        loop->timer->cancel();
    LOG_I("[mesh]") << "⏹️ session " << options_.nodeId << " stopped";
}

SessionStatus MeshSession::status() {
    SessionStatus s;
    s.nodeId = options_.nodeId;
    s.peers = registry_.activeCount();
    s.deadPeers = registry_.deadCount();
    s.protection = protection_.getProtectionStats();
    s.validatedFailures = s.protection.validatedFailures.size();
    s.beaconsReceived = beaconsReceived_.load();
    s.routes = router_.routeCount();
    s.pendingEvents = protection_.quorum().pendingEvents();
    return s;
}

std::vector<PeerStatus> MeshSession::peers() {
    const double now = clock_.now();
    std::vector<PeerStatus> out;
    auto fill = [&](const PeerInfo& info, bool alive) {
        PeerStatus p;
        p.nodeId = info.nodeId;
        p.lastSeen = info.lastSeen;
        p.elapsed = info.lastSeen > 0.0 ? now - info.lastSeen : 0.0;
        p.alive = alive;
        p.neighbors = info.neighbors;
        p.reputation = protection_.getNodeReputation(info.nodeId);
        p.quarantined = protection_.isNodeQuarantined(info.nodeId);
        p.validatedFailure = protection_.isValidatedFailure(info.nodeId);
        out.push_back(std::move(p));
    };
    for (const auto& info : registry_.activePeers())
        fill(info, true);
    for (const auto& info : registry_.deadPeerInfo())
        fill(info, false);
    return out;
}
