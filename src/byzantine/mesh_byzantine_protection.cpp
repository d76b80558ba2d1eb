#include "byzantine/mesh_byzantine_protection.h"
#include "logging.h"

Json::Value ProtectionStats::toJson() const {
    Json::Value j;
    j["node_id"] = nodeId;
    j["epoch"] = static_cast<Json::UInt64>(epoch);
    j["quorum_size"] = static_cast<Json::UInt64>(quorumSize);
    j["total_nodes"] = totalNodes;
    j["pending_events"] = static_cast<Json::UInt64>(pendingEvents);
    j["tracked_nonces"] = static_cast<Json::UInt64>(trackedNonces);
    j["quarantined_nodes"] = Json::Value(Json::arrayValue);
    for (const auto& n : quarantinedNodes) j["quarantined_nodes"].append(n);
    j["validated_failures"] = Json::Value(Json::arrayValue);
    for (const auto& n : validatedFailures) j["validated_failures"].append(n);
    j["validated_link_failures"] = Json::Value(Json::arrayValue);
    for (const auto& l : validatedLinkFailures) j["validated_link_failures"].append(l);
    return j;
}

MeshByzantineProtection::MeshByzantineProtection(std::string nodeId, Signer& signer,
                                                 int totalNodes, double quorumThreshold,
                                                 const Clock& clock, GossipLimits limits,
                                                 double pendingEventTtl)
    : nodeId_(std::move(nodeId)),
      gossip_(nodeId_, signer, clock, limits),
      quorum_(totalNodes, quorumThreshold, clock, pendingEventTtl) {
    LOG_I("[byzantine]") << "🛡️ protection enabled for " << nodeId_
                         << " (signed gossip + quorum " << quorum_.quorumSize() << "/"
                         << totalNodes << ")";
}

SignedEnvelope MeshByzantineProtection::signBeacon(const std::vector<std::string>& neighbors) {
    Json::Value payload(Json::objectValue);
    payload["neighbors"] = Json::Value(Json::arrayValue);
    for (const auto& n : neighbors)
        payload["neighbors"].append(n);
    return gossip_.sign(MessageType::BEACON, payload);
}

VerifyResult MeshByzantineProtection::verifyBeacon(const SignedEnvelope& envelope) {
    if (envelope.msgType != MessageType::BEACON)
        return VerifyResult::reject("Expected BEACON, got " +
                                    messageTypeToString(envelope.msgType));
    return gossip_.verify(envelope);
}

VerifyResult MeshByzantineProtection::verifyMessage(const SignedEnvelope& envelope) {
    return gossip_.verify(envelope);
}

CriticalEvent MeshByzantineProtection::reportNodeFailure(const std::string& nodeId,
                                                         Evidence evidence) {
    return quorum_.report(EventType::NODE_FAILURE, nodeId, std::move(evidence));
}

bool MeshByzantineProtection::validateNodeFailure(const CriticalEvent& event,
                                                  const Bytes& validatorSignature) {
    return validateNodeFailureFrom(event, nodeId_, validatorSignature);
}

bool MeshByzantineProtection::validateNodeFailureFrom(const CriticalEvent& event,
                                                      const std::string& validatorId,
                                                      const Bytes& signature) {
    bool validated = quorum_.validate(event, validatorId, signature);
    if (validated) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (validatedFailures_.insert(event.target).second)
            LOG_W("[byzantine]") << "🔴 node " << event.target
                                 << " validated as FAILED by quorum";
    }
    return validated;
}

SignedEnvelope MeshByzantineProtection::signFailureReport(const CriticalEvent& event) {
    Json::Value payload(Json::objectValue);
    payload["failed_node"] = event.target;
    payload["evidence"] = evidenceToJson(event.evidence);
    return gossip_.sign(MessageType::FAILURE_REPORT, payload);
}

CriticalEvent MeshByzantineProtection::reportLinkDown(const std::string& from,
                                                      const std::string& to,
                                                      Evidence evidence) {
    evidence.push_back(LinkEvidence{from, to});
    return quorum_.report(EventType::LINK_DOWN, linkTarget(from, to), std::move(evidence));
}

bool MeshByzantineProtection::validateLinkDown(const CriticalEvent& event,
                                               const std::string& validatorId,
                                               const Bytes& signature) {
    bool validated = quorum_.validate(event, validatorId, signature);
    if (validated) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (validatedLinks_.insert(event.target).second)
            LOG_W("[byzantine]") << "🔴 link " << event.target
                                 << " validated as DOWN by quorum";
    }
    return validated;
}

SignedEnvelope MeshByzantineProtection::signLinkDownReport(const CriticalEvent& event) {
    Json::Value payload(Json::objectValue);
    payload["evidence"] = evidenceToJson(event.evidence);
    for (const auto& item : event.evidence) {
        if (const auto* link = std::get_if<LinkEvidence>(&item)) {
            payload["from"] = link->from;
            payload["to"] = link->to;
        }
    }
    return gossip_.sign(MessageType::LINK_DOWN_REPORT, payload);
}

bool MeshByzantineProtection::isNodeQuarantined(const std::string& nodeId) {
    return gossip_.isQuarantined(nodeId);
}

double MeshByzantineProtection::getNodeReputation(const std::string& nodeId) const {
    return gossip_.reputation(nodeId);
}

bool MeshByzantineProtection::shouldAcceptMessage(const std::string& sender) {
    if (gossip_.isQuarantined(sender))
        return false;
    return gossip_.reputation(sender) >= REPUTATION_QUARANTINE_THRESHOLD;
}

bool MeshByzantineProtection::isValidatedFailure(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return validatedFailures_.count(nodeId) > 0;
}

std::vector<std::string> MeshByzantineProtection::validatedFailures() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return {validatedFailures_.begin(), validatedFailures_.end()};
}

ProtectionStats MeshByzantineProtection::getProtectionStats() {
    ProtectionStats s;
    s.nodeId = nodeId_;
    s.epoch = gossip_.currentEpoch();
    s.quarantinedNodes = gossip_.quarantinedNodes();
    s.quorumSize = quorum_.quorumSize();
    s.totalNodes = quorum_.totalNodes();
    s.pendingEvents = quorum_.pendingCount();
    s.trackedNonces = gossip_.trackedNonces();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        s.validatedFailures.assign(validatedFailures_.begin(), validatedFailures_.end());
        s.validatedLinkFailures.assign(validatedLinks_.begin(), validatedLinks_.end());
    }
    return s;
}
