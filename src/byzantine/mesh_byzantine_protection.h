#ifndef MESH_BYZANTINE_PROTECTION_H
#define MESH_BYZANTINE_PROTECTION_H

#include "consensus/quorum_validator.h"
#include "gossip/signed_gossip.h"

#include <json/json.h>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct ProtectionStats {
    std::string nodeId;
    uint64_t epoch{0};
    std::vector<std::string> quarantinedNodes;
    std::vector<std::string> validatedFailures;
    std::vector<std::string> validatedLinkFailures;
    std::size_t quorumSize{0};
    int totalNodes{0};
    std::size_t pendingEvents{0};
    std::size_t trackedNonces{0};

    Json::Value toJson() const;
};

// Mesh-facing facade over signed gossip and quorum validation.
class MeshByzantineProtection {
public:
    MeshByzantineProtection(std::string nodeId, Signer& signer, int totalNodes,
                            double quorumThreshold = 0.67,
                            const Clock& clock = SystemClock::instance(),
                            GossipLimits limits = {},
                            double pendingEventTtl = 0.0);

    // Beacons
    SignedEnvelope signBeacon(const std::vector<std::string>& neighbors);
    VerifyResult verifyBeacon(const SignedEnvelope& envelope);
    VerifyResult verifyMessage(const SignedEnvelope& envelope);

    // Node failures
    CriticalEvent reportNodeFailure(const std::string& nodeId, Evidence evidence);
    bool validateNodeFailure(const CriticalEvent& event, const Bytes& validatorSignature);
    bool validateNodeFailureFrom(const CriticalEvent& event, const std::string& validatorId,
                                 const Bytes& signature);
    SignedEnvelope signFailureReport(const CriticalEvent& event);

    // Link failures; the event target is "from->to"
    CriticalEvent reportLinkDown(const std::string& from, const std::string& to,
                                 Evidence evidence);
    bool validateLinkDown(const CriticalEvent& event, const std::string& validatorId,
                          const Bytes& signature);
    SignedEnvelope signLinkDownReport(const CriticalEvent& event);

    bool isNodeQuarantined(const std::string& nodeId);
    double getNodeReputation(const std::string& nodeId) const;
    bool shouldAcceptMessage(const std::string& sender);
    bool isValidatedFailure(const std::string& nodeId) const;
    std::vector<std::string> validatedFailures() const;

    ProtectionStats getProtectionStats();

    void rotateKeys() { gossip_.rotateKeys(); }
    std::size_t evictExpiredEvents() { return quorum_.evictExpired(); }

    const std::string& nodeId() const { return nodeId_; }
    SignedGossip& gossip() { return gossip_; }
    QuorumValidator& quorum() { return quorum_; }
    const QuorumValidator& quorum() const { return quorum_; }

    static std::string linkTarget(const std::string& from, const std::string& to) {
        return from + "->" + to;
    }

private:
    const std::string nodeId_;
    SignedGossip gossip_;
    QuorumValidator quorum_;

    mutable std::mutex mtx_;
    std::set<std::string> validatedFailures_;
    std::set<std::string> validatedLinks_;
};

#endif // MESH_BYZANTINE_PROTECTION_H
