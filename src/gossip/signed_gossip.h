#ifndef SIGNED_GOSSIP_H
#define SIGNED_GOSSIP_H

#include "clock.h"
#include "constants.h"
#include "crypto/signer.h"
#include "gossip/rate_limiter.h"
#include "gossip/replay_guard.h"
#include "gossip/reputation.h"
#include "gossip/signed_envelope.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct VerifyResult {
    bool ok{false};
    std::string error;

    static VerifyResult accept() { return {true, {}}; }
    static VerifyResult reject(std::string why) { return {false, std::move(why)}; }
};

struct GossipLimits {
    std::size_t rateLimitPerSecond{DEFAULT_RATE_LIMIT_PER_SECOND};
    double quarantineSeconds{DEFAULT_QUARANTINE_SECONDS};
    std::size_t replayWindow{REPLAY_WINDOW_NONCES};
};

// Signs outgoing envelopes and admits incoming ones. verify() runs the gates
// in a fixed order: quarantine, rate limit, replay, stale epoch, signature.
// The quarantine gate has no side effects; every later rejection costs the
// sender reputation, every acceptance earns some back.
class SignedGossip {
public:
    // Throws std::runtime_error if the signer cannot produce a keypair.
    SignedGossip(std::string nodeId, Signer& signer,
                 const Clock& clock = SystemClock::instance(),
                 GossipLimits limits = {});

    SignedEnvelope sign(MessageType type, const Json::Value& payload,
                        std::optional<uint64_t> nonce = std::nullopt);
    VerifyResult verify(const SignedEnvelope& envelope);
    void rotateKeys();

    const std::string& nodeId() const { return nodeId_; }
    uint64_t currentEpoch() const;
    Bytes publicKey() const;
    Signer& signer() { return signer_; }

    double reputation(const std::string& node) const;
    bool isQuarantined(const std::string& node);
    std::vector<std::string> quarantinedNodes();
    std::optional<ReputationEntry> reputationEntry(const std::string& node) const;
    std::size_t trackedNonces() const;

private:
    void penalizeLocked(const std::string& sender, Violation v, double now);
    uint64_t nextNonceLocked(double now);

    const std::string nodeId_;
    Signer& signer_;
    const Clock& clock_;

    mutable std::mutex mtx_;
    KeyPair keys_;
    uint64_t currentEpoch_{0};
    uint64_t lastNonce_{0};
    ReplayGuard replay_;
    RateLimiter rateLimiter_;
    ReputationTable reputation_;
};

#endif // SIGNED_GOSSIP_H
