#include "gossip/signed_gossip.h"
#include "logging.h"

#include <algorithm>
#include <cmath>

SignedGossip::SignedGossip(std::string nodeId, Signer& signer, const Clock& clock,
                           GossipLimits limits)
    : nodeId_(std::move(nodeId)),
      signer_(signer),
      clock_(clock),
      keys_(signer.generateKeyPair()),
      replay_(limits.replayWindow),
      rateLimiter_(limits.rateLimitPerSecond),
      reputation_(limits.quarantineSeconds) {
    LOG_I("[gossip]") << "🔐 " << nodeId_ << " signing with " << signer_.name()
                      << " key " << Crypto::fingerprint(keys_.publicKey)
                      << " (epoch " << currentEpoch_ << ")";
}

uint64_t SignedGossip::nextNonceLocked(double now) {
    // Microsecond clock, forced strictly increasing for back-to-back sends.
    auto micros = static_cast<uint64_t>(std::llround(now * 1e6));
    lastNonce_ = std::max(micros, lastNonce_ + 1);
    return lastNonce_;
}

SignedEnvelope SignedGossip::sign(MessageType type, const Json::Value& payload,
                                  std::optional<uint64_t> nonce) {
    std::lock_guard<std::mutex> lock(mtx_);
    const double now = clock_.now();

    SignedEnvelope env;
    env.msgType = type;
    env.sender = nodeId_;
    env.timestamp = now;
    env.nonce = nonce ? *nonce : nextNonceLocked(now);
    env.epoch = currentEpoch_;
    env.payload = payload.isNull() ? Json::Value(Json::objectValue) : payload;
    env.publicKey = keys_.publicKey;
    env.signature = signer_.sign(env.signingInput(), keys_.privateKey);
    return env;
}

void SignedGossip::penalizeLocked(const std::string& sender, Violation v, double now) {
    reputation_.penalize(sender, v, now);
}

VerifyResult SignedGossip::verify(const SignedEnvelope& env) {
    std::lock_guard<std::mutex> lock(mtx_);
    const double now = clock_.now();
    const std::string& sender = env.sender;

    if (reputation_.isQuarantined(sender, now))
        return VerifyResult::reject("Node " + sender + " is quarantined");

    if (rateLimiter_.wouldExceed(sender, now)) {
        penalizeLocked(sender, Violation::RATE_LIMIT_EXCEEDED, now);
        LOG_W("[gossip]") << "⏱️ rate limit exceeded by " << sender;
        return VerifyResult::reject("Rate limit exceeded for " + sender + " (" +
                                    std::to_string(rateLimiter_.limit()) + " msg/s)");
    }

    if (replay_.hasSeen(sender, env.epoch, env.nonce)) {
        penalizeLocked(sender, Violation::REPLAY_ATTACK, now);
        LOG_W("[gossip]") << "🔁 replay from " << sender << " nonce " << env.nonce
                          << " epoch " << env.epoch;
        return VerifyResult::reject("Replay attack detected: nonce " +
                                    std::to_string(env.nonce) + " already seen from " +
                                    sender + " in epoch " + std::to_string(env.epoch));
    }

    // One epoch of rotation skew is tolerated.
    if (currentEpoch_ > 0 && env.epoch < currentEpoch_ - 1) {
        penalizeLocked(sender, Violation::STALE_EPOCH, now);
        LOG_W("[gossip]") << "stale epoch " << env.epoch << " from " << sender
                          << " (current " << currentEpoch_ << ")";
        return VerifyResult::reject("Stale epoch " + std::to_string(env.epoch) +
                                    " (current " + std::to_string(currentEpoch_) + ")");
    }

    bool sigOk = false;
    if (!env.signature.empty() && !env.publicKey.empty()) {
        try {
            sigOk = signer_.verify(env.signingInput(), env.signature, env.publicKey);
        } catch (const std::exception& e) {
            LOG_E("[gossip]") << "signature backend error for " << sender << ": "
                              << e.what();
            sigOk = false;
        }
    }
    if (!sigOk) {
        penalizeLocked(sender, Violation::INVALID_SIGNATURE, now);
        LOG_W("[gossip]") << "❌ invalid signature from " << sender << " ("
                          << messageTypeToString(env.msgType) << ")";
        return VerifyResult::reject("Invalid signature from " + sender);
    }

    reputation_.reward(sender);
    replay_.record(sender, env.epoch, env.nonce);
    rateLimiter_.record(sender, now);
    LOG_T("[gossip]") << "accepted " << messageTypeToString(env.msgType) << " from "
                      << sender << " nonce " << env.nonce;
    return VerifyResult::accept();
}

void SignedGossip::rotateKeys() {
    KeyPair fresh = signer_.generateKeyPair();
    std::lock_guard<std::mutex> lock(mtx_);
    currentEpoch_++;
    keys_ = std::move(fresh);
    // epochs the stale rule still admits keep their nonces
    replay_.pruneBelow(currentEpoch_ - 1);
    LOG_I("[gossip]") << "🔄 rotated keys: epoch " << currentEpoch_ << ", key "
                      << Crypto::fingerprint(keys_.publicKey);
}

uint64_t SignedGossip::currentEpoch() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return currentEpoch_;
}

Bytes SignedGossip::publicKey() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return keys_.publicKey;
}

double SignedGossip::reputation(const std::string& node) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return reputation_.score(node);
}

bool SignedGossip::isQuarantined(const std::string& node) {
    std::lock_guard<std::mutex> lock(mtx_);
    return reputation_.isQuarantined(node, clock_.now());
}

std::vector<std::string> SignedGossip::quarantinedNodes() {
    std::lock_guard<std::mutex> lock(mtx_);
    return reputation_.quarantinedNodes(clock_.now());
}

std::optional<ReputationEntry> SignedGossip::reputationEntry(const std::string& node) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return reputation_.entry(node);
}

std::size_t SignedGossip::trackedNonces() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return replay_.size();
}
