#include "clock.h"
#include "crypto/ed25519_signer.h"
#include "gossip/signed_gossip.h"
#include <cassert>
#include <cmath>
#include <iostream>

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static Json::Value hello() {
    Json::Value p;
    p["hello"] = "mesh";
    return p;
}

int main() {
    Ed25519Signer signer;
    ManualClock clock;

    // keys and signatures have the expected raw sizes
    {
        KeyPair kp = signer.generateKeyPair();
        assert(kp.publicKey.size() == ED25519_PUBLIC_KEY_BYTES);
        Bytes msg = Crypto::stringToBytes("payload");
        Bytes sig = signer.sign(msg, kp.privateKey);
        assert(sig.size() == ED25519_SIGNATURE_BYTES);
        assert(signer.verify(msg, sig, kp.publicKey));
        assert(!signer.verify(Crypto::stringToBytes("other"), sig, kp.publicKey));
        assert(!signer.verify(msg, Bytes{1, 2, 3}, kp.publicKey));
        assert(!signer.verify(msg, sig, Bytes{1, 2, 3}));
    }

    // serialize() excludes the signature and is stable
    {
        SignedGossip s("S", signer, clock);
        SignedEnvelope env = s.sign(MessageType::BEACON, hello(), 7);
        std::string before = env.serialize();
        env.signature[0] ^= 0xff;
        assert(env.serialize() == before);
        assert(before.find("\"signature\"") == std::string::npos);
        assert(before.find("\"epoch\"") < before.find("\"msg_type\""));
        assert(before.find("\"msg_type\"") < before.find("\"nonce\""));
    }

    // accepted message, then the same nonce is a replay
    {
        SignedGossip s("S", signer, clock);
        SignedGossip r("R", signer, clock);
        SignedEnvelope env = s.sign(MessageType::BEACON, hello(), 42);
        assert(env.epoch == 0 && env.sender == "S");
        VerifyResult first = r.verify(env);
        assert(first.ok);
        VerifyResult second = r.verify(env);
        assert(!second.ok);
        assert(second.error.rfind("Replay attack detected", 0) == 0);
        assert(near(r.reputation("S"), 0.9));
        assert(r.trackedNonces() == 1);
    }

    // generated nonces are strictly increasing even within one microsecond
    {
        SignedGossip s("S", signer, clock);
        auto a = s.sign(MessageType::BEACON, hello());
        auto b = s.sign(MessageType::BEACON, hello());
        assert(b.nonce > a.nonce);
    }

    // tampered payload or foreign key fails the signature check
    {
        SignedGossip s("S", signer, clock);
        SignedGossip r("R", signer, clock);
        SignedEnvelope env = s.sign(MessageType::BEACON, hello(), 1);
        env.payload["hello"] = "tampered";
        VerifyResult v = r.verify(env);
        assert(!v.ok && v.error == "Invalid signature from S");

        SignedEnvelope env2 = s.sign(MessageType::BEACON, hello(), 2);
        env2.publicKey = r.publicKey();
        assert(!r.verify(env2).ok);

        SignedEnvelope env3 = s.sign(MessageType::BEACON, hello(), 3);
        env3.signature.clear();
        assert(!r.verify(env3).ok);
    }

    // three then four invalid signatures: 0.729, 0.6561, never quarantined
    {
        SignedGossip s("S", signer, clock);
        SignedGossip r("R", signer, clock);
        for (uint64_t n = 1; n <= 4; ++n) {
            SignedEnvelope env = s.sign(MessageType::BEACON, hello(), n);
            env.signature[0] ^= 0x01;
            assert(!r.verify(env).ok);
            if (n == 3)
                assert(near(r.reputation("S"), 0.729));
        }
        assert(near(r.reputation("S"), 0.6561));
        assert(!r.isQuarantined("S"));
        auto entry = r.reputationEntry("S");
        assert(entry && entry->violations == 4);
        assert(entry->lastViolation == "invalid_signature");
    }

    // quarantine starts below 0.3 and lapses after exactly 300s
    {
        SignedGossip s("S", signer, clock);
        SignedGossip r("R", signer, clock);
        // 0.9^11 = 0.3138, 0.9^12 = 0.2824
        for (uint64_t n = 1; n <= 12; ++n) {
            SignedEnvelope env = s.sign(MessageType::BEACON, hello(), n);
            env.signature[0] ^= 0x01;
            assert(!r.verify(env).ok);
            assert(r.isQuarantined("S") == (n == 12));
        }
        double score = r.reputation("S");
        assert(score < 0.3 && score >= 0.0);

        // quarantined senders are refused without further penalty
        SignedEnvelope good = s.sign(MessageType::BEACON, hello(), 100);
        VerifyResult v = r.verify(good);
        assert(!v.ok && v.error == "Node S is quarantined");
        assert(near(r.reputation("S"), score));
        assert(r.quarantinedNodes() == std::vector<std::string>{"S"});

        clock.advance(299.999);
        assert(r.isQuarantined("S"));
        clock.advance(0.001);
        assert(!r.isQuarantined("S"));
        assert(r.quarantinedNodes().empty());

        // accepted again; reward is multiplicative and capped at 1.0
        assert(r.verify(good).ok);
        assert(near(r.reputation("S"), score * 1.05));
    }

    // sliding one-second rate limit
    {
        SignedGossip s("S", signer, clock);
        SignedGossip r("R", signer, clock, GossipLimits{3, DEFAULT_QUARANTINE_SECONDS});
        for (uint64_t n = 1; n <= 3; ++n)
            assert(r.verify(s.sign(MessageType::BEACON, hello(), n)).ok);
        VerifyResult v = r.verify(s.sign(MessageType::BEACON, hello(), 4));
        assert(!v.ok && v.error.rfind("Rate limit exceeded for S", 0) == 0);
        clock.advance(1.0);
        assert(r.verify(s.sign(MessageType::BEACON, hello(), 5)).ok);
    }

    // stale epoch: one epoch of skew is tolerated, two are not
    {
        SignedGossip s("S", signer, clock);
        SignedGossip r("R", signer, clock);
        SignedEnvelope e0 = s.sign(MessageType::BEACON, hello(), 10);
        SignedEnvelope e0b = s.sign(MessageType::BEACON, hello(), 11);
        r.rotateKeys();
        assert(r.currentEpoch() == 1);
        assert(r.verify(e0).ok);
        r.rotateKeys();
        VerifyResult v = r.verify(e0b);
        assert(!v.ok && v.error.rfind("Stale epoch", 0) == 0);
        assert(near(r.reputation("S"), 0.9));

        // the signature is valid, still rejected
        assert(signer.verify(e0b.signingInput(), e0b.signature, e0b.publicKey));
    }

    // rotation drops only epochs the stale rule already rejects
    {
        SignedGossip s("S", signer, clock);
        SignedGossip r("R", signer, clock);
        assert(r.verify(s.sign(MessageType::BEACON, hello(), 1)).ok);
        s.rotateKeys();
        SignedEnvelope e1 = s.sign(MessageType::BEACON, hello(), 1);
        assert(e1.epoch == 1);
        assert(r.verify(e1).ok);
        assert(r.trackedNonces() == 2);
        r.rotateKeys();
        assert(r.trackedNonces() == 2);
        r.rotateKeys();
        assert(r.trackedNonces() == 1);
        // still a replay inside the retained epoch
        assert(!r.verify(e1).ok);
    }

    // a message accepted before the receiver rotates is still a replay after
    {
        SignedGossip s("S", signer, clock);
        SignedGossip r("R", signer, clock);
        SignedEnvelope env = s.sign(MessageType::BEACON, hello(), 42);
        assert(r.verify(env).ok);
        assert(!r.verify(env).ok);
        r.rotateKeys();
        VerifyResult v = r.verify(env);
        assert(!v.ok && v.error.rfind("Replay attack detected", 0) == 0);

        // sender ahead of the receiver: its epoch survives the rotation too
        SignedGossip s2("S2", signer, clock);
        for (int i = 0; i < 3; ++i)
            s2.rotateKeys();
        SignedEnvelope ahead = s2.sign(MessageType::BEACON, hello(), 7);
        assert(ahead.epoch == 3);
        assert(r.verify(ahead).ok);
        r.rotateKeys();
        assert(r.currentEpoch() == 2);
        VerifyResult again = r.verify(ahead);
        assert(!again.ok && again.error.rfind("Replay attack detected", 0) == 0);
    }

    // the nonce table is bounded without any rotation
    {
        GossipLimits limits;
        limits.replayWindow = 64;
        SignedGossip s("S", signer, clock);
        SignedGossip r("R", signer, clock, limits);
        SignedEnvelope first = s.sign(MessageType::BEACON, hello(), 1);
        SignedEnvelope recent;
        for (uint64_t n = 1; n <= 500; ++n) {
            SignedEnvelope env = n == 1 ? first : s.sign(MessageType::BEACON, hello(), n);
            assert(r.verify(env).ok);
            recent = env;
            clock.advance(0.05);
        }
        assert(r.trackedNonces() == 64);
        // below the window floor and inside the window both count as seen
        assert(!r.verify(first).ok);
        assert(!r.verify(recent).ok);
        assert(r.verify(s.sign(MessageType::BEACON, hello(), 501)).ok);
        assert(r.trackedNonces() == 64);
    }

    // old sender epochs past the per-sender limit count as seen
    {
        SignedGossip s("S", signer, clock);
        SignedGossip r("R", signer, clock);
        SignedEnvelope e0 = s.sign(MessageType::BEACON, hello(), 5);
        assert(r.verify(e0).ok);
        for (std::size_t i = 0; i < REPLAY_WINDOW_EPOCHS; ++i) {
            s.rotateKeys();
            assert(r.verify(s.sign(MessageType::BEACON, hello(), 5)).ok);
        }
        assert(r.trackedNonces() == REPLAY_WINDOW_EPOCHS);
        assert(!r.verify(e0).ok);
    }

    std::cout << "signed_gossip_test OK\n";
    return 0;
}
