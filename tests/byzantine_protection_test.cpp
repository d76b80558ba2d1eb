#include "byzantine/mesh_byzantine_protection.h"
#include "clock.h"
#include "crypto/ed25519_signer.h"
#include <cassert>
#include <iostream>

int main() {
    Ed25519Signer signer;
    ManualClock clock;

    // beacons verify across nodes; the wrong type is refused
    {
        MeshByzantineProtection a("a", signer, 3, 0.67, clock);
        MeshByzantineProtection b("b", signer, 3, 0.67, clock);
        SignedEnvelope beacon = a.signBeacon({"b", "c"});
        assert(beacon.msgType == MessageType::BEACON);
        assert(beacon.payload["neighbors"].size() == 2);
        assert(b.verifyBeacon(beacon).ok);

        CriticalEvent ev = a.reportNodeFailure("c", {PacketLossEvidence{1.0}});
        SignedEnvelope report = a.signFailureReport(ev);
        VerifyResult v = b.verifyBeacon(report);
        assert(!v.ok && v.error.find("Expected BEACON") != std::string::npos);
        // the type check costs no reputation
        assert(b.getNodeReputation("a") == 1.0);
        assert(b.verifyMessage(report).ok);
        assert(report.payload["failed_node"].asString() == "c");
    }

    // node failure reaches quorum through the facade
    {
        MeshByzantineProtection p("self", signer, 3, 0.67, clock);
        assert(p.quorum().quorumSize() == 3);
        CriticalEvent ev = p.reportNodeFailure("victim", {PacketLossEvidence{1.0}});
        assert(!p.validateNodeFailure(ev, Crypto::stringToBytes("s-self")));
        assert(!p.validateNodeFailureFrom(ev, "v1", Crypto::stringToBytes("s1")));
        assert(!p.isValidatedFailure("victim"));
        assert(p.validateNodeFailureFrom(ev, "v2", Crypto::stringToBytes("s2")));
        assert(p.isValidatedFailure("victim"));
        assert(p.validatedFailures() == std::vector<std::string>{"victim"});

        ProtectionStats s = p.getProtectionStats();
        assert(s.nodeId == "self");
        assert(s.quorumSize == 3 && s.totalNodes == 3);
        assert(s.validatedFailures.size() == 1);
        assert(s.pendingEvents == 0);
        Json::Value j = s.toJson();
        assert(j["validated_failures"][0].asString() == "victim");
        assert(j["quorum_size"].asUInt64() == 3);
    }

    // link-down events use "from->to" and carry the link evidence
    {
        MeshByzantineProtection p("self", signer, 2, 0.5, clock);
        CriticalEvent ev = p.reportLinkDown("self", "n2", {});
        assert(ev.target == "self->n2");
        assert(ev.eventType == EventType::LINK_DOWN);
        assert(std::holds_alternative<LinkEvidence>(ev.evidence.back()));
        SignedEnvelope env = p.signLinkDownReport(ev);
        assert(env.payload["from"].asString() == "self");
        assert(env.payload["to"].asString() == "n2");
        assert(p.validateLinkDown(ev, "self", env.signature));
        assert(p.getProtectionStats().validatedLinkFailures ==
               std::vector<std::string>{"self->n2"});
        // a link failure is not a node failure
        assert(!p.isValidatedFailure("n2"));
    }

    // acceptance follows quarantine and reputation
    {
        MeshByzantineProtection a("a", signer, 3, 0.67, clock);
        MeshByzantineProtection b("b", signer, 3, 0.67, clock);
        assert(b.shouldAcceptMessage("a"));
        for (uint64_t n = 1; n <= 12; ++n) {
            SignedEnvelope env = a.signBeacon({});
            env.signature[5] ^= 0x10;
            assert(!b.verifyBeacon(env).ok);
        }
        assert(b.isNodeQuarantined("a"));
        assert(!b.shouldAcceptMessage("a"));
        assert(b.getProtectionStats().quarantinedNodes == std::vector<std::string>{"a"});

        // quarantine lapses but the score is still below the threshold
        clock.advance(DEFAULT_QUARANTINE_SECONDS);
        assert(!b.isNodeQuarantined("a"));
        assert(b.getNodeReputation("a") < REPUTATION_QUARANTINE_THRESHOLD);
        assert(!b.shouldAcceptMessage("a"));
    }

    // key rotation bumps the epoch reported in stats
    {
        MeshByzantineProtection p("self", signer, 3, 0.67, clock);
        Bytes before = p.gossip().publicKey();
        p.rotateKeys();
        assert(p.getProtectionStats().epoch == 1);
        assert(p.gossip().publicKey() != before);
        assert(p.signBeacon({}).epoch == 1);
    }

    std::cout << "byzantine_protection_test OK\n";
    return 0;
}
