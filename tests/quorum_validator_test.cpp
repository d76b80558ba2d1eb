#include "clock.h"
#include "consensus/quorum_validator.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

static Bytes sig(const std::string& who) { return Crypto::stringToBytes("sig-" + who); }

int main() {
    ManualClock clock;

    // quorum sizes
    assert(QuorumValidator::computeQuorumSize(10, 0.67) == 7);
    assert(QuorumValidator::computeQuorumSize(100, 0.67) == 67);
    assert(QuorumValidator::computeQuorumSize(3, 0.67) == 3);
    assert(QuorumValidator::computeQuorumSize(1, 0.5) == 1);
    assert(QuorumValidator::computeQuorumSize(4, 1.0) == 4);
    bool threw = false;
    try {
        QuorumValidator::computeQuorumSize(0, 0.67);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        QuorumValidator::computeQuorumSize(5, 1.5);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // 10 nodes at 0.67: six signatures pending, the seventh validates
    {
        QuorumValidator q(10, 0.67, clock);
        assert(q.quorumSize() == 7);
        CriticalEvent ev = q.report(EventType::NODE_FAILURE, "P",
                                    {LatencyEvidence{std::numeric_limits<double>::infinity()},
                                     PacketLossEvidence{1.0}});
        assert(!ev.validated && ev.signatureCount() == 0);
        assert(q.pendingCount() == 1);

        for (int i = 1; i <= 6; ++i)
            assert(!q.validate(ev, "v" + std::to_string(i), sig(std::to_string(i))));
        // the same validator again does not count twice
        assert(!q.validate(ev, "v6", sig("6-again")));
        assert(q.find(EventType::NODE_FAILURE, "P")->signatureCount() == 6);

        assert(q.validate(ev, "v7", sig("7")));
        auto stored = q.find(EventType::NODE_FAILURE, "P");
        assert(stored && stored->validated && stored->validatedAt);
        assert(q.pendingCount() == 0);

        // terminal: more signatures, duplicates and a re-report keep it validated
        assert(q.validate(ev, "v8", sig("8")));
        assert(q.validate(ev, "v1", sig("1")));
        CriticalEvent again = q.report(EventType::NODE_FAILURE, "P", {});
        assert(again.validated);
        assert(again.signatureCount() == 8);
    }

    // report returns the existing pending event for the same key
    {
        QuorumValidator q(5, 0.6, clock);
        CriticalEvent a = q.report(EventType::NODE_FAILURE, "X", {PacketLossEvidence{0.5}});
        q.validate(a, "v1", sig("1"));
        CriticalEvent b = q.report(EventType::NODE_FAILURE, "X", {});
        assert(b.signatureCount() == 1);
        assert(b.evidence.size() == 1);
        assert(a.id() == b.id());

        // different type, same target: separate event
        CriticalEvent link = q.report(EventType::LINK_DOWN, "X", {});
        assert(link.signatureCount() == 0);
        assert(q.pendingCount() == 2);
    }

    // empty validator ids or signatures are ignored
    {
        QuorumValidator q(2, 0.5, clock);
        CriticalEvent ev = q.report(EventType::LINK_DOWN, "a->b", {LinkEvidence{"a", "b"}});
        assert(!q.validate(ev, "v1", Bytes{}));
        assert(!q.validate(ev, "", sig("x")));
        assert(q.find(EventType::LINK_DOWN, "a->b")->signatureCount() == 0);
        assert(q.validate(ev, "v1", sig("1")));
    }

    // an event never reported locally is adopted on first validation
    {
        QuorumValidator q(3, 0.67, clock);
        CriticalEvent foreign;
        foreign.eventType = EventType::NODE_FAILURE;
        foreign.target = "Z";
        foreign.signatures["forged"] = sig("forged");
        foreign.validated = true;
        assert(!q.validate(foreign, "v1", sig("1")));
        auto stored = q.find(EventType::NODE_FAILURE, "Z");
        assert(stored && stored->signatureCount() == 1 && !stored->validated);
    }

    // TTL eviction only touches pending events
    {
        QuorumValidator q(2, 1.0, clock, 60.0);
        CriticalEvent pending = q.report(EventType::NODE_FAILURE, "A", {});
        CriticalEvent done = q.report(EventType::NODE_FAILURE, "B", {});
        q.validate(done, "v1", sig("1"));
        assert(q.validate(done, "v2", sig("2")));
        clock.advance(59.0);
        assert(q.evictExpired() == 0);
        clock.advance(1.0);
        assert(q.evictExpired() == 1);
        assert(!q.find(EventType::NODE_FAILURE, "A"));
        assert(q.find(EventType::NODE_FAILURE, "B")->validated);
        (void)pending;
    }

    // without a TTL pending events stay forever
    {
        QuorumValidator q(4, 0.75, clock);
        q.report(EventType::NODE_FAILURE, "old", {});
        clock.advance(1e6);
        assert(q.evictExpired() == 0);
        assert(q.pendingCount() == 1);
    }

    // evidence survives JSON, with infinite latency written as "inf"
    {
        Evidence ev{LatencyEvidence{std::numeric_limits<double>::infinity()},
                    PacketLossEvidence{1.0}, SilenceEvidence{1700000000.5, 31.0}};
        Json::Value j = evidenceToJson(ev);
        assert(j["latency"].asString() == "inf");
        Evidence back = evidenceFromJson(j);
        assert(back.size() == 3);
        assert(std::isinf(std::get<LatencyEvidence>(back[0]).latencyMs));
        assert(std::get<PacketLossEvidence>(back[1]).ratio == 1.0);
        assert(std::get<SilenceEvidence>(back[2]).elapsed == 31.0);
    }

    std::cout << "quorum_validator_test OK\n";
    return 0;
}
