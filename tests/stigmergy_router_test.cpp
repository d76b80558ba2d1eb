#include "clock.h"
#include "routing/stigmergy_router.h"
#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

int main() {
    ManualClock clock;

    // five successes from baseline, then one failure
    {
        StigmergyRouter r("self", clock);
        for (int i = 0; i < 5; ++i)
            assert(r.reinforce("A", "B", true));
        assert(near(*r.score("A", "B"), 51.0));
        assert(r.reinforce("A", "B", false));
        assert(near(*r.score("A", "B"), 25.5));
        assert(*r.getBestRoute("A") == "B");
        assert(r.snapshot()["A"][0].lastUpdated == clock.now());
    }

    // a first failure starts at baseline and halves it below the eligibility floor
    {
        StigmergyRouter r("self", clock);
        r.reinforce("A", "C", false);
        assert(near(*r.score("A", "C"), 0.5));
        assert(r.getRedundantPaths("A").empty());
        assert(!r.getBestRoute("A"));
        assert(!r.getBestRoute("unknown"));
    }

    // redundant paths: at most `limit`, strictly by score, ties by next hop
    {
        StigmergyRouter r("self", clock);
        r.reinforce("D", "h1", true);                         // 11
        r.reinforce("D", "h2", true);
        r.reinforce("D", "h2", true);                         // 21
        r.reinforce("D", "h3", true);
        r.reinforce("D", "h3", true);
        r.reinforce("D", "h3", true);                         // 31
        r.reinforce("D", "h4", true);
        r.reinforce("D", "h4", false);                        // 5.5
        r.reinforce("D", "h5", false);                        // 0.5, ineligible
        auto paths = r.getRedundantPaths("D");
        assert(paths.size() == 3);
        assert(paths[0] == "h3" && paths[1] == "h2" && paths[2] == "h1");
        auto all = r.getRedundantPaths("D", 10);
        assert(all.size() == 4 && all[3] == "h4");
        assert(r.getRedundantPaths("D", 1) == std::vector<std::string>{"h3"});

        StigmergyRouter t("self", clock);
        t.reinforce("E", "zeta", true);
        t.reinforce("E", "alpha", true);
        assert(*t.getBestRoute("E") == "alpha");
    }

    // evaporation multiplies by 0.9, prunes below 0.1, drops empty destinations
    {
        StigmergyRouter r("self", clock);
        r.reinforce("A", "B", true);                          // 11
        r.reinforce("X", "Y", false);                         // 0.5
        assert(r.destinationCount() == 2);
        assert(r.evaporate() == 0);
        assert(near(*r.score("A", "B"), 9.9));
        assert(near(*r.score("X", "Y"), 0.45));
        // 0.45 * 0.9^15 = 0.0926
        std::size_t pruned = 0;
        for (int i = 0; i < 15; ++i)
            pruned += r.evaporate();
        assert(pruned == 1);
        assert(!r.score("X", "Y"));
        assert(r.destinationCount() == 1);
        assert(r.routeCount() == 1);

        // a pruned pair comes back at baseline
        r.reinforce("X", "Y", true);
        assert(near(*r.score("X", "Y"), 11.0));
    }

    // custom pheromone parameters
    {
        StigmergyRouter r("self", clock, PheromoneParams{0.5, 2.0, 3.0});
        r.reinforce("A", "B", true);
        assert(near(*r.score("A", "B"), 5.0));
        r.evaporate();
        assert(near(*r.score("A", "B"), 2.5));
        assert(r.getRedundantPaths("A").empty());
    }

    // ACL: empty policy allows everything, otherwise default deny
    {
        StigmergyRouter r("self", clock);
        assert(r.isAllowed("anything"));

        PeerTags tags{{"self", {"core"}}, {"edge-1", {"edge"}}, {"db-1", {"db"}}};
        r.updatePolicies({AclRule{"core", "edge", AclAction::ALLOW}}, tags);
        assert(r.isAllowed("edge-1"));
        assert(!r.isAllowed("db-1"));
        assert(!r.isAllowed("untagged"));

        assert(r.reinforce("edge-1", "edge-1", true));
        assert(!r.reinforce("db-1", "db-1", true));
        assert(!r.score("db-1", "db-1"));
        assert(r.routeCount() == 1);

        // first match wins, "*" matches any tag
        r.updatePolicies({AclRule{"*", "db", AclAction::DENY},
                          AclRule{"*", "*", AclAction::ALLOW}},
                         tags);
        assert(!r.isAllowed("db-1"));
        assert(r.isAllowed("untagged"));

        r.updatePolicies({}, {});
        assert(r.isAllowed("db-1"));
    }

    // ACL document loading
    {
        const std::string path = "stigmergy_router_test_acl.json";
        {
            std::ofstream out(path);
            out << R"({"policies":[{"source":"*","target":"edge","action":"allow"}],)"
                << R"("peer_tags":{"node-02":["edge"]}})";
        }
        AclPolicySet set = AclPolicySet::loadFile(path);
        assert(set.rules.size() == 1 && set.rules[0].action == AclAction::ALLOW);
        assert(set.peerTags["node-02"].count("edge") == 1);
        Json::Value doc = set.toJson();
        assert(doc["policies"][0]["action"].asString() == "allow");
        assert(AclPolicySet::fromJson(doc).peerTags == set.peerTags);
        StigmergyRouter r("node-01", clock);
        r.updatePolicies(set.rules, set.peerTags);
        assert(r.isAllowed("node-02"));
        assert(!r.isAllowed("node-03"));

        {
            std::ofstream out(path);
            out << R"({"policies":[{"source":"*","target":"edge","action":"maybe"}]})";
        }
        bool threw = false;
        try {
            AclPolicySet::loadFile(path);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        std::remove(path.c_str());

        threw = false;
        try {
            AclPolicySet::loadFile("does-not-exist.json");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    // dead next hops and unroutable nodes
    {
        StigmergyRouter r("self", clock);
        r.reinforce("A", "B", true);
        r.reinforce("A", "C", true);
        r.reinforce("B", "B", true);
        r.reinforce("Z", "C", true);
        assert(r.dropNextHop("C") == 2);
        assert(r.destinationCount() == 2);
        assert(*r.getBestRoute("A") == "B");

        r.markUnroutable("B");
        assert(r.isUnroutable("B"));
        assert(r.routeCount() == 0);
        assert(!r.reinforce("A", "B", true));
        assert(!r.reinforce("B", "D", true));
        assert(r.reinforce("A", "D", true));
    }

    std::cout << "stigmergy_router_test OK\n";
    return 0;
}
