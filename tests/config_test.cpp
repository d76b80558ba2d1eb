#include "config.h"
#include "node/mesh_session.h"
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

int main() {
    // defaults
    {
        MeshConfig cfg;
        assert(cfg.total_nodes == 10);
        assert(cfg.quorum_threshold == 0.67);
        assert(cfg.peer_timeout == 30.0);
        assert(cfg.health_check_interval == 5.0);
        assert(cfg.pheromone_decay_rate == 0.9);
        assert(cfg.pheromone_boost == 10.0);
        assert(cfg.pheromone_min == 1.0);
        assert(cfg.decay_interval == 1.0);
        assert(cfg.rate_limit_per_second == 100);
        assert(cfg.quarantine_seconds == 300.0);
        assert(cfg.pending_event_ttl == 0.0);
        assert(cfg.require_signed_beacons);
    }

    // file values, comments, repeatable peers and malformed entries
    {
        const std::string path = "config_test.ini";
        {
            std::ofstream out(path);
            out << "# mesh node\n"
                << "node_id = node-07\n"
                << "listen_port=9000\n"
                << "peer=10.0.0.2:7946\n"
                << "peer=mesh-3.local:7000\n"
                << "peer=missing-port\n"
                << "total_nodes=5\n"
                << "quorum_threshold=0.8\n"
                << "peer_timeout=12.5\n"
                << "beacon_interval=2\n"
                << "rate_limit_per_second=abc\n"
                << "quarantine_seconds=5s\n"
                << "pending_event_ttl=600\n"
                << "key_rotation_interval=3600\n"
                << "require_signed_beacons=no\n"
                << "pheromone_decay_rate=1.5\n"
                << "acl_policy_file=/etc/stigmesh/acl.json\n"
                << "log_level=debug\n"
                << "not a setting\n";
        }
        MeshConfig cfg;
        assert(loadConfigFile(path, cfg));
        std::remove(path.c_str());

        assert(cfg.node_id == "node-07");
        assert(cfg.listen_port == 9000);
        assert(cfg.peers.size() == 2);
        assert(cfg.peers[0].host == "10.0.0.2" && cfg.peers[0].port == 7946);
        assert(cfg.peers[1].host == "mesh-3.local" && cfg.peers[1].port == 7000);
        assert(cfg.total_nodes == 5);
        assert(cfg.quorum_threshold == 0.8);
        assert(cfg.peer_timeout == 12.5);
        assert(cfg.beacon_interval == 2.0);
        assert(cfg.rate_limit_per_second == 100);       // malformed, kept
        assert(cfg.quarantine_seconds == 300.0);        // trailing junk, kept
        assert(cfg.pending_event_ttl == 600.0);
        assert(cfg.key_rotation_interval == 3600.0);
        assert(!cfg.require_signed_beacons);
        assert(cfg.pheromone_decay_rate == 0.9);        // out of range, kept
        assert(cfg.acl_policy_file == "/etc/stigmesh/acl.json");
        assert(cfg.log_level == "debug");

        SessionOptions o = SessionOptions::fromConfig(cfg);
        assert(o.nodeId == "node-07" && o.totalNodes == 5);
        assert(o.pendingEventTtl == 600.0 && !o.requireSignedBeacons);
        assert(o.limits.quarantineSeconds == 300.0);

        MeshConfig untouched;
        assert(!loadConfigFile("no-such-config.ini", untouched));
    }

    // environment overrides
    {
        setenv("NODE_ID", "env-node", 1);
        setenv("TOTAL_NODES", "20", 1);
        setenv("QUORUM_THRESHOLD", "0.75", 1);
        setenv("PEER_TIMEOUT", "45", 1);
        setenv("HEALTH_CHECK_INTERVAL", "2.5", 1);
        setenv("PHEROMONE_DECAY_RATE", "0.8", 1);
        setenv("PHEROMONE_BOOST", "4", 1);
        setenv("PHEROMONE_MIN", "2", 1);
        setenv("DECAY_INTERVAL", "bogus", 1);
        MeshConfig cfg;
        applyEnvOverrides(cfg);
        assert(cfg.node_id == "env-node");
        assert(cfg.total_nodes == 20);
        assert(cfg.quorum_threshold == 0.75);
        assert(cfg.peer_timeout == 45.0);
        assert(cfg.health_check_interval == 2.5);
        assert(cfg.pheromone_decay_rate == 0.8);
        assert(cfg.pheromone_boost == 4.0);
        assert(cfg.pheromone_min == 2.0);
        assert(cfg.decay_interval == 1.0);
        for (const char* name : {"NODE_ID", "TOTAL_NODES", "QUORUM_THRESHOLD", "PEER_TIMEOUT",
                                 "HEALTH_CHECK_INTERVAL", "PHEROMONE_DECAY_RATE",
                                 "PHEROMONE_BOOST", "PHEROMONE_MIN", "DECAY_INTERVAL"})
            unsetenv(name);
    }

    // endpoint parsing
    {
        assert(parsePeerEndpoint("host:1")->port == 1);
        assert(!parsePeerEndpoint("host:0"));
        assert(!parsePeerEndpoint("host:70000"));
        assert(!parsePeerEndpoint(":7946"));
        assert(!parsePeerEndpoint("host:"));
    }

    std::cout << "config_test OK\n";
    return 0;
}
