#include "metrics/metrics.h"
#include <sstream>
namespace metrics {
Gauge mesh_peers_count{"mesh_peers_count", "Active peers in the registry"};
Gauge mesh_dead_peers_count{"mesh_dead_peers_count", "Peers currently believed dead"};
Gauge mesh_validated_failures_count{"mesh_validated_failures_count",
                                    "Node failures confirmed by quorum"};
Gauge mesh_quarantined_nodes_count{"mesh_quarantined_nodes_count", "Quarantined senders"};
Gauge mesh_routes_count{"mesh_routes_count", "Tracked (destination, next hop) pheromone pairs"};
Gauge mesh_beacons_total{"mesh_beacons_total", "Beacons received since start"};
Gauge mesh_pending_events_count{"mesh_pending_events_count",
                                "Critical events waiting for quorum"};
std::mutex gaugeMutex;
std::string toPrometheus() {
    std::lock_guard<std::mutex> lk(gaugeMutex);
    std::ostringstream os;
    for (const Gauge* g : {&mesh_peers_count, &mesh_dead_peers_count,
                           &mesh_validated_failures_count, &mesh_quarantined_nodes_count,
                           &mesh_routes_count, &mesh_beacons_total,
                           &mesh_pending_events_count}) {
        os << "# HELP " << g->name << " " << g->help << "\n";
        os << "# TYPE " << g->name << " gauge\n";
        os << g->name << " " << g->value.load() << "\n";
    }
    return os.str();
}
} // namespace metrics
