#pragma once
#include <atomic>
#include <initializer_list>
#include <mutex>
#include <string>
#include <vector>
namespace metrics {
struct Gauge {
    std::string name;
    std::string help;
    std::atomic<double> value{0};
    Gauge(const std::string& n, const std::string& h) : name(n), help(h) {}
    void set(double v) { value.store(v); }
};
extern Gauge mesh_peers_count;
extern Gauge mesh_dead_peers_count;
extern Gauge mesh_validated_failures_count;
extern Gauge mesh_quarantined_nodes_count;
extern Gauge mesh_routes_count;
extern Gauge mesh_beacons_total;
extern Gauge mesh_pending_events_count;
extern std::mutex gaugeMutex;
std::string toPrometheus();
}
