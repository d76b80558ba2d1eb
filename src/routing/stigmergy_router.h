#ifndef STIGMERGY_ROUTER_H
#define STIGMERGY_ROUTER_H

#include "clock.h"
#include "constants.h"
#include "routing/tag_policy.h"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct RoutePheromone {
    std::string nextHop;
    double score{0.0};
    double lastUpdated{0.0};
};

struct PheromoneParams {
    double decayRate{DEFAULT_PHEROMONE_DECAY_RATE};
    double boost{DEFAULT_PHEROMONE_BOOST};
    double minScore{DEFAULT_PHEROMONE_MIN};
};

// Pheromone table keyed by (destination, next hop). Successful sends add
// `boost`, failures halve the score, evaporate() multiplies everything by
// `decayRate` and prunes pairs that fall under 0.1. Only pairs scoring at
// least `minScore` are offered as routes.
class StigmergyRouter {
public:
    explicit StigmergyRouter(std::string localNodeId,
                             const Clock& clock = SystemClock::instance(),
                             PheromoneParams params = {});

    // Returns false (and changes nothing) when the ACL denies the destination
    // or either node has been made unroutable.
    bool reinforce(const std::string& destination, const std::string& nextHop,
                   bool success);

    std::optional<std::string> getBestRoute(const std::string& destination) const;
    std::vector<std::string> getRedundantPaths(const std::string& destination,
                                               std::size_t limit = DEFAULT_REDUNDANT_PATHS) const;
    std::optional<double> score(const std::string& destination,
                                const std::string& nextHop) const;

    // Returns the number of pairs pruned.
    std::size_t evaporate();

    void updatePolicies(std::vector<AclRule> policies, PeerTags peerTags);
    bool isAllowed(const std::string& destination) const;

    std::size_t dropNextHop(const std::string& nextHop);
    void markUnroutable(const std::string& node);
    bool isUnroutable(const std::string& node) const;

    std::map<std::string, std::vector<RoutePheromone>> snapshot() const;
    std::size_t routeCount() const;
    std::size_t destinationCount() const;
    const PheromoneParams& params() const { return params_; }

private:
    bool isAllowedLocked(const std::string& destination) const;
    std::size_t dropNextHopLocked(const std::string& nextHop);

    const std::string localNodeId_;
    const Clock& clock_;
    const PheromoneParams params_;

    mutable std::mutex mtx_;
    std::map<std::string, std::map<std::string, RoutePheromone>> table_;
    std::vector<AclRule> policies_;
    PeerTags peerTags_;
    std::set<std::string> unroutable_;
};

#endif // STIGMERGY_ROUTER_H
