#include "routing/stigmergy_router.h"
#include "logging.h"

#include <algorithm>

StigmergyRouter::StigmergyRouter(std::string localNodeId, const Clock& clock,
                                 PheromoneParams params)
    : localNodeId_(std::move(localNodeId)), clock_(clock), params_(params) {}

bool StigmergyRouter::isAllowedLocked(const std::string& destination) const {
    static const std::set<std::string> noTags;
    auto src = peerTags_.find(localNodeId_);
    auto dst = peerTags_.find(destination);
    return aclAllows(policies_, src == peerTags_.end() ? noTags : src->second,
                     dst == peerTags_.end() ? noTags : dst->second);
}

bool StigmergyRouter::isAllowed(const std::string& destination) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return isAllowedLocked(destination);
}

bool StigmergyRouter::reinforce(const std::string& destination, const std::string& nextHop,
                                bool success) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!isAllowedLocked(destination)) {
        LOG_T("[router]") << "ACL denies " << localNodeId_ << " -> " << destination;
        return false;
    }
    if (unroutable_.count(destination) || unroutable_.count(nextHop))
        return false;

    auto& hops = table_[destination];
    auto it = hops.find(nextHop);
    if (it == hops.end())
        it = hops.emplace(nextHop, RoutePheromone{nextHop, params_.minScore, 0.0}).first;

    RoutePheromone& p = it->second;
    if (success)
        p.score += params_.boost;
    else
        p.score *= PHEROMONE_FAILURE_FACTOR;
    p.lastUpdated = clock_.now();

    LOG_T("[router]") << (success ? "reinforced " : "punished ") << destination << " via "
                      << nextHop << " -> " << p.score;
    return true;
}

std::vector<std::string> StigmergyRouter::getRedundantPaths(const std::string& destination,
                                                            std::size_t limit) const {
    std::vector<RoutePheromone> eligible;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = table_.find(destination);
        if (it == table_.end())
            return {};
        for (const auto& kv : it->second)
            if (kv.second.score >= params_.minScore)
                eligible.push_back(kv.second);
    }

    // Ties fall back to next-hop name so the order is deterministic.
    std::sort(eligible.begin(), eligible.end(),
              [](const RoutePheromone& a, const RoutePheromone& b) {
                  if (a.score != b.score)
                      return a.score > b.score;
                  return a.nextHop < b.nextHop;
              });
    if (eligible.size() > limit)
        eligible.resize(limit);

    std::vector<std::string> out;
    out.reserve(eligible.size());
    for (const auto& p : eligible)
        out.push_back(p.nextHop);
    return out;
}

std::optional<std::string> StigmergyRouter::getBestRoute(const std::string& destination) const {
    auto paths = getRedundantPaths(destination, 1);
    if (paths.empty())
        return std::nullopt;
    return paths.front();
}

std::optional<double> StigmergyRouter::score(const std::string& destination,
                                             const std::string& nextHop) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto d = table_.find(destination);
    if (d == table_.end())
        return std::nullopt;
    auto h = d->second.find(nextHop);
    if (h == d->second.end())
        return std::nullopt;
    return h->second.score;
}

std::size_t StigmergyRouter::evaporate() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t pruned = 0;
    for (auto d = table_.begin(); d != table_.end();) {
        auto& hops = d->second;
        for (auto h = hops.begin(); h != hops.end();) {
            h->second.score *= params_.decayRate;
            if (h->second.score < PHEROMONE_PRUNE_THRESHOLD) {
                h = hops.erase(h);
                ++pruned;
            } else {
                ++h;
            }
        }
        if (hops.empty())
            d = table_.erase(d);
        else
            ++d;
    }
    if (pruned > 0)
        LOG_D("[router]") << "evaporation pruned " << pruned << " route(s)";
    return pruned;
}

void StigmergyRouter::updatePolicies(std::vector<AclRule> policies, PeerTags peerTags) {
    std::lock_guard<std::mutex> lock(mtx_);
    policies_ = std::move(policies);
    peerTags_ = std::move(peerTags);
    LOG_I("[router]") << "ACL updated: " << policies_.size() << " rule(s), "
                      << peerTags_.size() << " tagged peer(s)"
                      << (policies_.empty() ? " (open mode)" : " (zero-trust)");
}

std::size_t StigmergyRouter::dropNextHopLocked(const std::string& nextHop) {
    std::size_t dropped = 0;
    for (auto d = table_.begin(); d != table_.end();) {
        dropped += d->second.erase(nextHop);
        if (d->second.empty())
            d = table_.erase(d);
        else
            ++d;
    }
    return dropped;
}

std::size_t StigmergyRouter::dropNextHop(const std::string& nextHop) {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropNextHopLocked(nextHop);
}

void StigmergyRouter::markUnroutable(const std::string& node) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!unroutable_.insert(node).second)
        return;
    std::size_t dropped = dropNextHopLocked(node);
    auto d = table_.find(node);
    if (d != table_.end()) {
        dropped += d->second.size();
        table_.erase(d);
    }
    LOG_I("[router]") << "🚧 " << node << " excluded from routing (" << dropped
                      << " route(s) dropped)";
}

bool StigmergyRouter::isUnroutable(const std::string& node) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return unroutable_.count(node) > 0;
}

std::map<std::string, std::vector<RoutePheromone>> StigmergyRouter::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::map<std::string, std::vector<RoutePheromone>> out;
    for (const auto& d : table_)
        for (const auto& h : d.second)
            out[d.first].push_back(h.second);
    return out;
}

std::size_t StigmergyRouter::routeCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = 0;
    for (const auto& d : table_)
        n += d.second.size();
    return n;
}

std::size_t StigmergyRouter::destinationCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return table_.size();
}
