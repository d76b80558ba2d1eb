#include "config.h"
#include "logging.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

MeshConfig& getMeshConfig() {
    static MeshConfig cfg;
    return cfg;
}

namespace {

std::string trim(std::string value) {
    auto notSpace = [](int ch) { return std::isspace(ch) == 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

bool parseBool(std::string value) {
    value = trim(std::move(value));
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

// std::stod/stoi accept trailing garbage; reject it so "5s" is not read as 5.
double strictDouble(const std::string &text) {
    std::size_t used = 0;
    double v = std::stod(text, &used);
    if (used != text.size())
        throw std::invalid_argument("trailing characters");
    return v;
}

long strictLong(const std::string &text) {
    std::size_t used = 0;
    long v = std::stol(text, &used);
    if (used != text.size())
        throw std::invalid_argument("trailing characters");
    return v;
}

void setDouble(const std::string &key, const std::string &value, double &field,
               double minVal, double maxVal) {
    try {
        double v = strictDouble(value);
        if (v < minVal || v > maxVal) {
            LOG_W("[config]") << "⚠️ " << key << "=" << value << " out of range, keeping "
                              << field;
            return;
        }
        field = v;
    } catch (const std::exception &) {
        LOG_W("[config]") << "⚠️ malformed " << key << "=" << value << ", keeping " << field;
    }
}

template <typename Int>
void setInt(const std::string &key, const std::string &value, Int &field, long minVal,
            long maxVal) {
    try {
        long v = strictLong(value);
        if (v < minVal || v > maxVal) {
            LOG_W("[config]") << "⚠️ " << key << "=" << value << " out of range, keeping "
                              << field;
            return;
        }
        field = static_cast<Int>(v);
    } catch (const std::exception &) {
        LOG_W("[config]") << "⚠️ malformed " << key << "=" << value << ", keeping " << field;
    }
}

} // namespace

std::optional<PeerEndpoint> parsePeerEndpoint(const std::string &text) {
    std::string value = trim(text);
    auto colon = value.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= value.size())
        return std::nullopt;
    PeerEndpoint ep;
    ep.host = value.substr(0, colon);
    try {
        long port = strictLong(value.substr(colon + 1));
        if (port <= 0 || port > 65535)
            return std::nullopt;
        ep.port = static_cast<unsigned short>(port);
    } catch (const std::exception &) {
        return std::nullopt;
    }
    return ep;
}

bool loadConfigFile(const std::string &path, MeshConfig &cfg) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_W("[config]") << "⚠️ cannot open config file " << path;
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_W("[config]") << "⚠️ ignoring line without '=': " << line;
            continue;
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));

        if (key == "node_id") {
            if (!value.empty())
                cfg.node_id = value;
        } else if (key == "listen_port") {
            setInt(key, value, cfg.listen_port, 1, 65535);
        } else if (key == "peer") {
            if (auto ep = parsePeerEndpoint(value))
                cfg.peers.push_back(*ep);
            else
                LOG_W("[config]") << "⚠️ malformed peer endpoint " << value;
        } else if (key == "total_nodes") {
            setInt(key, value, cfg.total_nodes, 1, 1000000);
        } else if (key == "quorum_threshold") {
            setDouble(key, value, cfg.quorum_threshold, 1e-9, 1.0);
        } else if (key == "pending_event_ttl") {
            setDouble(key, value, cfg.pending_event_ttl, 0.0, 1e9);
        } else if (key == "peer_timeout") {
            setDouble(key, value, cfg.peer_timeout, 0.001, 1e9);
        } else if (key == "health_check_interval") {
            setDouble(key, value, cfg.health_check_interval, 0.001, 1e9);
        } else if (key == "beacon_interval") {
            setDouble(key, value, cfg.beacon_interval, 0.001, 1e9);
        } else if (key == "require_signed_beacons") {
            cfg.require_signed_beacons = parseBool(value);
        } else if (key == "rate_limit_per_second") {
            setInt(key, value, cfg.rate_limit_per_second, 1, 1000000000);
        } else if (key == "quarantine_seconds") {
            setDouble(key, value, cfg.quarantine_seconds, 0.0, 1e9);
        } else if (key == "key_rotation_interval") {
            setDouble(key, value, cfg.key_rotation_interval, 0.0, 1e9);
        } else if (key == "pheromone_decay_rate") {
            setDouble(key, value, cfg.pheromone_decay_rate, 0.0, 1.0);
        } else if (key == "pheromone_boost") {
            setDouble(key, value, cfg.pheromone_boost, 0.0, 1e9);
        } else if (key == "pheromone_min") {
            setDouble(key, value, cfg.pheromone_min, 0.0, 1e9);
        } else if (key == "decay_interval") {
            setDouble(key, value, cfg.decay_interval, 0.001, 1e9);
        } else if (key == "metrics_interval") {
            setDouble(key, value, cfg.metrics_interval, 0.0, 1e9);
        } else if (key == "acl_policy_file") {
            cfg.acl_policy_file = value;
        } else if (key == "log_level") {
            cfg.log_level = value;
        } else {
            LOG_W("[config]") << "⚠️ unknown key " << key;
        }
    }
    return true;
}

void applyEnvOverrides(MeshConfig &cfg) {
    auto applyEnvDouble = [](const char *name, double &field, double minVal, double maxVal) {
        if (const char *env = std::getenv(name))
            setDouble(name, env, field, minVal, maxVal);
    };

    if (const char *env = std::getenv("NODE_ID")) {
        if (*env)
            cfg.node_id = env;
    }
    if (const char *env = std::getenv("TOTAL_NODES"))
        setInt("TOTAL_NODES", env, cfg.total_nodes, 1, 1000000);
    applyEnvDouble("QUORUM_THRESHOLD", cfg.quorum_threshold, 1e-9, 1.0);
    applyEnvDouble("PEER_TIMEOUT", cfg.peer_timeout, 0.001, 1e9);
    applyEnvDouble("HEALTH_CHECK_INTERVAL", cfg.health_check_interval, 0.001, 1e9);
    applyEnvDouble("PHEROMONE_DECAY_RATE", cfg.pheromone_decay_rate, 0.0, 1.0);
    applyEnvDouble("PHEROMONE_BOOST", cfg.pheromone_boost, 0.0, 1e9);
    applyEnvDouble("PHEROMONE_MIN", cfg.pheromone_min, 0.0, 1e9);
    applyEnvDouble("DECAY_INTERVAL", cfg.decay_interval, 0.001, 1e9);
}
