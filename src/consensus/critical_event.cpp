#include "consensus/critical_event.h"
#include <cmath>
#include <limits>
#include <type_traits>

std::string eventTypeToString(EventType type) {
    switch (type) {
    case EventType::NODE_FAILURE:
        return "NODE_FAILURE";
    case EventType::LINK_DOWN:
        return "LINK_DOWN";
    }
    return "UNKNOWN";
}

Json::Value evidenceToJson(const Evidence& evidence) {
    Json::Value j(Json::objectValue);
    for (const auto& item : evidence) {
        std::visit(
            [&j](const auto& ev) {
                using T = std::decay_t<decltype(ev)>;
                if constexpr (std::is_same_v<T, LatencyEvidence>) {
                    // JSON has no infinity
                    if (std::isinf(ev.latencyMs))
                        j["latency"] = "inf";
                    else
                        j["latency"] = ev.latencyMs;
                } else if constexpr (std::is_same_v<T, PacketLossEvidence>) {
                    j["packet_loss"] = ev.ratio;
                } else if constexpr (std::is_same_v<T, SilenceEvidence>) {
                    j["last_seen"] = ev.lastSeen;
                    j["elapsed"] = ev.elapsed;
                } else if constexpr (std::is_same_v<T, LinkEvidence>) {
                    j["link"]["from"] = ev.from;
                    j["link"]["to"] = ev.to;
                }
            },
            item);
    }
    return j;
}

Evidence evidenceFromJson(const Json::Value& j) {
    Evidence out;
    if (!j.isObject())
        return out;

    const auto& lat = j["latency"];
    if (lat.isNumeric())
        out.push_back(LatencyEvidence{lat.asDouble()});
    else if (lat.isString() && lat.asString() == "inf")
        out.push_back(LatencyEvidence{std::numeric_limits<double>::infinity()});

    if (j["packet_loss"].isNumeric())
        out.push_back(PacketLossEvidence{j["packet_loss"].asDouble()});

    if (j["last_seen"].isNumeric() || j["elapsed"].isNumeric())
        out.push_back(SilenceEvidence{j.get("last_seen", 0.0).asDouble(),
                                      j.get("elapsed", 0.0).asDouble()});

    const auto& link = j["link"];
    if (link.isObject() && link["from"].isString() && link["to"].isString())
        out.push_back(LinkEvidence{link["from"].asString(), link["to"].asString()});
    return out;
}

std::string eventKey(EventType type, const std::string& target) {
    return eventTypeToString(type) + ":" + target;
}

std::string CriticalEvent::key() const {
    return eventKey(eventType, target);
}

std::string CriticalEvent::id() const {
    return key() + ":" + std::to_string(static_cast<long long>(timestamp));
}

Json::Value CriticalEvent::toJson() const {
    Json::Value j;
    j["event_id"] = id();
    j["event_type"] = eventTypeToString(eventType);
    j["target"] = target;
    j["evidence"] = evidenceToJson(evidence);
    j["timestamp"] = timestamp;
    j["validated"] = validated;
    j["signatures"] = Json::Value(Json::arrayValue);
    for (const auto& kv : signatures)
        j["signatures"].append(kv.first);
    return j;
}
