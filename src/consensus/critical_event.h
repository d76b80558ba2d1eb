#ifndef CRITICAL_EVENT_H
#define CRITICAL_EVENT_H

#include "crypto_utils.h"
#include <json/json.h>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class EventType {
    NODE_FAILURE,
    LINK_DOWN
};

std::string eventTypeToString(EventType type);

// Evidence kinds attached to a critical event.
struct LatencyEvidence {
    double latencyMs;          // infinity when the target never answered
};
struct PacketLossEvidence {
    double ratio;              // 0.0 .. 1.0
};
struct SilenceEvidence {
    double lastSeen;           // unix seconds of the last beacon
    double elapsed;            // seconds of silence when reported
};
struct LinkEvidence {
    std::string from;
    std::string to;
};

using EvidenceItem =
    std::variant<LatencyEvidence, PacketLossEvidence, SilenceEvidence, LinkEvidence>;
using Evidence = std::vector<EvidenceItem>;

Json::Value evidenceToJson(const Evidence& evidence);
Evidence evidenceFromJson(const Json::Value& j);

struct CriticalEvent {
    EventType eventType{EventType::NODE_FAILURE};
    std::string target;
    Evidence evidence;
    double timestamp{0.0};
    std::map<std::string, Bytes> signatures;   // validator id -> signature
    bool validated{false};
    std::optional<double> validatedAt;

    std::string key() const;   // "<type>:<target>", one pending event per key
    std::string id() const;    // "<type>:<target>:<unix seconds>"
    std::size_t signatureCount() const { return signatures.size(); }
    Json::Value toJson() const;
};

std::string eventKey(EventType type, const std::string& target);

#endif // CRITICAL_EVENT_H
