#ifndef SIGNED_ENVELOPE_H
#define SIGNED_ENVELOPE_H

#include "crypto_utils.h"
#include <cstdint>
#include <json/json.h>
#include <optional>
#include <string>

enum class MessageType {
    BEACON,
    FAILURE_REPORT,
    LINK_DOWN_REPORT
};

std::string messageTypeToString(MessageType type);
std::optional<MessageType> messageTypeFromString(const std::string& name);

// Signed control message. The signature covers serialize(), which is the
// key-sorted JSON encoding of every field except the signature itself.
struct SignedEnvelope {
    MessageType msgType{MessageType::BEACON};
    std::string sender;
    double timestamp{0.0};
    uint64_t nonce{0};
    uint64_t epoch{0};
    Json::Value payload{Json::objectValue};
    Bytes signature;
    Bytes publicKey;

    std::string serialize() const;
    Bytes signingInput() const;

    Json::Value toJson() const;
    static std::optional<SignedEnvelope> fromJson(const Json::Value& j);
};

// Compact, deterministic JSON text (no whitespace, sorted keys).
std::string canonicalJson(const Json::Value& value);
std::optional<Json::Value> parseJson(const std::string& text);

#endif // SIGNED_ENVELOPE_H
