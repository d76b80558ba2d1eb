#include "gossip/signed_envelope.h"
#include <memory>
#include <sstream>

std::string messageTypeToString(MessageType type) {
    switch (type) {
    case MessageType::BEACON:
        return "BEACON";
    case MessageType::FAILURE_REPORT:
        return "FAILURE_REPORT";
    case MessageType::LINK_DOWN_REPORT:
        return "LINK_DOWN_REPORT";
    }
    return "UNKNOWN";
}

std::optional<MessageType> messageTypeFromString(const std::string& name) {
    if (name == "BEACON") return MessageType::BEACON;
    if (name == "FAILURE_REPORT") return MessageType::FAILURE_REPORT;
    if (name == "LINK_DOWN_REPORT") return MessageType::LINK_DOWN_REPORT;
    return std::nullopt;
}

std::string canonicalJson(const Json::Value& value) {
    // Json::Value keeps object members in a std::map, so the writer already
    // emits keys in sorted order at every nesting level.
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["commentStyle"] = "None";
    writer["precision"] = 17;
    writer["precisionType"] = "significant";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, value);
}

std::optional<Json::Value> parseJson(const std::string& text) {
    Json::CharReaderBuilder reader;
    reader["collectComments"] = false;
    std::unique_ptr<Json::CharReader> parser(reader.newCharReader());
    Json::Value out;
    std::string errs;
    if (!parser->parse(text.data(), text.data() + text.size(), &out, &errs))
        return std::nullopt;
    return out;
}

std::string SignedEnvelope::serialize() const {
    Json::Value j(Json::objectValue);
    j["msg_type"] = messageTypeToString(msgType);
    j["sender"] = sender;
    j["timestamp"] = timestamp;
    j["nonce"] = static_cast<Json::UInt64>(nonce);
    j["epoch"] = static_cast<Json::UInt64>(epoch);
    j["payload"] = payload;
    j["public_key"] = Crypto::toHex(publicKey);
    return canonicalJson(j);
}

Bytes SignedEnvelope::signingInput() const {
    return Crypto::stringToBytes(serialize());
}

Json::Value SignedEnvelope::toJson() const {
    Json::Value j(Json::objectValue);
    j["msg_type"] = messageTypeToString(msgType);
    j["sender"] = sender;
    j["timestamp"] = timestamp;
    j["nonce"] = static_cast<Json::UInt64>(nonce);
    j["epoch"] = static_cast<Json::UInt64>(epoch);
    j["payload"] = payload;
    j["signature"] = Crypto::toHex(signature);
    j["public_key"] = Crypto::toHex(publicKey);
    return j;
}

std::optional<SignedEnvelope> SignedEnvelope::fromJson(const Json::Value& j) {
    if (!j.isObject())
        return std::nullopt;
    auto type = messageTypeFromString(j.get("msg_type", "").asString());
    if (!type || !j["sender"].isString() || !j["nonce"].isIntegral() ||
        !j["epoch"].isIntegral() || !j["timestamp"].isNumeric())
        return std::nullopt;

    SignedEnvelope env;
    env.msgType = *type;
    env.sender = j["sender"].asString();
    env.timestamp = j["timestamp"].asDouble();
    env.nonce = j["nonce"].asUInt64();
    env.epoch = j["epoch"].asUInt64();
    env.payload = j.isMember("payload") ? j["payload"] : Json::Value(Json::objectValue);

    auto sig = Crypto::safeFromHex(j.get("signature", "").asString(), "envelope.signature");
    auto pub = Crypto::safeFromHex(j.get("public_key", "").asString(), "envelope.public_key");
    if (!sig || !pub)
        return std::nullopt;
    env.signature = std::move(*sig);
    env.publicKey = std::move(*pub);
    return env;
}
