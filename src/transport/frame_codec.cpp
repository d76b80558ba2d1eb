#include "transport/frame_codec.h"
#include "constants.h"
#include "logging.h"
#include <generated/mesh_frame.pb.h>

bool encodeFrame(const SignedEnvelope& envelope, std::string& out) {
    stigmesh::net::Frame fr;
    fr.set_version(MESH_FRAME_VERSION);
    auto* env = fr.mutable_envelope();
    env->set_msg_type(messageTypeToString(envelope.msgType));
    env->set_sender(envelope.sender);
    env->set_timestamp(envelope.timestamp);
    env->set_nonce(envelope.nonce);
    env->set_epoch(envelope.epoch);
    env->set_payload_json(canonicalJson(envelope.payload));
    env->set_signature(std::string(envelope.signature.begin(), envelope.signature.end()));
    env->set_public_key(std::string(envelope.publicKey.begin(), envelope.publicKey.end()));

    if (!fr.SerializeToString(&out) || out.empty())
        return false;
    if (out.size() > MAX_WIRE_PAYLOAD) {
        LOG_W("[net]") << "⚠️ frame from " << envelope.sender << " too large (" << out.size()
                       << " bytes)";
        return false;
    }
    return true;
}

std::optional<SignedEnvelope> decodeFrame(const std::string& data) {
    if (data.empty() || data.size() > MAX_WIRE_PAYLOAD)
        return std::nullopt;

    stigmesh::net::Frame fr;
    if (!fr.ParseFromString(data) || !fr.has_envelope()) {
        LOG_D("[net]") << "dropping unparsable frame (" << data.size() << " bytes)";
        return std::nullopt;
    }
    if (fr.version() != MESH_FRAME_VERSION) {
        LOG_D("[net]") << "dropping frame with version " << fr.version();
        return std::nullopt;
    }

    const auto& env = fr.envelope();
    auto type = messageTypeFromString(env.msg_type());
    if (!type) {
        LOG_D("[net]") << "dropping frame with unknown msg_type " << env.msg_type();
        return std::nullopt;
    }
    auto payload = parseJson(env.payload_json().empty() ? "{}" : env.payload_json());
    if (!payload || !payload->isObject()) {
        LOG_D("[net]") << "dropping frame from " << env.sender() << ": payload is not an object";
        return std::nullopt;
    }

    SignedEnvelope out;
    out.msgType = *type;
    out.sender = env.sender();
    out.timestamp = env.timestamp();
    out.nonce = env.nonce();
    out.epoch = env.epoch();
    out.payload = std::move(*payload);
    out.signature.assign(env.signature().begin(), env.signature().end());
    out.publicKey.assign(env.public_key().begin(), env.public_key().end());
    return out;
}
