#pragma once
#include "gossip/signed_envelope.h"
#include <optional>
#include <string>

constexpr uint32_t MESH_FRAME_VERSION = 1;

// Serialises an envelope into a stigmesh.net.Frame. Returns false if
// protobuf refuses to serialise or the result exceeds one datagram.
bool encodeFrame(const SignedEnvelope& envelope, std::string& out);

// Parses a frame; std::nullopt for anything that is not a well-formed
// envelope frame (bad protobuf, unknown version or type, invalid payload JSON).
std::optional<SignedEnvelope> decodeFrame(const std::string& data);
