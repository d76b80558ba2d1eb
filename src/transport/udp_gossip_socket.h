#pragma once
#include "config.h"
#include "gossip/signed_envelope.h"
#include <array>
#include <boost/asio.hpp>
#include <functional>
#include <mutex>
#include <vector>

/**
 * Boost-Asio UDP carrier for signed envelopes. One datagram holds one
 * stigmesh.net.Frame. Receives are re-armed on the owning io_context;
 * frames that fail to decode are dropped before they reach verification.
 */
class UdpGossipSocket {
public:
    using EnvelopeHandler = std::function<void(const SignedEnvelope&)>;

    UdpGossipSocket(boost::asio::io_context& ctx, unsigned short listenPort);

    // Resolves host:port entries; unresolvable peers are logged and skipped.
    void setPeers(const std::vector<PeerEndpoint>& peers);
    void start(EnvelopeHandler handler);
    void close();

    // Sends the envelope to every configured peer. Returns the number of
    // datagrams handed to the socket.
    std::size_t broadcast(const SignedEnvelope& envelope);

    unsigned short localPort() const;
    std::size_t peerCount() const;

private:
    void doReceive();

    boost::asio::io_context& ctx_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint sender_;
    std::array<char, 64 * 1024> buf_{};
    EnvelopeHandler handler_;

    mutable std::mutex peersMutex_;
    std::vector<boost::asio::ip::udp::endpoint> peers_;
};
