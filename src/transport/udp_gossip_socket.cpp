#include "transport/udp_gossip_socket.h"
#include "logging.h"
#include "net/frame_logger.h"
#include "transport/frame_codec.h"

using boost::asio::ip::udp;

UdpGossipSocket::UdpGossipSocket(boost::asio::io_context& ctx, unsigned short listenPort)
    : ctx_(ctx), socket_(ctx, udp::endpoint(udp::v4(), listenPort)) {
    LOG_I("[net]") << "📡 gossip socket bound on udp/" << socket_.local_endpoint().port();
}

void UdpGossipSocket::setPeers(const std::vector<PeerEndpoint>& peers) {
    udp::resolver resolver(ctx_);
    std::vector<udp::endpoint> resolved;
    for (const auto& p : peers) {
        boost::system::error_code ec;
        auto results = resolver.resolve(udp::v4(), p.host, std::to_string(p.port), ec);
        if (ec || results.empty()) {
            LOG_W("[net]") << "⚠️ cannot resolve peer " << p.host << ":" << p.port << " ("
                           << ec.message() << ")";
            continue;
        }
        resolved.push_back(results.begin()->endpoint());
    }
    std::lock_guard<std::mutex> lk(peersMutex_);
    peers_ = std::move(resolved);
    LOG_I("[net]") << "🌐 " << peers_.size() << " gossip peer endpoint(s)";
}

void UdpGossipSocket::start(EnvelopeHandler handler) {
    handler_ = std::move(handler);
    doReceive();
}

void UdpGossipSocket::close() {
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec)
        LOG_W("[net]") << "⚠️ socket close: " << ec.message();
}

void UdpGossipSocket::doReceive() {
    socket_.async_receive_from(
        boost::asio::buffer(buf_), sender_,
        [this](const boost::system::error_code& ec, std::size_t n) {
            if (ec == boost::asio::error::operation_aborted || !socket_.is_open())
                return;
            if (ec) {
                LOG_W("[net]") << "⚠️ receive error: " << ec.message();
            } else {
                NET_TRACE("[net] {} bytes from {}", n, sender_.address().to_string());
                auto env = decodeFrame(std::string(buf_.data(), n));
                if (!env) {
                    LOG_W("[net]") << "⚠️ malformed frame from "
                                   << sender_.address().to_string() << ":" << sender_.port();
                } else if (handler_) {
                    try {
                        handler_(*env);
                    } catch (const std::exception& e) {
                        LOG_E("[net]") << "❌ handler failed for " << env->sender << ": "
                                       << e.what();
                    }
                }
            }
            doReceive();
        });
}

std::size_t UdpGossipSocket::broadcast(const SignedEnvelope& envelope) {
    std::string wire;
    if (!encodeFrame(envelope, wire)) {
        LOG_E("[net]") << "❌ failed to encode " << messageTypeToString(envelope.msgType);
        return 0;
    }

    std::vector<udp::endpoint> targets;
    {
        std::lock_guard<std::mutex> lk(peersMutex_);
        targets = peers_;
    }
    std::size_t sent = 0;
    for (const auto& ep : targets) {
        boost::system::error_code ec;
        socket_.send_to(boost::asio::buffer(wire), ep, 0, ec);
        if (ec) {
            LOG_D("[net]") << "send to " << ep.address().to_string() << ":" << ep.port()
                           << " failed: " << ec.message();
            continue;
        }
        ++sent;
    }
    return sent;
}

unsigned short UdpGossipSocket::localPort() const {
    boost::system::error_code ec;
    auto ep = socket_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

std::size_t UdpGossipSocket::peerCount() const {
    std::lock_guard<std::mutex> lk(peersMutex_);
    return peers_.size();
}
