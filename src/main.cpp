#include "config.h"
#include "crypto/ed25519_signer.h"
#include "logging.h"
#include "node/mesh_session.h"
#include "routing/tag_policy.h"
#include "transport/udp_gossip_socket.h"

#include <boost/asio.hpp>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

// Print usage information
void print_usage() {
  std::cout
      << "Usage: stigmesh-node [options]\n"
      << "Options:\n"
      << "  --config <path>       Load key=value configuration file\n"
      << "  --node-id <id>        Local node identifier\n"
      << "  --port <n>            UDP gossip listen port\n"
      << "  --peer <host:port>    Gossip peer (repeatable)\n"
      << "  --acl <path>          JSON ACL policy file\n"
      << "  --log-level <lvl>     trace|debug|info|warn|error|off\n"
      << "  --help                Show this message\n";
}

int main(int argc, char *argv[]) {
  MeshConfig &cfg = getMeshConfig();

  // The config file is applied first so that flags given after it win.
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      if (!loadConfigFile(argv[i + 1], cfg)) {
        std::cerr << "❌ cannot read config file " << argv[i + 1] << "\n";
        return 1;
      }
    }
  }
  applyEnvOverrides(cfg);

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (arg == "--config" && i + 1 < argc) {
      ++i;
    } else if (arg == "--node-id" && i + 1 < argc) {
      cfg.node_id = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      auto ep = parsePeerEndpoint(std::string("localhost:") + argv[++i]);
      if (!ep) {
        std::cerr << "❌ invalid port " << argv[i] << "\n";
        return 1;
      }
      cfg.listen_port = ep->port;
    } else if (arg == "--peer" && i + 1 < argc) {
      auto ep = parsePeerEndpoint(argv[++i]);
      if (!ep) {
        std::cerr << "❌ invalid peer " << argv[i] << " (expected host:port)\n";
        return 1;
      }
      cfg.peers.push_back(*ep);
    } else if (arg == "--acl" && i + 1 < argc) {
      cfg.acl_policy_file = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      cfg.log_level = argv[++i];
    } else {
      std::cerr << "❌ unknown option " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  initLogging(cfg.log_level, cfg.node_id);

  boost::asio::io_context io;
  Ed25519Signer signer;

  try {
    MeshSession session(SessionOptions::fromConfig(cfg), signer);

    if (!cfg.acl_policy_file.empty())
      session.applyAclPolicy(AclPolicySet::loadFile(cfg.acl_policy_file));

    UdpGossipSocket socket(io, cfg.listen_port);
    socket.setPeers(cfg.peers);
    session.setOutboundSink(
        [&socket](const SignedEnvelope &env) { socket.broadcast(env); });
    socket.start([&session](const SignedEnvelope &env) { session.dispatch(env); });
    LOG_I("[mesh]") << "🕸️ " << cfg.node_id << " gossiping on udp/" << socket.localPort()
                    << " with " << socket.peerCount() << " peer(s)";

    session.start(io);

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int sig) {
      if (ec)
        return;
      LOG_I("[mesh]") << "🛑 signal " << sig << " received, shutting down";
      session.stop();
      socket.close();
    });

    io.run();

    LOG_I("[mesh]") << "📊 final status: " << canonicalJson(session.status().toJson());
  } catch (const std::exception &e) {
    LOG_E("[mesh]") << "❌ fatal: " << e.what();
    return 1;
  }
  return 0;
}
