#include "wscore.hpp"

#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
  uint16_t port = 8080;

  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  wscore::Logger::set_level(wscore::Logger::Level::kInfo);

  try {
    wscore::EngineConfig config;
    config.compression.enabled = true;
    config.ping_interval = std::chrono::milliseconds(30000);
    config.backpressure.policy = wscore::BackpressurePolicy::kDropOldest;

    wscore::RateLimitConfig limits;
    limits.capacity = 20;
    limits.window = std::chrono::milliseconds(60000);
    limits.max_connections_per_source = 8;

    wscore::Server server(port);
    server.set_engine_config(config)
        .set_rate_limiter(std::make_shared<wscore::RateLimiter>(limits))
        .set_tcp_tuning(wscore::TcpTuning{true, false, true, 60, 10, 5});

    server.on_connect = [](const std::shared_ptr<wscore::Connection>& conn) {
      std::cout << "Client #" << conn->get_id() << " connected from "
                << conn->peer_address()
                << (conn->compression_enabled() ? " (deflate)" : "") << std::endl;
    };

    server.on_message = [](const std::shared_ptr<wscore::Connection>& conn,
                           const wscore::Message& msg) {
      // Echo back
      auto r = conn->send(msg);
      if (!r) {
        std::cerr << "Client #" << conn->get_id()
                  << " echo failed: " << wscore::error_name(r.get_error()) << std::endl;
      }
    };

    server.on_close = [](const std::shared_ptr<wscore::Connection>& conn,
                         const wscore::CloseInfo& info) {
      std::cout << "Client #" << conn->get_id() << " closed (" << info.code
                << (info.origin == wscore::CloseOrigin::kLocal ? ", local" : ", remote")
                << ")" << std::endl;
    };

    server.on_rejected = [](const std::string& peer, const wscore::RateDecision& d) {
      std::cerr << "Rejected " << peer << ", retry after " << d.retry_after.count()
                << " ms" << std::endl;
    };

    server.run();

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
