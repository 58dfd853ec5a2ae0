#pragma once
#include <crow.h>
#include <crow/middlewares/cors.h>

#include <cstdint>
#include <future>
#include <string>

namespace ragdesk_api {

using RagApp = crow::App<crow::CORSHandler>;

struct ServerOptions {
  std::string host = "127.0.0.1";
  uint16_t port = 8000;
  unsigned int threads = 0;  // 0 uses the hardware concurrency
};

// "host:port" as written in api_base_url; throws std::invalid_argument when malformed
ServerOptions parse_bind_address(const std::string &address);

/**
 * Owns the Crow application and runs it on a background thread. The /rag
 * prefix is opened to cross-origin POSTs; every other route is left alone.
 */
class Server {
 public:
  explicit Server(ServerOptions options);

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  RagApp &get_app() {
    return app_;
  }

  void start();
  void stop();

  bool is_running() const {
    return running_;
  }

  const ServerOptions &options() const {
    return options_;
  }

 private:
  RagApp app_;
  ServerOptions options_;
  std::future<void> run_future_;
  bool running_ = false;

  void configure_cors();
};

}  // namespace ragdesk_api
