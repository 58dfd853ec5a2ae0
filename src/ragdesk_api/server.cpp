#include "ragdesk_api/server.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace ragdesk_api {

ServerOptions parse_bind_address(const std::string &address) {
  const size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw std::invalid_argument("Expected host:port, got '" + address + "'");
  }

  const std::string port_text = address.substr(colon + 1);
  size_t consumed = 0;
  int port = 0;
  try {
    port = std::stoi(port_text, &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument("Invalid port in '" + address + "'");
  }
  if (consumed != port_text.size() || port < 1 || port > 65535) {
    throw std::invalid_argument("Invalid port in '" + address + "'");
  }

  ServerOptions options;
  options.host = address.substr(0, colon);
  options.port = static_cast<uint16_t>(port);
  return options;
}

Server::Server(ServerOptions options) : options_(std::move(options)) {
  if (options_.threads == 0) {
    options_.threads = std::max(1u, std::thread::hardware_concurrency());
  }
  // Request lines are logged by the routes themselves
  app_.loglevel(crow::LogLevel::Warning);
  configure_cors();
}

void Server::configure_cors() {
  auto &cors = app_.get_middleware<crow::CORSHandler>();
  cors.global().ignore();
  cors.prefix("/rag")
      .origin("*")
      .methods(crow::HTTPMethod::POST, crow::HTTPMethod::OPTIONS)
      .headers("Content-Type");
}

void Server::start() {
  if (running_) {
    return;
  }
  std::cout << "Listening on " << options_.host << ":" << options_.port << " with "
            << options_.threads << " threads" << std::endl;
  running_ = true;
  run_future_ = std::async(std::launch::async, [this] {
    app_.bindaddr(options_.host).port(options_.port).concurrency(static_cast<uint16_t>(options_.threads)).run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  if (run_future_.valid()) {
    run_future_.get();
  }
  running_ = false;
}

}  // namespace ragdesk_api
