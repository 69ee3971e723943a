#include "lex_api/server.hpp"

#include <stdexcept>

namespace lex_api {
Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {}

std::pair<std::string, int> Server::parse_address(const std::string &address) {
  size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw std::invalid_argument("Expected host:port, got '" + address + "'");
  }
  std::string host = address.substr(0, colon);
  std::string port_str = address.substr(colon + 1);

  size_t consumed = 0;
  int port = std::stoi(port_str, &consumed);
  if (consumed != port_str.size() || port <= 0 || port > 65535) {
    throw std::invalid_argument("Invalid port in address '" + address + "'");
  }
  return {host, port};
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  // run() blocks until stop(), so it gets its own thread
  server_thread_future_ =
      std::async(std::launch::async, [this] { app_.port(port_).bindaddr(host_).multithreaded().run(); });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}
}  // namespace lex_api
