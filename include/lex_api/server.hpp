#pragma once
#include <crow.h>

#include <future>
#include <string>
#include <utility>

namespace lex_api {
class Server {
 public:
  Server(const std::string &host, int port);
  ~Server() = default;

  // Disable move and copy operations since crow::SimpleApp doesn't support them
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  // Splits "host:port". Throws std::invalid_argument for anything else.
  static std::pair<std::string, int> parse_address(const std::string &address);

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

  std::string address() const {
    return host_ + ":" + std::to_string(port_);
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};
}  // namespace lex_api
