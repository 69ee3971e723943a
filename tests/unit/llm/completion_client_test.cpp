#include <arpa/inet.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdlib>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "lex_core/llm/completion_client.hpp"

namespace lex_tests {

using lex_core::CompletionClient;
using lex_core::ModelServiceError;
using testing::HasSubstr;
using testing::StartsWith;

/**
 * Loopback HTTP endpoint that accepts one connection, records the request and answers with a
 * fixed status and body. A status of 0 never answers and holds the connection until the client
 * gives up.
 */
class CannedHttpServer {
 public:
  CannedHttpServer(int status, std::string body) : status_(status), body_(std::move(body)) {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
      throw std::runtime_error("Failed to create socket");
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
        listen(listen_fd_, 1) != 0 ||
        getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
      close(listen_fd_);
      throw std::runtime_error("Failed to listen on loopback");
    }
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this]() { serve_once(); });
  }

  ~CannedHttpServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
    close(listen_fd_);
  }

  CannedHttpServer(const CannedHttpServer &) = delete;
  CannedHttpServer &operator=(const CannedHttpServer &) = delete;

  std::string base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_) + "/";
  }

  // Valid once the client call has returned
  std::string request() {
    if (thread_.joinable()) {
      thread_.join();
    }
    return request_;
  }

  std::string request_body() {
    std::string raw = request();
    size_t header_end = raw.find("\r\n\r\n");
    return header_end == std::string::npos ? "" : raw.substr(header_end + 4);
  }

 private:
  void serve_once() {
    pollfd pfd{listen_fd_, POLLIN, 0};
    if (poll(&pfd, 1, 10000) <= 0) {
      return;
    }
    int conn = accept(listen_fd_, nullptr, nullptr);
    if (conn < 0) {
      return;
    }
    read_request(conn);

    if (status_ == 0) {
      char buffer[256];
      while (recv(conn, buffer, sizeof(buffer), 0) > 0) {
      }
    } else {
      std::string response = "HTTP/1.1 " + std::to_string(status_) + " Canned\r\n" +
                             "Content-Type: application/json\r\n" +
                             "Content-Length: " + std::to_string(body_.size()) + "\r\n" +
                             "Connection: close\r\n\r\n" + body_;
      send(conn, response.data(), response.size(), 0);
    }
    close(conn);
  }

  void read_request(int conn) {
    char buffer[4096];
    size_t expected_total = std::string::npos;
    while (expected_total == std::string::npos || request_.size() < expected_total) {
      ssize_t n = recv(conn, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        return;
      }
      request_.append(buffer, static_cast<size_t>(n));

      size_t header_end = request_.find("\r\n\r\n");
      if (expected_total == std::string::npos && header_end != std::string::npos) {
        size_t content_length = 0;
        size_t pos = request_.find("Content-Length:");
        if (pos != std::string::npos && pos < header_end) {
          content_length = std::strtoul(request_.c_str() + pos + 15, nullptr, 10);
        }
        expected_total = header_end + 4 + content_length;
      }
    }
  }

  int status_;
  std::string body_;
  int listen_fd_ = -1;
  int port_ = 0;
  std::string request_;
  std::thread thread_;
};

TEST(CompletionClientTest, EndpointIgnoresTrailingSlashes) {
  EXPECT_EQ(CompletionClient("http://localhost:11434", 5).endpoint(),
            "http://localhost:11434/api/generate");
  EXPECT_EQ(CompletionClient("http://localhost:11434/", 5).endpoint(),
            "http://localhost:11434/api/generate");
  EXPECT_EQ(CompletionClient("http://localhost:11434//", 5).endpoint(),
            "http://localhost:11434/api/generate");
}

TEST(CompletionClientTest, PostsNonStreamingRequestAndReturnsResponseField) {
  CannedHttpServer server(200, R"({"model":"llm-model","response":"Stop at red lights.","done":true})");
  CompletionClient client(server.base_url(), 5);

  EXPECT_EQ(client.complete("llm-model", "Do I stop at red lights?"), "Stop at red lights.");

  EXPECT_THAT(server.request(), StartsWith("POST /api/generate HTTP/1.1\r\n"));
  auto body = nlohmann::json::parse(server.request_body());
  EXPECT_EQ(body["model"], "llm-model");
  EXPECT_EQ(body["prompt"], "Do I stop at red lights?");
  EXPECT_EQ(body["stream"], false);
}

TEST(CompletionClientTest, ErrorStatusThrows) {
  CannedHttpServer server(500, R"({"error":"model 'llm-model' not found"})");
  CompletionClient client(server.base_url(), 5);

  try {
    client.complete("llm-model", "prompt");
    FAIL() << "Expected ModelServiceError";
  } catch (const ModelServiceError &e) {
    EXPECT_THAT(std::string(e.what()), HasSubstr("500"));
  }
}

TEST(CompletionClientTest, NotFoundStatusThrows) {
  CannedHttpServer server(404, "404 page not found");
  CompletionClient client(server.base_url(), 5);

  EXPECT_THROW(client.complete("llm-model", "prompt"), ModelServiceError);
}

TEST(CompletionClientTest, BodyWithoutResponseFieldThrows) {
  CannedHttpServer server(200, R"({"done":true})");
  CompletionClient client(server.base_url(), 5);

  EXPECT_THROW(client.complete("llm-model", "prompt"), ModelServiceError);
}

TEST(CompletionClientTest, MalformedBodyThrows) {
  CannedHttpServer server(200, "not json");
  CompletionClient client(server.base_url(), 5);

  EXPECT_THROW(client.complete("llm-model", "prompt"), ModelServiceError);
}

TEST(CompletionClientTest, UnreachableServerThrows) {
  CompletionClient client("http://127.0.0.1:1", 5);

  EXPECT_THROW(client.complete("llm-model", "prompt"), ModelServiceError);
}

TEST(CompletionClientTest, TimeoutThrows) {
  CannedHttpServer server(0, "");
  CompletionClient client(server.base_url(), 1);

  EXPECT_THROW(client.complete("llm-model", "prompt"), ModelServiceError);
}

}  // namespace lex_tests
