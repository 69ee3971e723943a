#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace lex_core {
class RagService;
struct Answer;
struct RetrievalResult;
}  // namespace lex_core

namespace lex_api {

class Routes {
 public:
  explicit Routes(std::shared_ptr<lex_core::RagService> rag_service);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  Routes(Routes &&) noexcept = default;
  Routes &operator=(Routes &&) noexcept = default;

  // Register all routes with the server
  void register_routes(Server &server);

 private:
  std::shared_ptr<lex_core::RagService> rag_service_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_chat(const crow::request &req);
  crow::response handle_build_index(const crow::request &req);
  crow::response handle_status(const crow::request &req);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::string extract_query_from_request(const crow::request &req);
  static nlohmann::json source_to_json(const lex_core::RetrievalResult &source);
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace lex_api
