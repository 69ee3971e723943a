#include "lex_api/routes.hpp"

#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>

#include "lex_core/services/rag_service.hpp"

namespace lex_api {
Routes::Routes(std::shared_ptr<lex_core::RagService> rag_service)
    : rag_service_(std::move(rag_service)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/rag/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/rag/chat").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_chat(req);
  });

  CROW_ROUTE(app, "/rag/build-index")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_build_index(req); });

  CROW_ROUTE(app, "/rag/status")
  ([this](const crow::request &req) { return handle_status(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response;
  response["status"] = "ok";
  response["message"] = "LexRAG API is running";
  response["ollama_available"] = rag_service_->model_server_available();
  return create_json_response(response);
}

crow::response Routes::handle_chat(const crow::request &req) {
  std::string query;
  try {
    query = extract_query_from_request(req);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response("Invalid JSON body: " + std::string(e.what())),
                                400);
  }
  if (query.empty()) {
    return create_json_response(create_error_response("Query cannot be empty"), 400);
  }

  std::cout << "RAG query: " << query << std::endl;
  auto start = std::chrono::steady_clock::now();
  lex_core::Answer answer = rag_service_->generate_answer(query);
  double query_time_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

  nlohmann::json sources = nlohmann::json::array();
  for (const auto &source : answer.sources) {
    sources.push_back(source_to_json(source));
  }

  nlohmann::json response;
  response["answer"] = answer.text;
  response["sources"] = sources;
  response["query"] = query;
  response["query_time_ms"] = query_time_ms;
  return create_json_response(response);
}

crow::response Routes::handle_build_index(const crow::request &req) {
  try {
    std::cout << "Rebuilding vector index on request" << std::endl;
    lex_core::BuildReport report = rag_service_->force_rebuild();

    nlohmann::json response;
    response["success"] = report.success;
    response["message"] = report.success ? "Vectorstore built successfully"
                                         : "No documents were found to build the vectorstore";
    response["build_time_ms"] = report.build_time_ms;
    response["document_count"] = report.document_count;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_build_index: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_status(const crow::request &req) {
  try {
    lex_core::IndexStatus status = rag_service_->status();

    nlohmann::json response;
    response["vectorstore_loaded"] = status.vectorstore_loaded;
    response["document_count"] = status.document_count;
    response["embedding_model"] = status.embedding_model;
    response["index_saved"] = status.index_saved;
    response["status"] = status.status;
    response["llm_model"] = status.llm_model;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_status: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

nlohmann::json Routes::source_to_json(const lex_core::RetrievalResult &source) {
  nlohmann::json result_json;
  result_json["chapter_title"] = source.chapter_title;
  result_json["article_title"] = source.article_title;
  result_json["content"] = source.content;
  result_json["source"] = source.source;
  if (source.distance) {
    result_json["distance"] = *source.distance;
  }
  return result_json;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

std::string Routes::extract_query_from_request(const crow::request &req) {
  auto json_body = parse_json_body(req.body);
  if (!json_body.is_object()) {
    return "";
  }
  return json_body.value("query", "");
}

}  // namespace lex_api
