#include <curl/curl.h>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "lex_api/config.hpp"
#include "lex_api/routes.hpp"
#include "lex_api/server.hpp"
#include "lex_core/services/rag_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char *argv[]) {
  std::string config_path = argc > 1 ? argv[1] : "lexragrc.json";

  // The fallback completion path issues curl requests from handler threads
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "Error starting server: failed to initialize libcurl" << std::endl;
    return 1;
  }

  int exit_code = 0;
  try {
    Config config = Config::from_file(config_path);
    lex_core::RagSettings settings = config.rag_settings();

    std::cout << "Starting LexRAG API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Corpus Directory: " << config.corpus_dir << std::endl;
    std::cout << "Index Path: " << config.index_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (" << config.embedding_variant
              << ")" << std::endl;
    std::cout << "LLM Model: " << config.llm_model << std::endl;
    std::cout << "Top K: " << config.top_k << std::endl;

    auto rag_service = std::make_shared<lex_core::RagService>(settings);
    if (!rag_service->model_server_available()) {
      std::cerr << "Warning: Ollama server is not reachable at " << config.ollama_url
                << ". Queries will fail until it is running." << std::endl;
    }
    if (config.eager_init) {
      std::cout << "Loading vector index before accepting requests..." << std::endl;
      try {
        rag_service->initialize();
      } catch (const std::exception &e) {
        // The first query retries initialization
        std::cerr << "Warning: RAG initialization failed: " << e.what() << std::endl;
      }
    }

    auto [host, port] = lex_api::Server::parse_address(config.api_base_url);
    lex_api::Server server(host, port);
    lex_api::Routes routes(rag_service);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully on " << server.address() << ". Press Ctrl+C to exit."
              << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Stopping API server..." << std::endl;
    server.stop();
    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    exit_code = 1;
  }

  curl_global_cleanup();
  return exit_code;
}
