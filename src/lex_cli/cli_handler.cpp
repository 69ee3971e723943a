#include "lex_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip>
#include <memory>

namespace lex_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    while (!api_base_url_.empty() && api_base_url_.back() == '/') {
        api_base_url_.pop_back();
    }
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    options.command = Command::Help;
    options.help = false;

    if (argc < 2) {
        options.help = true;
        return options;
    }

    std::string command = argv[1];

    if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        for (int i = 2; i < argc; i += 2) {
            std::string flag = argv[i];
            if (flag != "--query" && flag != "-q") {
                throw CliError("Unknown option for ask: " + flag);
            }
            if (i + 1 >= argc) {
                throw CliError("Option " + flag + " requires a value");
            }
            options.query = argv[i + 1];
        }
        if (options.query.empty()) {
            throw CliError("Ask command requires a question. Usage: ask --query <question>");
        }
    } else if (command == "rebuild" || command == "r") {
        options.command = Command::Rebuild;
    } else if (command == "status" || command == "st") {
        options.command = Command::Status;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        options.help = true;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::Rebuild:
            handle_rebuild_command(options);
            break;
        case Command::Status:
            handle_status_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

void CliHandler::handle_ask_command(const CliOptions& options) {
    std::cout << "Question: " << options.query << std::endl;

    nlohmann::json request_data = {
        {"query", options.query}
    };

    try {
        nlohmann::json response = make_post_request("/rag/chat", request_data);
        print_answer_response(response);
    } catch (const std::exception& e) {
        print_error("Failed to get an answer: " + std::string(e.what()));
    }
}

void CliHandler::handle_rebuild_command(const CliOptions& options) {
    std::cout << "Rebuilding the vector index. This can take several minutes..." << std::endl;

    try {
        nlohmann::json response = make_post_request("/rag/build-index", nlohmann::json::object());
        print_build_response(response);
    } catch (const std::exception& e) {
        print_error("Failed to rebuild index: " + std::string(e.what()));
    }
}

void CliHandler::handle_status_command(const CliOptions& options) {
    try {
        nlohmann::json response = make_get_request("/rag/status");
        print_json_response(response);
    } catch (const std::exception& e) {
        print_error("Failed to get status: " + std::string(e.what()));
    }
}

void CliHandler::handle_help_command(const CliOptions& options) {
    print_help();
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    curl_easy_reset(curl_handle_);
    return perform_request(build_url(endpoint));
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string request_json = data.dump();
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), curl_slist_free_all);

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    return perform_request(build_url(endpoint));
}

nlohmann::json CliHandler::perform_request(const std::string& url) {
    std::string response_buffer;
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, /*allow_exceptions*/ false);
    if (http_code != 200) {
        std::string detail = body.is_object() && body.contains("error") && body["error"].is_string()
                                 ? body["error"].get<std::string>()
                                 : response_buffer;
        throw CliError("HTTP request failed with status code " + std::to_string(http_code) + ": " + detail);
    }
    if (body.is_discarded()) {
        throw CliError("Server returned invalid JSON");
    }
    return body;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    if (!endpoint.empty() && endpoint.front() == '/') {
        return api_base_url_ + endpoint;
    }
    return api_base_url_ + "/" + endpoint;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_answer_response(const nlohmann::json& response) {
    std::cout << "\n" << std::string(80, '=') << std::endl;
    std::cout << response.value("answer", "") << std::endl;
    std::cout << std::string(80, '=') << std::endl;

    if (response.contains("sources") && response["sources"].is_array() && !response["sources"].empty()) {
        std::cout << "\nSources:" << std::endl;
        int number = 1;
        for (const auto& source : response["sources"]) {
            std::cout << "  [" << number++ << "] " << source.value("chapter_title", "") << ", "
                      << source.value("article_title", "");
            if (source.contains("distance") && source["distance"].is_number()) {
                std::cout << " (distance: " << std::fixed << std::setprecision(3)
                          << source["distance"].get<double>() << ")";
            }
            std::cout << std::endl;

            std::string content = source.value("content", "");
            std::cout << "      " << content.substr(0, 100);
            if (content.length() > 100) {
                std::cout << "...";
            }
            std::cout << std::endl;
        }
    }

    if (response.contains("query_time_ms") && response["query_time_ms"].is_number()) {
        std::cout << "\nAnswered in " << std::fixed << std::setprecision(0)
                  << response["query_time_ms"].get<double>() << " ms" << std::endl;
    }
}

void CliHandler::print_build_response(const nlohmann::json& response) {
    bool success = response.value("success", false);
    std::cout << (success ? "Success: " : "Not built: ") << response.value("message", "") << std::endl;
    std::cout << "Documents indexed: " << response.value("document_count", 0) << std::endl;
    std::cout << "Build time: " << std::fixed << std::setprecision(0)
              << response.value("build_time_ms", 0.0) << " ms" << std::endl;
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << "LexRAG CLI - ask questions about the legal corpus\n\n"
              << "Usage: lex_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  ask, a        Ask a question\n"
              << "                  --query, -q <question>\n"
              << "  rebuild, r    Rebuild the vector index from the corpus\n"
              << "  status, st    Show index and model status\n"
              << "  help, h       Show this help\n\n"
              << "Environment:\n"
              << "  API_BASE_URL  Server address (default http://127.0.0.1:8080)\n"
              << std::endl;
}

}  // namespace lex_cli
