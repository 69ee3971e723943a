#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace lex_cli
{

  enum class Command
  {
    Ask,
    Rebuild,
    Status,
    Help
  };

  struct CliOptions
  {
    Command command;
    std::string query;
    bool help;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Throws CliError for an unknown command or a missing argument
    CliOptions parse_arguments(int argc, char *argv[]);

    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

    // "<base>/<endpoint>" with exactly one slash between them
    std::string build_url(const std::string &endpoint) const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_ask_command(const CliOptions &options);
    void handle_rebuild_command(const CliOptions &options);
    void handle_status_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &url);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_answer_response(const nlohmann::json &response);
    void print_build_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    void print_help();
  };

}
