#include "lex_core/llm/completion_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <nlohmann/json.hpp>

namespace lex_core {

CompletionClient::CompletionClient(const std::string &ollama_url, int timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
  std::string base = ollama_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  endpoint_ = base + "/api/generate";
}

size_t CompletionClient::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string CompletionClient::complete(const std::string &model, const std::string &prompt) {
  // One handle per call so concurrent queries never share curl state
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    throw ModelServiceError("Failed to initialize CURL");
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
      curl_slist_append(nullptr, "Content-Type: application/json"), curl_slist_free_all);

  nlohmann::json payload = {{"model", model}, {"prompt", prompt}, {"stream", false}};
  std::string request_json = payload.dump();
  std::string response_buffer;

  curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_json.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request_json.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw ModelServiceError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    throw ModelServiceError("Completion request failed with status code " +
                            std::to_string(http_code) + ": " + response_buffer);
  }

  try {
    nlohmann::json body = nlohmann::json::parse(response_buffer);
    if (!body.contains("response") || !body["response"].is_string()) {
      throw ModelServiceError("Completion response has no \"response\" field");
    }
    return body["response"].get<std::string>();
  } catch (const nlohmann::json::exception &e) {
    throw ModelServiceError("Malformed completion response: " + std::string(e.what()));
  }
}

}  // namespace lex_core
