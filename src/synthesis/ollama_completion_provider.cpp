#include "cintel/synthesis/ollama_completion_provider.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace cintel::synthesis {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

constexpr long kHttpOk = 200;

void ensure_curl_initialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CompletionResult failure(const core::ProviderError code, std::string message) {
  return CompletionResult::err({code, std::move(message)});
}

struct BufferedBody {
  std::string data;
};

size_t write_buffered(char* contents, const size_t size, const size_t nmemb, void* userp) {
  auto* body = static_cast<BufferedBody*>(userp);
  body->data.append(contents, size * nmemb);
  return size * nmemb;
}

// State shared with the NDJSON write callback. Returning a short count from the callback makes
// curl stop with CURLE_WRITE_ERROR; failure then says why.
struct StreamState {
  const FragmentSink* sink{nullptr};
  NdjsonLineBuffer lines;
  std::string full_text;
  std::optional<core::ProviderFailure> failure;
  bool done{false};
};

bool consume_stream_line(StreamState& state, const std::string& line) {
  const auto j = nlohmann::json::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    state.failure = core::ProviderFailure{core::ProviderError::kMalformedResponse,
                                          "stream line is not a JSON object"};
    return false;
  }
  if (j.contains("error")) {
    const auto& error = j["error"];
    state.failure = core::ProviderFailure{core::ProviderError::kUnavailable,
                                          error.is_string() ? error.get<std::string>()
                                                            : error.dump()};
    return false;
  }
  if (j.contains("response") && j["response"].is_string()) {
    const auto fragment = j["response"].get<std::string>();
    if (!fragment.empty()) {
      state.full_text += fragment;
      if (!(*state.sink)(fragment)) {
        state.failure = core::ProviderFailure{core::ProviderError::kCancelled,
                                              "consumer stopped the stream"};
        return false;
      }
    }
  }
  if (j.value("done", false)) {
    state.done = true;
  }
  return true;
}

size_t write_stream(char* contents, const size_t size, const size_t nmemb, void* userp) {
  auto* state = static_cast<StreamState*>(userp);
  const size_t total = size * nmemb;
  for (const auto& line : state->lines.feed(std::string_view(contents, total))) {
    if (!consume_stream_line(*state, line)) {
      return 0;
    }
  }
  return total;
}

int on_progress(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
  const auto* token = static_cast<const core::CancellationToken*>(clientp);
  return token->is_cancelled() ? 1 : 0;
}

struct Transfer {
  CURLcode code{CURLE_OK};
  long http_status{0};
  std::string curl_error;
};

Transfer post_json(const OllamaConfig& config, const std::string& body,
                   curl_write_callback write_fn, void* write_data,
                   const core::CancellationToken& token) {
  ensure_curl_initialized();
  Transfer transfer;

  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    transfer.code = CURLE_FAILED_INIT;
    transfer.curl_error = "curl_easy_init failed";
    return transfer;
  }
  HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"),
                     &curl_slist_free_all);

  const std::string url = config.base_url + "/api/generate";
  char error_buffer[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config.timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, config.connect_timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_fn);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, write_data);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &on_progress);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &token);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

  transfer.code = curl_easy_perform(curl.get());
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &transfer.http_status);
  transfer.curl_error = error_buffer[0] != '\0' ? std::string(error_buffer)
                                                : std::string(curl_easy_strerror(transfer.code));
  return transfer;
}

core::ProviderError classify(const CURLcode code) {
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
      return core::ProviderError::kTimeout;
    case CURLE_ABORTED_BY_CALLBACK:
    case CURLE_WRITE_ERROR:
      return core::ProviderError::kCancelled;
    default:
      return core::ProviderError::kUnavailable;
  }
}

}  // namespace

nlohmann::json build_generate_request(const OllamaConfig& config, const std::string& prompt,
                                      const CompletionOptions& options, const bool stream) {
  return nlohmann::json{
      {"model", config.model},
      {"prompt", prompt},
      {"stream", stream},
      {"options",
       {{"temperature", options.temperature},
        {"num_predict", options.max_tokens},
        {"num_ctx", config.context_window}}},
  };
}

CompletionResult parse_generate_response(const std::string_view body) {
  const auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return failure(core::ProviderError::kMalformedResponse, "response body is not a JSON object");
  }
  if (j.contains("error")) {
    const auto& error = j["error"];
    return failure(core::ProviderError::kUnavailable,
                   "ollama error: " + (error.is_string() ? error.get<std::string>() : error.dump()));
  }
  if (!j.contains("response") || !j["response"].is_string()) {
    return failure(core::ProviderError::kMalformedResponse, "missing \"response\" string");
  }
  auto text = j["response"].get<std::string>();
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return failure(core::ProviderError::kMalformedResponse, "empty response");
  }
  return CompletionResult::ok(std::move(text));
}

std::vector<std::string> NdjsonLineBuffer::feed(const std::string_view bytes) {
  pending_.append(bytes);
  std::vector<std::string> lines;
  size_t start = 0;
  size_t newline = pending_.find('\n', start);
  while (newline != std::string::npos) {
    size_t end = newline;
    if (end > start && pending_[end - 1] == '\r') {
      --end;
    }
    if (end > start) {
      lines.emplace_back(pending_, start, end - start);
    }
    start = newline + 1;
    newline = pending_.find('\n', start);
  }
  pending_.erase(0, start);
  return lines;
}

OllamaCompletionProvider::OllamaCompletionProvider(OllamaConfig config)
    : config_(std::move(config)) {
  while (!config_.base_url.empty() && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
}

std::string OllamaCompletionProvider::provider_id() const {
  return "ollama:" + config_.model;
}

CompletionResult OllamaCompletionProvider::complete(const std::string& prompt,
                                                    const CompletionOptions& options,
                                                    const core::CancellationToken& token) {
  const std::string body = build_generate_request(config_, prompt, options, false)
                               .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  BufferedBody response;
  const Transfer transfer = post_json(config_, body, &write_buffered, &response, token);

  if (transfer.code != CURLE_OK) {
    return failure(classify(transfer.code), "ollama request failed: " + transfer.curl_error);
  }
  if (transfer.http_status != kHttpOk) {
    return failure(core::ProviderError::kUnavailable,
                   "ollama returned HTTP " + std::to_string(transfer.http_status) + ": " +
                       response.data.substr(0, 200));
  }
  return parse_generate_response(response.data);
}

CompletionResult OllamaCompletionProvider::complete_stream(const std::string& prompt,
                                                           const CompletionOptions& options,
                                                           const FragmentSink& sink,
                                                           const core::CancellationToken& token) {
  const std::string body = build_generate_request(config_, prompt, options, true)
                               .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  StreamState state;
  state.sink = &sink;
  const Transfer transfer = post_json(config_, body, &write_stream, &state, token);

  if (state.failure.has_value()) {
    return CompletionResult::err(std::move(*state.failure));
  }
  if (transfer.code != CURLE_OK) {
    return failure(classify(transfer.code), "ollama stream failed: " + transfer.curl_error);
  }
  if (transfer.http_status != kHttpOk) {
    return failure(core::ProviderError::kUnavailable,
                   "ollama returned HTTP " + std::to_string(transfer.http_status));
  }
  // A final line without a trailing newline.
  if (!state.lines.pending().empty() && !consume_stream_line(state, state.lines.pending())) {
    return CompletionResult::err(std::move(*state.failure));
  }
  if (!state.done) {
    return failure(core::ProviderError::kMalformedResponse, "stream ended before done");
  }
  if (state.full_text.empty()) {
    return failure(core::ProviderError::kMalformedResponse, "empty response");
  }
  return CompletionResult::ok(std::move(state.full_text));
}

}  // namespace cintel::synthesis
