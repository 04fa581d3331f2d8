#include "chatbench/chat_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "chatbench/json_fields.hpp"
#include "chatbench/response_assembler.hpp"

namespace chatbench {
namespace {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

constexpr std::size_t kMaxErrorBodyBytes = 512;

struct CurlDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* headers) const {
    if (headers != nullptr) {
      curl_slist_free_all(headers);
    }
  }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

CURLcode ensure_curl_init() {
  static std::once_flag once;
  static CURLcode rc = CURLE_OK;
  std::call_once(once, []() { rc = curl_global_init(CURL_GLOBAL_DEFAULT); });
  return rc;
}

std::string trim(const std::string& value) {
  const auto start = value.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

std::string endpoint(const ClientConfig& config, const std::string& path) {
  std::string base = config.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + path;
}

double elapsed_ms(Clock::time_point from, Clock::time_point to) {
  return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(to - from).count();
}

bool is_success_status(long status) { return status >= 200 && status < 300; }

struct StreamContext {
  CURL* m_handle{nullptr};
  ResponseAssembler* m_assembler{nullptr};
  long m_status{0};
  std::string m_errorBody;
};

size_t on_stream_body(char* data, size_t size, size_t nmemb, void* userp) {
  auto* ctx = static_cast<StreamContext*>(userp);
  const size_t bytes = size * nmemb;
  if (ctx->m_status == 0) {
    curl_easy_getinfo(ctx->m_handle, CURLINFO_RESPONSE_CODE, &ctx->m_status);
  }

  if (!is_success_status(ctx->m_status)) {
    const std::size_t room = kMaxErrorBodyBytes - std::min(kMaxErrorBodyBytes, ctx->m_errorBody.size());
    ctx->m_errorBody.append(data, std::min(room, bytes));
    return bytes;
  }

  // Returning short of `bytes` makes libcurl abort the transfer, which is how
  // reading stops at the terminal chunk.
  if (!ctx->m_assembler->feed(data, bytes, Clock::now())) {
    return 0;
  }
  return bytes;
}

size_t on_plain_body(char* data, size_t size, size_t nmemb, void* userp) {
  auto* out = static_cast<std::string*>(userp);
  out->append(data, size * nmemb);
  return size * nmemb;
}

// Tracks the last time bytes moved in either direction. Time spent before
// the connection is established is governed by the connect timeout instead.
struct StallGuard {
  CURL* m_handle{nullptr};
  long m_readTimeoutMs{0};
  curl_off_t m_lastDown{0};
  curl_off_t m_lastUp{0};
  Clock::time_point m_lastActivity{Clock::now()};
  bool m_stalled{false};
};

int on_transfer_progress(void* userp, curl_off_t /*dltotal*/, curl_off_t dlnow, curl_off_t /*ultotal*/,
                         curl_off_t ulnow) {
  auto* guard = static_cast<StallGuard*>(userp);
  const auto now = Clock::now();

  curl_off_t connectUs = 0;
  curl_easy_getinfo(guard->m_handle, CURLINFO_CONNECT_TIME_T, &connectUs);
  const bool connected = connectUs > 0 || dlnow > 0 || ulnow > 0;
  if (!connected || dlnow != guard->m_lastDown || ulnow != guard->m_lastUp) {
    guard->m_lastDown = dlnow;
    guard->m_lastUp = ulnow;
    guard->m_lastActivity = now;
    return 0;
  }

  if (elapsed_ms(guard->m_lastActivity, now) > static_cast<double>(guard->m_readTimeoutMs)) {
    guard->m_stalled = true;
    return 1;
  }
  return 0;
}

void apply_timeouts(CURL* handle, const ClientConfig& config, StallGuard& guard) {
  guard.m_handle = handle;
  guard.m_readTimeoutMs = config.read_timeout_ms;
  guard.m_lastActivity = Clock::now();

  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, config.connect_timeout_ms);
  curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, on_transfer_progress);
  curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &guard);
}

std::string stall_detail(const StallGuard& guard) {
  return "no data received for " + std::to_string(guard.m_readTimeoutMs) + " ms";
}

std::string protocol_detail(const std::string& body) {
  if (const auto error = extract_json_string(body, "error"); error.has_value() && !error->empty()) {
    return *error;
  }
  std::string detail = trim(body);
  std::replace(detail.begin(), detail.end(), '\n', ' ');
  if (detail.size() > 120) {
    detail = detail.substr(0, 120) + "...";
  }
  return detail;
}

InferenceFailure make_failure(FailureKind kind, std::string detail, double elapsedMs, long status = 0) {
  return {.m_kind = kind, .m_detail = std::move(detail), .m_elapsedMs = elapsedMs, .m_httpStatus = status};
}

class OllamaClient final : public IChatClient {
 public:
  explicit OllamaClient(ClientConfig config) : m_config(std::move(config)) {}

  InferenceOutcome send(const std::vector<Message>& messages, StreamCallback on_token) override {
    const auto tStart = Clock::now();
    const InferenceOutcome outcome = perform(messages, std::move(on_token), tStart);
    if (m_config.verbose) {
      log_outcome(outcome);
    }
    return outcome;
  }

 private:
  InferenceOutcome perform(const std::vector<Message>& messages, StreamCallback on_token,
                           Clock::time_point tStart) {
    if (const CURLcode initRc = ensure_curl_init(); initRc != CURLE_OK) {
      return make_failure(FailureKind::Transport, std::string("libcurl init failed: ") + curl_easy_strerror(initRc),
                          elapsed_ms(tStart, Clock::now()));
    }

    CurlHandle handle(curl_easy_init());
    if (!handle) {
      return make_failure(FailureKind::Transport, "libcurl easy handle allocation failed",
                          elapsed_ms(tStart, Clock::now()));
    }

    HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json; charset=UTF-8"));
    // An empty Expect: keeps long histories from waiting on a 100-continue
    // round trip before the body is sent.
    if (!headers || curl_slist_append(headers.get(), "Expect:") == nullptr) {
      return make_failure(FailureKind::Transport, "libcurl header allocation failed",
                          elapsed_ms(tStart, Clock::now()));
    }
    const std::string url = endpoint(m_config, "/api/chat");
    const std::string body = build_chat_request_body(m_config, messages);

    ResponseAssembler assembler(tStart, std::move(on_token));
    StreamContext ctx{handle.get(), &assembler, 0, ""};
    char errorBuffer[CURL_ERROR_SIZE] = {0};
    StallGuard guard;

    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, on_stream_body);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    apply_timeouts(handle.get(), m_config, guard);

    const CURLcode rc = curl_easy_perform(handle.get());
    const auto tEnd = Clock::now();

    long status = ctx.m_status;
    if (status == 0) {
      curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    }
    if (status != 0 && !is_success_status(status)) {
      return make_failure(FailureKind::Protocol, protocol_detail(ctx.m_errorBody), elapsed_ms(tStart, tEnd), status);
    }

    const bool stoppedAtTerminal = rc == CURLE_WRITE_ERROR && assembler.done();
    if (rc != CURLE_OK && !stoppedAtTerminal) {
      std::string detail = errorBuffer[0] != '\0' ? std::string(errorBuffer) : curl_easy_strerror(rc);
      if (rc == CURLE_ABORTED_BY_CALLBACK && guard.m_stalled) {
        detail = stall_detail(guard);
      }
      const FailureKind kind = assembler.bytes_received() == 0 ? FailureKind::Transport : FailureKind::StreamRead;
      return make_failure(kind, detail, elapsed_ms(tStart, tEnd), status);
    }

    assembler.finish(tEnd);
    return assembler.result();
  }

  void log_outcome(const InferenceOutcome& outcome) const {
    if (const auto* failure = std::get_if<InferenceFailure>(&outcome)) {
      std::cerr << "[chatbench] " << failure_marker(*failure) << " after " << std::fixed << std::setprecision(0)
                << failure->m_elapsedMs << "ms\n";
      return;
    }
    const auto& result = std::get<InferenceResult>(outcome);
    std::cerr << "[chatbench] Response: TTFT=" << std::fixed << std::setprecision(0) << result.m_firstTokenMs
              << "ms, total=" << result.m_totalMs << "ms, " << result.m_evalTokenCount << " tok, "
              << std::setprecision(1) << result.m_tokensPerSecond << " tok/s\n";
  }

  ClientConfig m_config;
};

}  // namespace

std::unique_ptr<IChatClient> make_ollama_client(const ClientConfig& config) {
  return std::make_unique<OllamaClient>(config);
}

std::string build_chat_request_body(const ClientConfig& config, const std::vector<Message>& messages) {
  json payload = json::array();
  for (const auto& message : messages) {
    payload.push_back({{"role", role_to_string(message.m_role)}, {"content", message.m_content}});
  }
  const json body = {
      {"model", config.model},
      {"messages", payload},
      {"stream", true},
      {"options", {{"num_predict", config.num_predict}}},
  };
  return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

HealthReport check_server_health(const ClientConfig& config) {
  HealthReport report;
  if (const CURLcode initRc = ensure_curl_init(); initRc != CURLE_OK) {
    report.m_detail = std::string("libcurl init failed: ") + curl_easy_strerror(initRc);
    return report;
  }

  CurlHandle handle(curl_easy_init());
  if (!handle) {
    report.m_detail = "libcurl easy handle allocation failed";
    return report;
  }

  const std::string url = endpoint(config, "/api/tags");
  std::string body;
  char errorBuffer[CURL_ERROR_SIZE] = {0};
  StallGuard guard;
  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, on_plain_body);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, errorBuffer);
  apply_timeouts(handle.get(), config, guard);

  const CURLcode rc = curl_easy_perform(handle.get());
  if (rc != CURLE_OK) {
    if (guard.m_stalled) {
      report.m_detail = stall_detail(guard);
    } else {
      report.m_detail = errorBuffer[0] != '\0' ? std::string(errorBuffer) : curl_easy_strerror(rc);
    }
    return report;
  }
  report.m_reachable = true;

  long status = 0;
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
  if (!is_success_status(status)) {
    report.m_detail = "model list request returned HTTP " + std::to_string(status);
    return report;
  }

  const json tags = json::parse(body, nullptr, false);
  if (tags.is_discarded() || !tags.is_object()) {
    report.m_detail = "model list response is not a JSON object";
    return report;
  }
  const auto models = tags.find("models");
  if (models == tags.end() || !models->is_array()) {
    report.m_detail = "model list response has no models array";
    return report;
  }

  const std::string wanted = config.model;
  const std::string wantedBase = wanted.substr(0, wanted.find(':'));
  for (const auto& model : *models) {
    if (!model.is_object() || !model.contains("name") || !model["name"].is_string()) {
      continue;
    }
    const std::string name = model["name"].get<std::string>();
    report.m_models.push_back(name);
    if (report.m_modelAvailable) {
      continue;
    }
    if (name == wanted || name.substr(0, name.find(':')) == wantedBase) {
      report.m_modelAvailable = true;
      report.m_matchedModel = name;
    }
  }
  if (!report.m_modelAvailable) {
    report.m_detail = "model '" + wanted + "' not found (run: ollama pull " + wanted + ")";
  }
  return report;
}

}  // namespace chatbench
