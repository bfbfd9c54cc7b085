#include "tickflow/provider/polled_http_provider.hpp"

#include "tickflow/provider/symbol_codes.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <utility>

namespace tickflow {

namespace {

constexpr const char* kQuotePath = "/api/qt/stock/get";
constexpr const char* kQuoteFields = "f43,f58,f57,f59,f170,f44,f45,f46,f47,f48";

struct CurlHandleDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;

struct CurlListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using CurlHeaders = std::unique_ptr<curl_slist, CurlListDeleter>;

std::size_t write_callback(char* data, std::size_t size, std::size_t nmemb,
                           void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t,
                      curl_off_t) {
  const auto* cancel = static_cast<const std::atomic<bool>*>(userdata);
  return cancel->load() ? 1 : 0;
}

bool is_transient(CURLcode code) {
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
      return true;
    default:
      return false;
  }
}

bool is_transient_status(long status) {
  return status == 429 || (status >= 500 && status <= 599);
}

// Outcome of one HTTP attempt.
struct Attempt {
  CURLcode code{CURLE_OK};
  long status{0};
  std::string body;
};

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PolledHttpProvider::PolledHttpProvider(HttpProviderConfig config,
                                       const ITimeProvider& time_provider)
    : config_(std::move(config)),
      time_provider_(time_provider),
      rate_limiter_(std::chrono::milliseconds(config_.min_call_spacing_ms)) {
  static std::once_flag curl_init;
  std::call_once(curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

  std::cout << "[PolledHttpProvider] base_url=" << config_.base_url
            << " timeout_ms=" << config_.timeout_ms
            << " max_retries=" << config_.max_retries
            << " min_spacing_ms=" << config_.min_call_spacing_ms << "\n";
}

std::string PolledHttpProvider::quote_url(const std::string& symbol) const {
  const auto id = parse_a_share_symbol(symbol);
  if (!id) {
    return {};
  }
  return config_.base_url + kQuotePath + "?secid=" + id->as_param() +
         "&fields=" + kQuoteFields;
}

// -----------------------------------------------------------------------------
// fetch(symbol, cancel)
// -----------------------------------------------------------------------------
ProviderResult PolledHttpProvider::fetch(const std::string& symbol,
                                         const std::atomic<bool>& cancel) {
  const std::string url = quote_url(symbol);
  if (url.empty()) {
    return ProviderResult::failure("unsupported symbol format: " + symbol,
                                   time_provider_.now_ms());
  }

  CurlHandle curl(curl_easy_init());
  if (!curl) {
    return ProviderResult::failure("curl_easy_init failed",
                                   time_provider_.now_ms());
  }

  CurlHeaders headers(
      curl_slist_append(nullptr, "Accept: application/json,text/plain,*/*"));

  Attempt attempt;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &attempt.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config_.timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                   config_.connect_timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA,
                   const_cast<std::atomic<bool>*>(&cancel));
  if (config_.proxy) {
    curl_easy_setopt(curl.get(), CURLOPT_PROXY, config_.proxy->c_str());
  }

  std::chrono::milliseconds backoff(config_.retry_backoff_ms);
  std::string last_error;

  for (int attempt_no = 0; attempt_no <= config_.max_retries; ++attempt_no) {
    if (attempt_no > 0) {
      std::cerr << "[PolledHttpProvider] " << symbol << " retry " << attempt_no
                << "/" << config_.max_retries << " after " << backoff.count()
                << " ms: " << last_error << "\n";
      if (!sleep_unless_cancelled(backoff, cancel)) {
        return ProviderResult::failure("cancelled", time_provider_.now_ms());
      }
      backoff *= 2;
    }

    if (!rate_limiter_.acquire(cancel)) {
      return ProviderResult::failure("cancelled", time_provider_.now_ms());
    }

    attempt.body.clear();
    attempt.status = 0;
    ++attempts_;
    attempt.code = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &attempt.status);

    if (attempt.code == CURLE_ABORTED_BY_CALLBACK) {
      return ProviderResult::failure("cancelled", time_provider_.now_ms());
    }

    if (attempt.code != CURLE_OK) {
      last_error = std::string("curl: ") + curl_easy_strerror(attempt.code);
      if (is_transient(attempt.code)) {
        continue;
      }
      return ProviderResult::failure(last_error, time_provider_.now_ms());
    }

    if (attempt.status != 200) {
      last_error = "http status " + std::to_string(attempt.status);
      if (is_transient_status(attempt.status)) {
        continue;
      }
      return ProviderResult::failure(last_error, time_provider_.now_ms());
    }

    return parse_quote_response(symbol, attempt.body, time_provider_.now_ms());
  }

  return ProviderResult::failure(
      "retries exhausted (" + std::to_string(config_.max_retries) + "): " +
          last_error,
      time_provider_.now_ms());
}

// -----------------------------------------------------------------------------
// parse_quote_response()
// -----------------------------------------------------------------------------
ProviderResult parse_quote_response(const std::string& symbol,
                                    const std::string& body,
                                    std::int64_t ts_ms) {
  try {
    const auto json = nlohmann::json::parse(body);
    const auto data = json.find("data");
    if (data == json.end() || !data->is_object() || data->empty()) {
      return ProviderResult::failure("empty quote data", ts_ms);
    }

    const auto f43 = data->find("f43");
    if (f43 == data->end() || !f43->is_number()) {
      return ProviderResult::failure("missing price field f43", ts_ms);
    }

    const double price = normalize_vendor_price(f43->get<double>());
    if (!std::isfinite(price) || price <= 0.0) {
      return ProviderResult::failure(
          "invalid price " + std::to_string(price), ts_ms);
    }
    return ProviderResult::success(domain::Tick{symbol, price, ts_ms});
  } catch (const nlohmann::json::exception& e) {
    return ProviderResult::failure(std::string("bad quote body: ") + e.what(),
                                   ts_ms);
  }
}

}  // namespace tickflow
