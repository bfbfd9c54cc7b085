#pragma once

#include "tickflow/config/engine_config.hpp"
#include "tickflow/provider/i_price_provider.hpp"
#include "tickflow/provider/rate_limiter.hpp"
#include "tickflow/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace tickflow {

// -----------------------------------------------------------------------------
// PolledHttpProvider — one quote request per fetch
// -----------------------------------------------------------------------------
//
// @brief  Fetches the latest price of an A-share symbol from an
//         Eastmoney-style quote endpoint using libcurl.
//
// @details
// Request:
//   GET {base_url}/api/qt/stock/get?secid={market}.{code}
//       &fields=f43,f58,f57,f59,f170,f44,f45,f46,f47,f48
//
// Response: JSON object whose data.f43 is the last price (possibly x100, see
// normalize_vendor_price). A missing or empty "data" object, a missing or
// non-numeric f43, or a non-positive price is a parse failure.
//
// Failure handling per fetch:
//   - Symbol that parse_a_share_symbol() rejects → error, no request.
//   - Transient: curl timeout, connect/resolve failure, send/recv error,
//     HTTP 429 or 5xx → retried up to max_retries times, sleeping
//     retry_backoff_ms, 2x, 4x ... between attempts.
//   - Anything else (other HTTP status, parse failure) → error immediately.
//   - Every attempt first takes a slot from the shared RateLimiter.
//
// Cancellation:
//   The curl transfer installs a progress callback that aborts once `cancel`
//   is set; backoff and rate-limit waits poll the same flag.
//
// Thread model:
//   Each fetch() uses its own CURL easy handle, so concurrent calls for
//   different symbols are independent apart from the RateLimiter.
// -----------------------------------------------------------------------------
class PolledHttpProvider final : public IPriceProvider {
 public:
  // Calls curl_global_init() once per process.
  PolledHttpProvider(HttpProviderConfig config,
                     const ITimeProvider& time_provider);

  using IPriceProvider::fetch;
  ProviderResult fetch(const std::string& symbol,
                       const std::atomic<bool>& cancel) override;

  const char* name() const override { return "polled_http"; }

  // Full request URL for `symbol`, or empty if the symbol is not accepted.
  std::string quote_url(const std::string& symbol) const;

  // Number of HTTP attempts made so far, retries included.
  std::uint64_t attempts() const { return attempts_.load(); }

 private:
  const HttpProviderConfig config_;
  const ITimeProvider& time_provider_;
  RateLimiter rate_limiter_;
  std::atomic<std::uint64_t> attempts_{0};
};

// -----------------------------------------------------------------------------
// parse_quote_response(symbol, body, ts_ms)
// -----------------------------------------------------------------------------
// Decodes a quote endpoint body into a tick for `symbol` stamped `ts_ms`, or
// an error result describing why it could not. Exposed for tests.
// -----------------------------------------------------------------------------
ProviderResult parse_quote_response(const std::string& symbol,
                                    const std::string& body,
                                    std::int64_t ts_ms);

}  // namespace tickflow
