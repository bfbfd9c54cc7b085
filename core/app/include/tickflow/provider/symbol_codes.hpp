#pragma once

#include <optional>
#include <string>

namespace tickflow {

// -----------------------------------------------------------------------------
// SecurityId — exchange-qualified A-share code
// -----------------------------------------------------------------------------
// market: 1 = Shanghai (SH), 0 = Shenzhen (SZ). Rendered as "{market}.{code}"
// in the quote endpoint's secid parameter.
// -----------------------------------------------------------------------------
struct SecurityId {
  int market{0};
  std::string code;

  std::string as_param() const {
    return std::to_string(market) + "." + code;
  }
};

// -----------------------------------------------------------------------------
// parse_a_share_symbol(symbol)
// -----------------------------------------------------------------------------
//
// @brief  Normalizes a user-facing symbol to a SecurityId.
//
// @details
// Case-insensitive, surrounding whitespace ignored. Accepted forms:
//
//   SH600000 / SZ000001    prefix form, 8 characters
//   600000.SH / 000001.SZ  suffix form, 9 characters
//   600000 / 000001        bare 6-digit code: a leading '6' is Shanghai,
//                          anything else Shenzhen
//
// @return std::nullopt for anything else.
// -----------------------------------------------------------------------------
std::optional<SecurityId> parse_a_share_symbol(const std::string& symbol);

// -----------------------------------------------------------------------------
// normalize_vendor_price(raw)
// -----------------------------------------------------------------------------
// The quote endpoint sometimes reports price x 100 as an integer. A-share
// prices are far below 10 000, so anything above that is divided back.
// -----------------------------------------------------------------------------
double normalize_vendor_price(double raw);

}  // namespace tickflow
