#include "tickflow/provider/symbol_codes.hpp"

#include <algorithm>
#include <cctype>

namespace tickflow {

namespace {

bool is_six_digits(const std::string& s) {
  return s.size() == 6 &&
         std::all_of(s.begin(), s.end(), [](unsigned char c) {
           return std::isdigit(c) != 0;
         });
}

std::string trim_upper(const std::string& symbol) {
  auto begin = symbol.begin();
  auto end = symbol.end();
  while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
    ++begin;
  }
  while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
    --end;
  }
  std::string out(begin, end);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

}  // namespace

std::optional<SecurityId> parse_a_share_symbol(const std::string& symbol) {
  const std::string s = trim_upper(symbol);

  // SH600000 / SZ000001
  if (s.size() == 8 && (s.compare(0, 2, "SH") == 0 || s.compare(0, 2, "SZ") == 0)) {
    const std::string code = s.substr(2);
    if (is_six_digits(code)) {
      return SecurityId{s[1] == 'H' ? 1 : 0, code};
    }
  }

  // 600000.SH / 000001.SZ
  if (s.size() == 9 && (s.compare(6, 3, ".SH") == 0 || s.compare(6, 3, ".SZ") == 0)) {
    const std::string code = s.substr(0, 6);
    if (is_six_digits(code)) {
      return SecurityId{s[8] == 'H' ? 1 : 0, code};
    }
  }

  if (is_six_digits(s)) {
    return SecurityId{s.front() == '6' ? 1 : 0, s};
  }

  return std::nullopt;
}

double normalize_vendor_price(double raw) {
  if (raw > 10000.0) {
    return raw / 100.0;
  }
  return raw;
}

}  // namespace tickflow
