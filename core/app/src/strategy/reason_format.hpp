#pragma once

#include <iomanip>
#include <sstream>
#include <string>

namespace tickflow {
namespace detail {

// Appends " key=value" with four decimals, the layout used in every
// Signal.reason ("ma_cross_up ma_short=11.0000 ma_long=10.6667").
inline void append_value(std::ostringstream& out, const char* key,
                         double value) {
  out << ' ' << key << '=' << std::fixed << std::setprecision(4) << value;
}

}  // namespace detail
}  // namespace tickflow
