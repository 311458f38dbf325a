#pragma once

#include <string>
#include <string_view>

namespace wl {

// Escapes s for use inside a JSON string literal (quotes not included).
std::string json_escape(std::string_view s);

// Quoted and escaped.
std::string json_string(std::string_view s);

// Fixed-point with `precision` decimals; NaN and infinities become 0.
std::string json_number(double v, int precision = 3);

} // namespace wl
