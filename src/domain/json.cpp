#include "wl/json.hpp"

#include <cmath>
#include <format>

namespace wl {

std::string json_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (const unsigned char uc : s)
    {
        switch (uc)
        {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (uc < 0x20) out += std::format("\\u{:04x}", static_cast<unsigned>(uc));
                else out += static_cast<char>(uc);
        }
    }
    return out;
}

std::string json_string(std::string_view s)
{
    return '"' + json_escape(s) + '"';
}

std::string json_number(double v, int precision)
{
    if (!std::isfinite(v)) v = 0.0;
    return std::format("{:.{}f}", v, precision);
}

} // namespace wl
