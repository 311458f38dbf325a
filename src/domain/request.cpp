#include "wl/request.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace wl
{
static std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::ranges::transform(
        out,
        out.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return out;
}

static std::string trim(std::string_view s)
{
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

static std::set<std::string> placeholders(const std::string &url)
{
    static const std::regex kParam(R"(\{([^}]+)\})");
    std::set<std::string> out;
    for (auto it = std::sregex_iterator(url.begin(), url.end(), kParam);
         it != std::sregex_iterator(); ++it)
    {
        out.insert((*it)[1].str());
    }
    return out;
}

std::vector<std::string> validate_request(const RequestDescriptor &req)
{
    std::vector<std::string> errors;

    if (trim(req.url).empty())
    {
        errors.emplace_back("URL cannot be empty");
    }
    else
    {
        // placeholders are checked separately; substitute so the shape can be parsed
        static const std::regex kParam(R"(\{[^}]+\})");
        const std::string shape = std::regex_replace(req.url, kParam, "placeholder");
        if (!split_url(shape)) errors.emplace_back("URL format is invalid");
    }

    if (req.timeout_ms <= 0) errors.emplace_back("Timeout must be positive");
    if (req.timeout_ms > kMaxTimeoutMs)
        errors.emplace_back("Timeout cannot exceed 5 minutes");

    for (const auto &[name, value]: req.headers)
    {
        if (trim(name).empty())
        {
            errors.emplace_back("Header name cannot be empty");
        }
        else if (name.find_first_of(":\r\n") != std::string::npos)
        {
            errors.emplace_back("Header name '" + name + "' contains invalid characters");
        }
    }

    for (const auto &[name, value]: req.query_params)
    {
        if (trim(name).empty())
            errors.emplace_back("Query parameter name cannot be empty");
    }
    for (const auto &[name, value]: req.path_params)
    {
        if (trim(name).empty())
            errors.emplace_back("Path parameter name cannot be empty");
    }

    std::string missing;
    for (const auto &p: placeholders(req.url))
    {
        if (req.path_params.contains(p)) continue;
        if (!missing.empty()) missing += ", ";
        missing += p;
    }
    if (!missing.empty()) errors.push_back("Missing path parameters: " + missing);

    return errors;
}

std::vector<std::string> validate_parameters(const ExecutionParameters &params)
{
    std::vector<std::string> errors;
    if (params.thread_count < 1)
        errors.emplace_back("Thread count must be at least 1");
    else if (params.thread_count > kMaxThreads)
        errors.push_back("Thread count cannot exceed " + std::to_string(kMaxThreads) +
                         " (provided: " + std::to_string(params.thread_count) + ")");

    if (params.iterations < 1)
        errors.emplace_back("Iterations must be at least 1");
    else if (params.iterations > kMaxIterations)
        errors.push_back("Iterations cannot exceed " + std::to_string(kMaxIterations) +
                         " (provided: " + std::to_string(params.iterations) + ")");

    if (params.thread_count >= 1 && params.thread_count <= kMaxThreads &&
        params.iterations >= 1 && params.iterations <= kMaxIterations &&
        params.total_calls() > kMaxTotalCalls)
    {
        errors.push_back("Total requests (threadCount x iterations = " +
                         std::to_string(params.total_calls()) +
                         ") exceeds maximum of " + std::to_string(kMaxTotalCalls));
    }

    if (params.max_duration_ms < 0)
        errors.emplace_back("Max duration cannot be negative");
    return errors;
}

std::string apply_path_parameters(const std::string &url,
                                  const std::map<std::string, std::string> &
                                  path_params)
{
    std::string out = url;
    for (const auto &[name, value]: path_params)
    {
        const std::string key = "{" + name + "}";
        for (size_t pos = out.find(key); pos != std::string::npos;
             pos = out.find(key, pos + value.size()))
        {
            out.replace(pos, key.size(), value);
        }
    }
    return out;
}

std::string url_encode(std::string_view s)
{
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c: s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out += static_cast<char>(c);
        }
        else
        {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0f];
        }
    }
    return out;
}

std::string build_final_url(const std::string &url,
                            const std::map<std::string, std::string> &
                            query_params)
{
    if (query_params.empty()) return url;
    std::string out = url;
    out += (url.find('?') != std::string::npos) ? '&' : '?';
    bool first = true;
    for (const auto &[k, v]: query_params)
    {
        if (!first) out += '&';
        first = false;
        out += url_encode(k);
        out += '=';
        out += url_encode(v);
    }
    return out;
}

RequestDescriptor resolve_request(const RequestDescriptor &req)
{
    RequestDescriptor out = req;
    out.url = build_final_url(apply_path_parameters(req.url, req.path_params),
                              req.query_params);
    out.path_params.clear();
    out.query_params.clear();
    return out;
}

std::string UrlParts::origin() const
{
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::optional<UrlParts> split_url(std::string_view url)
{
    const auto sep = url.find("://");
    if (sep == std::string_view::npos) return std::nullopt;

    UrlParts out;
    out.scheme = to_lower(url.substr(0, sep));
    if (out.scheme == "http") out.port = 80;
    else if (out.scheme == "https") out.port = 443;
    else return std::nullopt;

    std::string_view rest = url.substr(sep + 3);
    const auto slash = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, slash);
    if (slash == std::string_view::npos)
    {
        out.target = "/";
    }
    else
    {
        std::string_view tail = rest.substr(slash);
        if (const auto hash = tail.find('#'); hash != std::string_view::npos)
            tail = tail.substr(0, hash);
        out.target = tail.empty() || tail[0] != '/' ? "/" + std::string(tail) : std::string(tail);
    }

    // drop userinfo
    if (const auto at = authority.rfind('@'); at != std::string_view::npos)
        authority = authority.substr(at + 1);

    std::string_view port_part;
    if (!authority.empty() && authority[0] == '[')
    {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        out.host = std::string(authority.substr(1, close - 1));
        if (close + 1 < authority.size())
        {
            if (authority[close + 1] != ':') return std::nullopt;
            port_part = authority.substr(close + 2);
        }
    }
    else
    {
        const auto colon = authority.rfind(':');
        out.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) port_part = authority.substr(colon + 1);
    }
    if (out.host.empty()) return std::nullopt;

    if (!port_part.empty())
    {
        int port = 0;
        for (char ch: port_part)
        {
            if (ch < '0' || ch > '9') return std::nullopt;
            port = port * 10 + (ch - '0');
            if (port > 65535) return std::nullopt;
        }
        if (port == 0) return std::nullopt;
        out.port = port;
    }
    return out;
}

std::string detect_content_type(std::string_view body)
{
    static const std::regex kForm(R"(^[^=&]+=[^=&]+(&[^=&]+=[^=&]+)*$)");
    const std::string t = trim(body);
    if (t.empty()) return "text/plain";
    if ((t.front() == '{' && t.back() == '}') || (t.front() == '[' && t.back() == ']'))
        return "application/json";
    if (t.front() == '<' && t.back() == '>') return "application/xml";
    if (std::regex_match(t, kForm)) return "application/x-www-form-urlencoded";
    return "text/plain";
}

std::optional<std::string> find_header(const Headers &headers,
                                       std::string_view name)
{
    const std::string want = to_lower(name);
    for (const auto &[k, v]: headers)
    {
        if (to_lower(k) == want) return v;
    }
    return std::nullopt;
}
} // namespace wl
