#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wl/model.hpp"

namespace wl
{
inline constexpr int kMaxThreads = 100;
inline constexpr int kMaxIterations = 10000;
inline constexpr long long kMaxTotalCalls = 1000000;
inline constexpr int kMaxTimeoutMs = 300000;

// Empty vector means valid.
std::vector<std::string> validate_request(const RequestDescriptor &req);

std::vector<std::string> validate_parameters(const ExecutionParameters &params);

// Replaces every {name} with its path parameter value.
std::string apply_path_parameters(const std::string &url,
                                  const std::map<std::string, std::string> &
                                  path_params);

// Appends percent-encoded query parameters.
std::string build_final_url(const std::string &url,
                            const std::map<std::string, std::string> &
                            query_params);

// Path and query applied, parameter maps cleared.
RequestDescriptor resolve_request(const RequestDescriptor &req);

struct UrlParts
{
    std::string scheme;  // "http" or "https"
    std::string host;
    int         port{};
    std::string target;  // path + query, at least "/"

    std::string origin() const; // scheme://host:port
};

std::optional<UrlParts> split_url(std::string_view url);

// Percent-encodes everything but unreserved characters; a space becomes %20.
std::string url_encode(std::string_view s);

// Looks at the body shape only: json, xml, form or text/plain.
std::string detect_content_type(std::string_view body);

// Case-insensitive header lookup.
std::optional<std::string> find_header(const Headers &headers,
                                       std::string_view name);
} // namespace wl
