#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "wl/request.hpp"

using namespace wl;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static bool has_error(const std::vector<std::string>& errors, std::string_view msg)
{
    return std::ranges::find(errors, std::string(msg)) != errors.end();
}

static RequestDescriptor valid_request()
{
    RequestDescriptor r;
    r.url = "http://localhost:8080/api/items";
    return r;
}

static void test_valid_request_has_no_errors()
{
    assert_true(validate_request(valid_request()).empty(), "plain request is valid");
}

static void test_url_checks()
{
    auto r = valid_request();
    r.url = "   ";
    assert_true(has_error(validate_request(r), "URL cannot be empty"), "blank url");

    r.url = "ftp://example.com/";
    assert_true(has_error(validate_request(r), "URL format is invalid"), "ftp rejected");

    r.url = "example.com/path";
    assert_true(has_error(validate_request(r), "URL format is invalid"), "missing scheme");
}

static void test_timeout_bounds()
{
    auto r = valid_request();
    r.timeout_ms = 0;
    assert_true(has_error(validate_request(r), "Timeout must be positive"), "zero timeout");
    r.timeout_ms = kMaxTimeoutMs;
    assert_true(validate_request(r).empty(), "5 minutes allowed");
    r.timeout_ms = kMaxTimeoutMs + 1;
    assert_true(has_error(validate_request(r), "Timeout cannot exceed 5 minutes"), "over 5 minutes");
}

static void test_header_names()
{
    auto r = valid_request();
    r.headers[" "] = "x";
    assert_true(has_error(validate_request(r), "Header name cannot be empty"), "blank header name");

    r = valid_request();
    r.headers["X:Bad"] = "x";
    assert_true(has_error(validate_request(r), "Header name 'X:Bad' contains invalid characters"),
                "colon in header name");
}

static void test_missing_path_parameters()
{
    auto r = valid_request();
    r.url = "http://localhost/users/{userId}/posts/{postId}";
    auto errors = validate_request(r);
    assert_true(has_error(errors, "Missing path parameters: postId, userId"), "both missing, sorted");
    assert_true(!has_error(errors, "URL format is invalid"), "placeholders do not break url shape");

    r.path_params["userId"] = "7";
    r.path_params["postId"] = "9";
    assert_true(validate_request(r).empty(), "all placeholders supplied");
}

static void test_parameter_bounds()
{
    ExecutionParameters p;
    assert_true(validate_parameters(p).empty(), "defaults valid");

    p.thread_count = 0;
    p.iterations = 0;
    auto errors = validate_parameters(p);
    assert_true(has_error(errors, "Thread count must be at least 1"), "threads < 1");
    assert_true(has_error(errors, "Iterations must be at least 1"), "iterations < 1");

    p = {};
    p.thread_count = 101;
    assert_true(has_error(validate_parameters(p), "Thread count cannot exceed 100 (provided: 101)"),
                "threads > 100");

    p = {};
    p.iterations = 10001;
    assert_true(has_error(validate_parameters(p), "Iterations cannot exceed 10000 (provided: 10001)"),
                "iterations > 10000");

    p = {};
    p.thread_count = 100;
    p.iterations = 10000;
    assert_true(validate_parameters(p).size() == 0, "100 x 10000 == 1,000,000 is the limit");

    p = {};
    p.max_duration_ms = -1;
    assert_true(has_error(validate_parameters(p), "Max duration cannot be negative"), "negative budget");
}

static void test_path_and_query_resolution()
{
    assert_true(apply_path_parameters("http://h/a/{id}/b/{id}", {{"id", "42"}}) == "http://h/a/42/b/42",
                "every occurrence replaced");
    assert_true(apply_path_parameters("http://h/{x}", {{"x", "{x}"}}) == "http://h/{x}",
                "value containing its own placeholder terminates");

    assert_true(build_final_url("http://h/p", {}) == "http://h/p", "no query -> unchanged");
    assert_true(build_final_url("http://h/p", {{"q", "a b"}, {"lang", "c++"}}) ==
                "http://h/p?lang=c%2B%2B&q=a%20b", "encoded, key order");
    assert_true(build_final_url("http://h/p?x=1", {{"y", "2"}}) == "http://h/p?x=1&y=2",
                "existing query extended");

    RequestDescriptor r;
    r.url = "http://h/users/{id}";
    r.path_params["id"] = "5";
    r.query_params["verbose"] = "true";
    auto resolved = resolve_request(r);
    assert_true(resolved.url == "http://h/users/5?verbose=true", "resolved url");
    assert_true(resolved.path_params.empty() && resolved.query_params.empty(), "params consumed");
    assert_true(r.url == "http://h/users/{id}", "input untouched");
}

static void test_url_encode()
{
    assert_true(url_encode("AZaz09-_.~") == "AZaz09-_.~", "unreserved kept");
    assert_true(url_encode("a/b?c") == "a%2Fb%3Fc", "reserved escaped uppercase");
    assert_true(url_encode("\xc3\xa9") == "%C3%A9", "utf-8 bytes escaped");
    assert_true(url_encode("a b+c") == "a%20b%2Bc", "space and plus both escaped");
}

static void test_split_url()
{
    auto u = split_url("http://example.com");
    assert_true(u && u->host == "example.com" && u->port == 80 && u->target == "/", "defaults");
    assert_true(u->origin() == "http://example.com:80", "origin");

    u = split_url("HTTPS://user:pw@api.example.com:8443/v1/x?y=1#frag");
    assert_true(u && u->scheme == "https", "scheme lowercased");
    assert_true(u->host == "api.example.com" && u->port == 8443, "userinfo stripped, port kept");
    assert_true(u->target == "/v1/x?y=1", "fragment dropped");

    u = split_url("http://[::1]:9000/health");
    assert_true(u && u->host == "::1" && u->port == 9000, "ipv6 literal");

    u = split_url("http://h?x=1");
    assert_true(u && u->target == "/?x=1", "query without path");

    assert_true(!split_url("http://:80/"), "empty host");
    assert_true(!split_url("http://h:0/"), "port 0");
    assert_true(!split_url("http://h:65536/"), "port too large");
    assert_true(!split_url("http://h:8x/"), "non-numeric port");
    assert_true(!split_url("ws://h/"), "unsupported scheme");
}

static void test_detect_content_type()
{
    assert_true(detect_content_type(R"({"a":1})") == "application/json", "object");
    assert_true(detect_content_type(" [1,2] ") == "application/json", "array");
    assert_true(detect_content_type("<a>1</a>") == "application/xml", "xml");
    assert_true(detect_content_type("a=1&b=2") == "application/x-www-form-urlencoded", "form");
    assert_true(detect_content_type("hello") == "text/plain", "text");
    assert_true(detect_content_type("") == "text/plain", "empty");
}

static void test_find_header()
{
    Headers h{{"Content-Type", "text/plain"}};
    assert_true(find_header(h, "content-type") == std::optional<std::string>("text/plain"), "ci match");
    assert_true(!find_header(h, "Accept"), "absent");
}

int main()
{
    test_valid_request_has_no_errors();
    test_url_checks();
    test_timeout_bounds();
    test_header_names();
    test_missing_path_parameters();
    test_parameter_bounds();
    test_path_and_query_resolution();
    test_url_encode();
    test_split_url();
    test_detect_content_type();
    test_find_header();

    std::cout << "request tests: OK" << std::endl;
    return 0;
}
