#include "wl/cli.hpp"

#include <algorithm>
#include <cstdio>
#include <print>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

namespace wl {

namespace {

// Matches "--name value" and "--name=value".
bool take_value(std::string_view a, std::string_view name, int &i, int argc,
                char **argv, std::string &out, bool &matched)
{
    matched = false;
    if (a == name)
    {
        matched = true;
        if (i + 1 >= argc)
        {
            std::println(stderr, "missing value for {}", name);
            return false;
        }
        out = argv[++i];
        return true;
    }
    if (a.size() > name.size() && a.starts_with(name) && a[name.size()] == '=')
    {
        matched = true;
        out = std::string(a.substr(name.size() + 1));
        return true;
    }
    return true;
}

bool parse_int(std::string_view what, const std::string &val, int &out)
{
    try
    {
        size_t used = 0;
        out = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
        return true;
    }
    catch (const std::exception &)
    {
        std::println(stderr, "invalid {} value: {}", what, val);
        return false;
    }
}

bool parse_pair(std::string_view what, const std::string &val,
                std::map<std::string, std::string> &into)
{
    const auto eq = val.find('=');
    if (eq == std::string::npos || eq == 0)
    {
        std::println(stderr, "invalid {} (expected key=value): {}", what, val);
        return false;
    }
    into[val.substr(0, eq)] = val.substr(eq + 1);
    return true;
}

bool parse_header(const std::string &val, Headers &into)
{
    const auto colon = val.find(':');
    if (colon == std::string::npos)
    {
        std::println(stderr, "invalid header (expected \"Name: value\"): {}", val);
        return false;
    }
    auto trim = [](std::string s)
    {
        const auto b = s.find_first_not_of(" \t");
        if (b == std::string::npos) return std::string();
        const auto e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    };
    into[trim(val.substr(0, colon))] = trim(val.substr(colon + 1));
    return true;
}

bool parse_pctl(const std::string &val, std::vector<int> &pctl)
{
    std::vector<int> out;
    for (auto part : val | std::views::split(','))
    {
        std::string num(part.begin(), part.end());
        if (num.empty()) continue;
        int p = 0;
        if (!parse_int("percentile", num, p)) return false;
        if (p < 0 || p > 100)
        {
            std::println(stderr, "percentile out of range: {}", p);
            return false;
        }
        out.push_back(p);
    }
    std::ranges::sort(out);
    out.erase(std::ranges::unique(out).begin(), out.end());
    pctl = std::move(out);
    return true;
}

bool valid_log_level(std::string_view l)
{
    static constexpr std::string_view levels[] = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    return std::ranges::find(levels, l) != std::end(levels);
}

} // namespace

void print_usage(const char *prog)
{
    std::println("Concurrent HTTP load runner");
    std::println("Usage: {} [options] <url>", prog);
    std::println("Request:");
    std::println("  -X, --method M       GET|POST|PUT|DELETE|PATCH|HEAD|OPTIONS (default: GET)");
    std::println("  -H, --header H       \"Name: value\", repeatable");
    std::println("  -d, --data BODY      Request body (Content-Type detected if not set)");
    std::println("  --timeout MS         Per-call timeout in milliseconds (default: 30000)");
    std::println("  --[no-]follow        Follow redirects (default: on)");
    std::println("  --query K=V          Query parameter, repeatable");
    std::println("  --path K=V           Value for a {{K}} placeholder in the URL, repeatable");
    std::println("Execution:");
    std::println("  -t, --threads N      Parallel workers, 1..100 (default: 1)");
    std::println("  --concurrency N      Alias of --threads");
    std::println("  -n, --iterations N   Calls per worker, 1..10000 (default: 1)");
    std::println("  --max-duration MS    Cancel the run after MS milliseconds");
    std::println("  --progress           Report progress on stderr");
    std::println("  --progress-every N   Progress granularity in calls (default: 10)");
    std::println("Output:");
    std::println("  --json               Final result as one JSON object");
    std::println("  --ndjson             One JSON line per call");
    std::println("  --pctl LIST          Extra percentiles, comma-separated (e.g. 50,90,99)");
    std::println("  --log-level L        trace|debug|info|warn|error|off (default: warn)");
    std::println("  -v                   Same as --log-level debug");
    std::println("  -h, --help           Show this help");
    std::println("");
    std::println("Examples:");
    std::println("  {} -t 5 -n 4 http://localhost:8080/health", prog);
    std::println("  {} -X POST -d '{{\"a\":1}}' --json http://localhost:8080/items", prog);
    std::println("  {} --path id=7 --query q=a+b http://localhost:8080/items/{{id}}", prog);
}

ParseResult parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        std::string val;
        bool matched = false;

        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return ParseResult::Help;
        }
        if (a == "--follow"sv)
        {
            opt.follow_redirects = true;
        }
        else if (a == "--no-follow"sv)
        {
            opt.follow_redirects = false;
        }
        else if (a == "--progress"sv)
        {
            opt.progress = true;
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a == "--ndjson"sv)
        {
            opt.ndjson = true;
        }
        else if (a == "-v"sv)
        {
            opt.log_level = "debug";
        }
        else if (a == "-X"sv || a.starts_with("--method"))
        {
            if (a == "-X"sv) a = "--method"sv;
            if (!take_value(a, "--method", i, argc, argv, val, matched) || !matched)
            {
                std::println(stderr, "invalid --method usage");
                return ParseResult::Error;
            }
            auto m = parse_method(val);
            if (!m)
            {
                std::println(stderr, "unknown method: {}", val);
                return ParseResult::Error;
            }
            opt.method = *m;
        }
        else if (a == "-H"sv || a.starts_with("--header"))
        {
            if (a == "-H"sv) a = "--header"sv;
            if (!take_value(a, "--header", i, argc, argv, val, matched) || !matched)
            {
                std::println(stderr, "invalid --header usage");
                return ParseResult::Error;
            }
            if (!parse_header(val, opt.headers)) return ParseResult::Error;
        }
        else if (a == "-d"sv || a.starts_with("--data"))
        {
            if (a == "-d"sv) a = "--data"sv;
            if (!take_value(a, "--data", i, argc, argv, val, matched) || !matched)
            {
                std::println(stderr, "invalid --data usage");
                return ParseResult::Error;
            }
            opt.body = std::move(val);
        }
        else if (a.starts_with("--timeout"))
        {
            if (!take_value(a, "--timeout", i, argc, argv, val, matched) || !matched ||
                !parse_int("--timeout", val, opt.timeout_ms))
                return ParseResult::Error;
        }
        else if (a.starts_with("--query"))
        {
            if (!take_value(a, "--query", i, argc, argv, val, matched) || !matched ||
                !parse_pair("--query", val, opt.query_params))
                return ParseResult::Error;
        }
        else if (a.starts_with("--path"))
        {
            if (!take_value(a, "--path", i, argc, argv, val, matched) || !matched ||
                !parse_pair("--path", val, opt.path_params))
                return ParseResult::Error;
        }
        else if (a == "-t"sv || a.starts_with("--threads") || a.starts_with("--concurrency"))
        {
            if (a == "-t"sv) a = "--threads"sv;
            const std::string_view name = a.starts_with("--threads") ? "--threads"sv : "--concurrency"sv;
            if (!take_value(a, name, i, argc, argv, val, matched) || !matched ||
                !parse_int(name, val, opt.threads))
                return ParseResult::Error;
        }
        else if (a == "-n"sv || a.starts_with("--iterations"))
        {
            if (a == "-n"sv) a = "--iterations"sv;
            if (!take_value(a, "--iterations", i, argc, argv, val, matched) || !matched ||
                !parse_int("--iterations", val, opt.iterations))
                return ParseResult::Error;
        }
        else if (a.starts_with("--max-duration"))
        {
            if (!take_value(a, "--max-duration", i, argc, argv, val, matched) || !matched ||
                !parse_int("--max-duration", val, opt.max_duration_ms))
                return ParseResult::Error;
        }
        else if (a.starts_with("--progress-every"))
        {
            if (!take_value(a, "--progress-every", i, argc, argv, val, matched) || !matched ||
                !parse_int("--progress-every", val, opt.progress_every))
                return ParseResult::Error;
            if (opt.progress_every <= 0) opt.progress_every = 1;
        }
        else if (a.starts_with("--pctl"))
        {
            if (!take_value(a, "--pctl", i, argc, argv, val, matched) || !matched ||
                !parse_pctl(val, opt.pctl))
                return ParseResult::Error;
        }
        else if (a.starts_with("--log-level"))
        {
            if (!take_value(a, "--log-level", i, argc, argv, val, matched) || !matched)
                return ParseResult::Error;
            if (!valid_log_level(val))
            {
                std::println(stderr, "unknown log level: {}", val);
                return ParseResult::Error;
            }
            opt.log_level = std::move(val);
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::println(stderr, "unknown option: {}", a);
            return ParseResult::Error;
        }
        else if (opt.url.empty())
        {
            opt.url = std::string(a);
        }
        else
        {
            std::println(stderr, "unexpected argument: {}", a);
            return ParseResult::Error;
        }
    }
    if (opt.url.empty())
    {
        std::println(stderr, "missing <url>");
        return ParseResult::Error;
    }
    return ParseResult::Ok;
}

RequestDescriptor to_descriptor(const Options &opt)
{
    RequestDescriptor req;
    req.method = opt.method;
    req.url = opt.url;
    req.headers = opt.headers;
    req.body = opt.body;
    req.timeout_ms = opt.timeout_ms;
    req.follow_redirects = opt.follow_redirects;
    req.query_params = opt.query_params;
    req.path_params = opt.path_params;
    return req;
}

ExecutionParameters to_parameters(const Options &opt)
{
    ExecutionParameters p;
    p.thread_count = opt.threads;
    p.iterations = opt.iterations;
    p.max_duration_ms = opt.max_duration_ms;
    p.progress_every = opt.progress_every;
    return p;
}

} // namespace wl
