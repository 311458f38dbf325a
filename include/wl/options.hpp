#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "wl/model.hpp"

namespace wl
{
struct Options
{
    // request
    std::string url;
    HttpMethod method = HttpMethod::GET;
    Headers headers;                   // -H "Name: value", last one wins
    std::optional<std::string> body;   // -d
    int timeout_ms = 30000;            // per call
    bool follow_redirects = true;
    std::map<std::string, std::string> query_params;
    std::map<std::string, std::string> path_params;
    // execution
    int threads = 1;
    int iterations = 1;
    int max_duration_ms = 0;   // whole-run budget, 0 = unlimited
    bool progress = false;     // print progress lines on stderr
    int progress_every = 10;
    // output
    bool json = false;         // final aggregate as one JSON object
    bool ndjson = false;       // one JSON line per call
    std::vector<int> pctl;     // extra percentiles (0..100)
    std::string log_level = "warn";
};

RequestDescriptor to_descriptor(const Options &opt);

ExecutionParameters to_parameters(const Options &opt);
} // namespace wl
