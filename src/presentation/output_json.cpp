#include "wl/output.hpp"

#include <sstream>
#include <iomanip>

#include "wl/json.hpp"

namespace wl
{
namespace
{
void write_string_map(std::ostringstream &os,
                      const std::map<std::string, std::string> &m)
{
    os << "{";
    bool first = true;
    for (const auto &[k, v]: m)
    {
        if (!first) os << ",";
        first = false;
        os << json_string(k) << ":" << json_string(v);
    }
    os << "}";
}

void write_request(std::ostringstream &os, const RequestDescriptor &req)
{
    os << R"({"method":")" << method_str(req.method) << R"(")";
    os << R"(,"url":)" << json_string(req.url);
    os << R"(,"headers":)";
    write_string_map(os, req.headers);
    os << R"(,"body":)";
    if (req.body) os << json_string(*req.body);
    else os << "null";
    os << R"(,"timeout_ms":)" << req.timeout_ms;
    os << R"(,"follow_redirects":)" << (req.follow_redirects ? "true" : "false");
    os << R"(,"query_params":)";
    write_string_map(os, req.query_params);
    os << R"(,"path_params":)";
    write_string_map(os, req.path_params);
    os << "}";
}

void write_error(std::ostringstream &os, const ExecutionError &e)
{
    os << R"({"call":)" << e.call_index
            << R"(,"ok":false,"kind":")" << error_kind_str(e.kind) << R"(")"
            << R"(,"error":)" << json_string(e.message);
    if (!e.cause.empty()) os << R"(,"cause":)" << json_string(e.cause);
    os << R"(,"timestamp_ms":)" << epoch_ms(e.timestamp) << "}";
}
} // namespace

std::string build_ndjson_outcome(const CallOutcome &o)
{
    std::ostringstream os;
    if (const auto *ok = std::get_if<CallSuccess>(&o))
    {
        os << R"({"call":)" << ok->call_index
                << R"(,"ok":true,"status":)" << ok->status_code
                << R"(,"status_text":)" << json_string(ok->status_text)
                << R"(,"ms":)" << json_number(ok->response_ms)
                << R"(,"bytes":)" << ok->body_bytes
                << R"(,"timestamp_ms":)" << epoch_ms(ok->timestamp) << "}";
    }
    else
    {
        write_error(os, std::get<ExecutionError>(o));
    }
    return os.str();
}

std::string build_final_json(const AggregateResult &r)
{
    std::ostringstream os;
    os << "{";
    os << R"("status":")" << run_status_str(r.status) << R"(",)";
    os << R"("budget_exhausted":)" << (r.budget_exhausted ? "true" : "false") << ",";
    os << R"("request":)";
    write_request(os, r.request);
    os << ",";
    os << R"("parameters":{"thread_count":)" << r.thread_count
            << R"(,"iterations":)" << r.iterations
            << R"(,"total_calls":)"
            << static_cast<long long>(r.thread_count) * r.iterations << "},";
    os << R"("start_time_ms":)" << epoch_ms(r.start_time)
            << R"(,"end_time_ms":)" << epoch_ms(r.end_time)
            << R"(,"elapsed_ms":)" << json_number(r.elapsed_ms) << ",";
    os << R"("counts":{"total":)" << r.total_requests
            << R"(,"success":)" << r.successful_requests
            << R"(,"failed":)" << r.failed_requests
            << R"(,"success_rate":)" << json_number(r.success_rate(), 2)
            << R"(,"failure_rate":)" << json_number(r.failure_rate(), 2) << "},";

    const auto &rt = r.response_times;
    os << R"("response_time_ms":{"min":)" << json_number(rt.min)
            << R"(,"max":)" << json_number(rt.max)
            << R"(,"avg":)" << json_number(rt.average)
            << R"(,"median":)" << json_number(rt.median)
            << R"(,"p95":)" << json_number(rt.p95)
            << R"(,"p99":)" << json_number(rt.p99) << "},";
    if (!r.percentiles.empty())
    {
        os << R"("percentiles":{)";
        for (size_t i = 0; i < r.percentiles.size(); ++i)
        {
            if (i) os << ",";
            os << R"("p)" << r.percentiles[i].first << R"(":)"
                    << json_number(r.percentiles[i].second);
        }
        os << "},";
    }

    const auto &tp = r.throughput;
    os << R"("throughput":{"requests_per_second":)" << json_number(tp.requests_per_second)
            << R"(,"bytes_per_second":)" << json_number(tp.bytes_per_second)
            << R"(,"total_bytes":)" << tp.total_bytes
            << R"(,"average_response_size":)" << tp.average_response_size << "},";

    os << R"("status_codes":{)";
    bool first = true;
    for (const auto &[code, n]: r.status_codes)
    {
        if (!first) os << ",";
        first = false;
        os << R"(")" << code << R"(":)" << n;
    }
    os << "},";

    os << R"("errors":{"by_kind":{)";
    first = true;
    for (const auto &[kind, n]: r.error_kinds)
    {
        if (!first) os << ",";
        first = false;
        os << R"(")" << error_kind_str(kind) << R"(":)" << n;
    }
    os << "}";
    if (auto k = r.most_common_error_kind())
        os << R"(,"most_common_kind":")" << error_kind_str(*k) << R"(")";
    os << R"(,"by_message":{)";
    first = true;
    for (const auto &[msg, n]: r.error_messages)
    {
        if (!first) os << ",";
        first = false;
        os << json_string(msg) << ":" << n;
    }
    os << "}},";

    os << R"("failures":[)";
    for (size_t i = 0; i < r.failures.size(); ++i)
    {
        if (i) os << ",";
        write_error(os, r.failures[i]);
    }
    os << "]";
    os << "}";
    return os.str();
}
} // namespace wl
