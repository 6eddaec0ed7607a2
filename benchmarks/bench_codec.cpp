#include <benchmark/benchmark.h>
#include "tix/codec.hpp"
#include "tix/error.hpp"
#include "tix/tickets.hpp"
#include <string>

using namespace tix;

static const std::string kSmallRequest =
    R"({"id":"1","method":"initialize"})";

static const std::string kToolCallRequest =
    R"({"id":"42","method":"tools/call","params":{"name":"get_done_tickets","arguments":{"limit":10,"verbose":true}}})";

// tools/call response carrying n tickets
static Response make_ticket_response(int n) {
    nlohmann::json tickets = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tickets.push_back({
            {"id", "T" + std::to_string(i)},
            {"title", "Ticket number " + std::to_string(i) + " with a reasonably long title"},
            {"status", (i % 3 == 0) ? "pending" : (i % 3 == 1) ? "todo" : "done"}
        });
    }
    return Response::success("1", {{"tickets", tickets}, {"meta", {{"count", n}}}});
}

static const Response kLargeResponse = make_ticket_response(500);

// ---- Parse benchmarks ----

static void BM_ParseSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallRequest)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto req = Codec::parse(bad);
            benchmark::DoNotOptimize(req);
        } catch (const TixParseError& e) {
            benchmark::DoNotOptimize(e.request_id());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeErrorResponse(benchmark::State& state) {
    Response resp = Response::failure("5", error::MethodNotFound, "Method not found: unknown/thing");
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeErrorResponse)->MinTime(1.0);

static void BM_SerializeLargeResponse(benchmark::State& state) {
    std::size_t bytes = Codec::serialize(kLargeResponse).size();
    for (auto _ : state) {
        auto s = Codec::serialize(kLargeResponse);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * bytes);
}
BENCHMARK(BM_SerializeLargeResponse)->MinTime(1.0);

static void BM_ParseLargeResponse(benchmark::State& state) {
    const std::string raw = Codec::serialize(kLargeResponse);
    for (auto _ : state) {
        auto resp = Codec::parse_response(raw);
        benchmark::DoNotOptimize(resp);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ParseLargeResponse)->MinTime(1.0);
