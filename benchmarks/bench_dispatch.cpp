#include <benchmark/benchmark.h>
#include "tix/codec.hpp"
#include "tix/handlers.hpp"
#include "tix/router.hpp"
#include "tix/session.hpp"
#include <string>
#include <vector>

using namespace tix;

namespace {

struct Fixture {
    ServerContext ctx = ServerContext::builtin();
    Router router;
    Fixture() { register_handlers(router, ctx); }
};

// Never read from; handle_frame only needs the router.
class NullConnection : public IConnection {
public:
    std::optional<std::string> read_frame() override { return std::nullopt; }
    void write_frame(const std::string&) override {}
    void close() override {}
    std::string remote_endpoint() const override { return "null"; }
};

} // anonymous namespace

static void BM_DispatchToolsList(benchmark::State& state) {
    Fixture f;
    Request req{"1", "tools/list", std::nullopt};

    for (auto _ : state) {
        auto resp = f.router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    Fixture f;
    Request req{"1", "not_registered_method", std::nullopt};

    for (auto _ : state) {
        auto resp = f.router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchToolCall(benchmark::State& state) {
    Fixture f;
    std::vector<Request> requests = {
        {"1", "tools/call", nlohmann::json{{"name", "get_pending_tickets"}}},
        {"2", "tools/call", nlohmann::json{{"name", "get_done_tickets"}}},
        {"3", "tools/call", nlohmann::json{{"name", "get_todo_tickets"}}},
    };

    std::size_t i = 0;
    for (auto _ : state) {
        auto resp = f.router.dispatch(requests[i % requests.size()]);
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_DispatchToolCall)->MinTime(1.0);

// Decode, route and encode one frame, as the session loop does.
static void BM_HandleFrame(benchmark::State& state) {
    Fixture f;
    NullConnection conn;
    Session session("bench", conn, f.router);
    const std::string frame =
        R"({"id":"3","method":"tools/call","params":{"name":"get_done_tickets"}})";

    for (auto _ : state) {
        auto resp = session.handle_frame(frame);
        auto out = Codec::serialize(resp);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleFrame)->MinTime(1.0);
