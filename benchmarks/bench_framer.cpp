#include <benchmark/benchmark.h>
#include "lspc/codec.hpp"
#include "lspc/framer.hpp"
#include <string>
#include <vector>

using namespace lspc;

static const std::string kHoverRequest =
    R"({"jsonrpc":"2.0","id":7,"method":"textDocument/hover","params":{"textDocument":{"uri":"file:///w/main.zig"},"position":{"line":12,"character":4}}})";

// A completion response with N items
static std::string make_completion_response(int n) {
    nlohmann::json items = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        items.push_back({
            {"label", "symbol_" + std::to_string(i)},
            {"kind", 3},
            {"detail", "fn symbol_" + std::to_string(i) + "(a: u32, b: []const u8) !void"},
            {"documentation", {{"kind", "markdown"}, {"value", "Does something useful, number " + std::to_string(i)}}}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"isIncomplete", false}, {"items", items}}}
    };
    return resp.dump();
}

static const std::string kCompletionResponse = make_completion_response(200);

// ---- Codec ----

static void BM_ParseSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kHoverRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kHoverRequest.size());
}
BENCHMARK(BM_ParseSmallRequest)->MinTime(1.0);

static void BM_ParseLargeResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kCompletionResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kCompletionResponse.size());
}
BENCHMARK(BM_ParseLargeResponse)->MinTime(1.0);

static void BM_SerializeRequest(benchmark::State& state) {
    Request req;
    req.id = RequestId{int64_t{1}};
    req.method = "textDocument/completion";
    req.params = nlohmann::json{
        {"textDocument", {{"uri", "file:///w/main.zig"}}},
        {"position", {{"line", 1}, {"character", 2}}}
    };
    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeRequest)->MinTime(1.0);

// ---- Framer ----

static void BM_EncodeFrame(benchmark::State& state) {
    auto msg = Codec::parse(kCompletionResponse);
    for (auto _ : state) {
        auto wire = Framer::encode(msg);
        benchmark::DoNotOptimize(wire);
    }
    state.SetBytesProcessed(state.iterations() * kCompletionResponse.size());
}
BENCHMARK(BM_EncodeFrame)->MinTime(1.0);

// Decode a stream of frames delivered in chunks of state.range(0) bytes.
static void BM_DecodeChunked(benchmark::State& state) {
    const size_t chunk = static_cast<size_t>(state.range(0));
    std::string stream;
    for (int i = 0; i < 20; ++i) stream += Framer::frame(kHoverRequest);
    stream += Framer::frame(kCompletionResponse);

    for (auto _ : state) {
        Framer framer;
        size_t decoded = 0;
        for (size_t off = 0; off < stream.size(); off += chunk) {
            framer.feed(std::string_view(stream).substr(off, chunk),
                        [&decoded](Message) { ++decoded; });
        }
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_DecodeChunked)->Arg(64)->Arg(4096)->Arg(65536)->MinTime(1.0);
