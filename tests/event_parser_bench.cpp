#include "taskwarden/executor/progress.hpp"
#include "taskwarden/protocol/event_parser.hpp"

#include <nlohmann/json.hpp>

#include <benchmark/benchmark.h>

#include <string>

using namespace taskwarden;
using json = nlohmann::json;

namespace {

auto make_stream(int events) -> std::string {
  std::string out;
  for (int i = 0; i < events; ++i) {
    auto item = "i" + std::to_string(i);
    out += json{{"type", "item.started"},
                {"itemId", item},
                {"data", {{"type", "command_execution"}, {"command", "make"}}}}
               .dump();
    out += '\n';
    out += json{{"type", "item.completed"},
                {"itemId", item},
                {"data", {{"type", "file_change"},
                          {"path", "src/file_" + std::to_string(i) + ".cpp"},
                          {"operation", "modified"}}}}
               .dump();
    out += '\n';
  }
  return out;
}

}  // namespace

static void BM_EventParserFeed(benchmark::State& state) {
  const auto stream = make_stream(static_cast<int>(state.range(0)));
  const auto chunk = static_cast<std::size_t>(state.range(1));

  for (auto _ : state) {
    EventStreamParser parser;
    std::size_t emitted = 0;
    for (std::size_t pos = 0; pos < stream.size(); pos += chunk) {
      emitted += parser.feed(std::string_view{stream}.substr(pos, chunk)).size();
    }
    benchmark::DoNotOptimize(emitted);
  }

  state.SetBytesProcessed(static_cast<std::int64_t>(stream.size()) *
                          state.iterations());
}

static void BM_EventParserDecodeLine(benchmark::State& state) {
  const auto line =
      json{{"type", "item.completed"},
           {"itemId", "i1"},
           {"data", {{"type", "agent_message"}, {"text", std::string(256, 'x')}}}}
          .dump();

  for (auto _ : state) {
    benchmark::DoNotOptimize(EventStreamParser::decode_line(line));
  }

  state.SetItemsProcessed(state.iterations());
}

static void BM_ProgressEngineProcess(benchmark::State& state) {
  EventStreamParser parser;
  auto events = parser.feed(make_stream(static_cast<int>(state.range(0))));

  for (auto _ : state) {
    ProgressEngine engine;
    for (const auto& event : events) {
      engine.process_event(event);
    }
    benchmark::DoNotOptimize(engine.progress());
  }

  state.SetItemsProcessed(static_cast<std::int64_t>(events.size()) *
                          state.iterations());
}

BENCHMARK(BM_EventParserFeed)
    ->Args({100, 64})
    ->Args({100, 4096})
    ->Args({1000, 4096})
    ->Args({1000, 65536});

BENCHMARK(BM_EventParserDecodeLine);

BENCHMARK(BM_ProgressEngineProcess)->Arg(10)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
