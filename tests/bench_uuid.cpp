// bench_uuid.cpp
//
// Generation and rendering throughput. Entropy sources are started once per
// benchmark outside the timed loop.

#include "uuidforge/entropy/system_entropy.hpp"
#include "uuidforge/uuid/name_based.hpp"
#include "uuidforge/uuid/render.hpp"
#include "uuidforge/uuid/time_based.hpp"

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace uuidforge {
namespace {

void BM_V7Generate(benchmark::State &state) {
  EntropyConfig cfg;
  cfg.source = static_cast<EntropySourceKind>(state.range(0));
  auto source = make_entropy_source(cfg);
  if (auto r = source->start(); !r) {
    state.SkipWithError(r.error().message().c_str());
    return;
  }
  V7Generator gen(*source);
  state.SetLabel(std::string(source->name()));

  for (auto _ : state) {
    auto id = gen.generate();
    if (!id) {
      state.SkipWithError(id.error().message().c_str());
      return;
    }
    benchmark::DoNotOptimize(id->bytes());
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_V7Generate)
    ->Arg(static_cast<int>(EntropySourceKind::Openssl))
    ->Arg(static_cast<int>(EntropySourceKind::Getrandom));

void BM_V7Batch(benchmark::State &state) {
  OpenSslEntropySource source(entropy::kDefaultMaxRequestBits);
  if (auto r = source.start(); !r) {
    state.SkipWithError(r.error().message().c_str());
    return;
  }
  V7Generator gen(source);
  const auto count = state.range(0);

  for (auto _ : state) {
    auto batch = gen.generate_batch(count);
    if (!batch) {
      state.SkipWithError(batch.error().message().c_str());
      return;
    }
    benchmark::DoNotOptimize(batch->data());
  }
  state.SetItemsProcessed(count * state.iterations());
}

BENCHMARK(BM_V7Batch)->Arg(100)->Arg(1000)->Unit(benchmark::kMicrosecond);

void BM_V5Generate(benchmark::State &state) {
  const std::string name(static_cast<std::size_t>(state.range(0)), 'n');

  for (auto _ : state) {
    auto id = generate_v5(Namespace::Dns, name);
    if (!id) {
      state.SkipWithError(id.error().message().c_str());
      return;
    }
    benchmark::DoNotOptimize(id->bytes());
  }
  state.SetBytesProcessed(static_cast<int64_t>(name.size()) *
                          state.iterations());
}

BENCHMARK(BM_V5Generate)->Arg(16)->Arg(256)->Arg(4096);

void BM_Render(benchmark::State &state) {
  const auto format = static_cast<Format>(state.range(0));
  const auto id = namespace_dns();
  state.SetLabel(std::string(to_string_view(format)));

  for (auto _ : state) {
    auto text = render(id, format);
    benchmark::DoNotOptimize(text.data());
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Render)
    ->Arg(static_cast<int>(Format::Standard))
    ->Arg(static_cast<int>(Format::Hex))
    ->Arg(static_cast<int>(Format::Urn))
    ->Arg(static_cast<int>(Format::Raw));

} // namespace
} // namespace uuidforge
