// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <benchmark/benchmark.h>

#include "codec/decoder.hpp"
#include "codec/serialization.hpp"
#include "codec/value.hpp"

using lize::codec::Value;

class RecordVectorFixture : public benchmark::Fixture {
 protected:
  std::vector<std::string> names_;
  Value records_;

  void SetUp(const benchmark::State &state) override {
    names_.clear();
    names_.reserve(state.range(0));
    for (int64_t i = 0; i < state.range(0); ++i) {
      names_.emplace_back("Record " + std::to_string(i));
    }
    Value::TVector records;
    records.reserve(names_.size());
    for (size_t i = 0; i < names_.size(); ++i) {
      records.emplace_back(Value::THashMap{
          {Value("name"), Value(std::string_view(names_[i]))},
          {Value("position"), Value(static_cast<int64_t>(i))},
          {Value("user_declared"), Value(i % 2 == 0)},
          {Value("kind"), Value::MakeSmallU8(static_cast<uint8_t>(i % 6))},
          {Value("token"), i % 3 == 0 ? Value::MakeNone() : Value::MakeOptional(Value(static_cast<int32_t>(i)))},
      });
    }
    records_ = Value(std::move(records));
  }

  void TearDown(const benchmark::State &) override {
    records_ = Value();
    names_.clear();
  }
};

BENCHMARK_DEFINE_F(RecordVectorFixture, Serial)(benchmark::State &state) {
  for (auto _ : state) {
    lize::codec::Builder builder([](const uint8_t *, size_t) {});
    lize::codec::Serialize(records_, &builder);
    builder.Finalize();
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK_DEFINE_F(RecordVectorFixture, Deserial)(benchmark::State &state) {
  const auto encoded = lize::codec::Serialize(records_);
  for (auto _ : state) {
    auto decoded = lize::codec::Deserialize(encoded);
    benchmark::DoNotOptimize(decoded);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(encoded.size()));
}

BENCHMARK_REGISTER_F(RecordVectorFixture, Serial)->RangeMultiplier(4)->Range(4, 1 << 12)->Unit(benchmark::kNanosecond);

BENCHMARK_REGISTER_F(RecordVectorFixture, Deserial)
    ->RangeMultiplier(4)
    ->Range(4, 1 << 12)
    ->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
