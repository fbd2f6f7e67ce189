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

#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <vector>

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "codec/serialization.hpp"
#include "codec/codes.hpp"
#include "codec/value.hpp"

#include "codec_common.hpp"

using lize::codec::Value;

namespace {

std::vector<uint8_t> Concat(std::initializer_list<std::vector<uint8_t>> parts) {
  std::vector<uint8_t> ret;
  for (const auto &part : parts) {
    ret.insert(ret.end(), part.begin(), part.end());
  }
  return ret;
}

// Little-endian u64 length prefix.
std::vector<uint8_t> Length(uint64_t length) {
  std::vector<uint8_t> ret;
  for (int i = 0; i < 8; ++i) {
    ret.push_back(static_cast<uint8_t>(length >> (8 * i)));
  }
  return ret;
}

}  // namespace

#define CREATE_WIRE_TEST(value, ...)                                            \
  {                                                                             \
    const Value original = value;                                               \
    const std::vector<uint8_t> expected = __VA_ARGS__;                          \
    const auto encoded = lize::codec::Serialize(original);                      \
    ASSERT_EQ(encoded, expected) << "while encoding " << original;              \
    ASSERT_EQ(lize::codec::Deserialize(encoded), original) << "while decoding"; \
  }

TEST(CodecCore, WireFormat) {
  CREATE_WIRE_TEST(Value(true), {0x06});
  CREATE_WIRE_TEST(Value(false), {0x07});
  CREATE_WIRE_TEST(Value(uint8_t{200}), {0x0d, 0xc8});
  CREATE_WIRE_TEST(Value::MakeSmallU8(0), {0x14});
  CREATE_WIRE_TEST(Value::MakeSmallU8(5), {0x19});
  CREATE_WIRE_TEST(Value::MakeSmallU8(235), {0xff});
  CREATE_WIRE_TEST(Value(int32_t{0x01020304}), {0x0b, 0x04, 0x03, 0x02, 0x01});
  CREATE_WIRE_TEST(Value(int32_t{-1}), {0x0b, 0xff, 0xff, 0xff, 0xff});
  CREATE_WIRE_TEST(Value(int64_t{1}), {0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
  CREATE_WIRE_TEST(Value(int64_t{-2}), {0x00, 0xfe, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff});
  CREATE_WIRE_TEST(Value(1.0F), {0x0c, 0x00, 0x00, 0x80, 0x3f});
  CREATE_WIRE_TEST(Value(1.0), {0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xf0, 0x3f});
  CREATE_WIRE_TEST(Value("abc"), Concat({{0x01}, Length(3), {'a', 'b', 'c'}}));
  CREATE_WIRE_TEST(Value(""), Concat({{0x01}, Length(0)}));
  CREATE_WIRE_TEST(Value::MakeOpaque({0x01, 0x02}), Concat({{0x0e}, Length(2), {0x01, 0x02}}));
  CREATE_WIRE_TEST(Value::MakeNone(), {0x09, 0x00});
  CREATE_WIRE_TEST(Value::MakeOptional(Value(true)), {0x09, 0x01, 0x06});
  CREATE_WIRE_TEST(Value(Value::TVector{}), Concat({{0x02}, Length(0)}));
  CREATE_WIRE_TEST(Value(Value::THashMap{}), Concat({{0x04}, Length(0)}));
  CREATE_WIRE_TEST(Value(Value::TVector{Value(true), Value::MakeSmallU8(1)}),
                   Concat({{0x02}, Length(2), {0x06, 0x15}}));
  CREATE_WIRE_TEST(Value(Value::THashMap{{Value::MakeSmallU8(1), Value(false)}}),
                   Concat({{0x04}, Length(1), {0x15, 0x07}}));
}

TEST(CodecCore, SliceLikeEncodesAsSlice) {
  const auto bytes = GetRandomData(300);
  const auto slice = lize::codec::Serialize(Value(Value::TSlice(bytes)));
  const auto slice_like = lize::codec::Serialize(Value::MakeSliceLike(bytes));
  ASSERT_EQ(slice, slice_like);

  const auto decoded = lize::codec::Deserialize(slice_like);
  ASSERT_TRUE(decoded.IsSlice());
  ASSERT_FALSE(decoded.IsSliceLike());
  ASSERT_EQ(decoded, Value(Value::TSlice(bytes)));
}

TEST(CodecCore, DecodedSliceBorrowsBuffer) {
  const auto encoded = lize::codec::Serialize(Value("hello"));
  const auto decoded = lize::codec::Deserialize(encoded);
  ASSERT_EQ(decoded.ValueString(), "hello");
  ASSERT_EQ(decoded.ValueSlice().data(), encoded.data() + 1 + sizeof(lize::codec::LengthPrefix));
}

TEST(CodecCore, OpaqueIsCopied) {
  auto encoded = lize::codec::Serialize(Value::MakeOpaque({0x10, 0x20, 0x30}));
  const auto decoded = lize::codec::Deserialize(encoded);
  encoded.back() = 0x00;
  ASSERT_EQ(decoded.ValueOpaque(), (std::vector<uint8_t>{0x10, 0x20, 0x30}));
}

TEST(CodecCore, NestedRoundTrip) {
  const Value original(Value::THashMap{
      {Value("k"), Value::MakeOptional(Value(Value::TVector{Value(int64_t{1}), Value(false)}))}});
  const auto encoded = lize::codec::Serialize(original);
  ASSERT_EQ(encoded, Concat({{0x04}, Length(1), {0x01}, Length(1), {'k', 0x09, 0x01, 0x02}, Length(2),
                             {0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x07}}));
  ASSERT_EQ(lize::codec::Deserialize(encoded), original);
}

TEST(CodecCore, RoundTripEveryVariant) {
  const auto opaque = GetRandomData(1000);
  const Value original(Value::TVector{
      Value(true),
      Value(false),
      Value(uint8_t{0}),
      Value(uint8_t{255}),
      Value::MakeSmallU8(0),
      Value::MakeSmallU8(235),
      Value(std::numeric_limits<int32_t>::min()),
      Value(std::numeric_limits<int32_t>::max()),
      Value(std::numeric_limits<int64_t>::min()),
      Value(std::numeric_limits<int64_t>::max()),
      Value(-0.5F),
      Value(std::numeric_limits<double>::infinity()),
      Value("some text"),
      Value::MakeOpaque(opaque),
      Value::MakeNone(),
      Value::MakeOptional(Value::MakeNone()),
      Value(Value::TVector{Value(Value::TVector{}), Value(Value::THashMap{})}),
      Value(Value::THashMap{{Value(Value::TVector{Value(int32_t{1})}), Value::MakeOptional(Value(1.25))}}),
  });

  lize::codec::Loopback loopback;
  auto builder = loopback.GetBuilder();
  lize::codec::Serialize(original, builder);
  auto reader = loopback.GetReader();
  const auto decoded = lize::codec::Decode(reader);
  ASSERT_EQ(decoded, original);
}

TEST(CodecCore, HashMapKeepsOrderAndDuplicates) {
  const Value original(Value::THashMap{{Value("c"), Value(int64_t{1})},
                                       {Value("a"), Value(int64_t{2})},
                                       {Value("b"), Value(int64_t{3})},
                                       {Value("a"), Value(int64_t{4})}});
  const auto encoded = lize::codec::Serialize(original);
  const auto decoded = lize::codec::Deserialize(encoded);
  const auto &pairs = decoded.ValueHashMap();
  ASSERT_EQ(pairs.size(), 4);
  ASSERT_EQ(pairs[0].first.ValueString(), "c");
  ASSERT_EQ(pairs[1].first.ValueString(), "a");
  ASSERT_EQ(pairs[2].first.ValueString(), "b");
  ASSERT_EQ(pairs[3].first.ValueString(), "a");
  ASSERT_EQ(pairs[3].second.ValueI64(), 4);
}

TEST(CodecCore, NaNRoundTripsBitExact) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const auto encoded = lize::codec::Serialize(Value(nan));
  const auto decoded = lize::codec::Deserialize(encoded);
  ASSERT_TRUE(decoded.IsF64());
  ASSERT_NE(decoded.ValueF64(), decoded.ValueF64());
  ASSERT_EQ(lize::codec::Serialize(decoded), encoded);
}

TEST(CodecCore, DecodeLeavesTrailingValues) {
  lize::codec::Loopback loopback;
  auto builder = loopback.GetBuilder();
  lize::codec::Serialize(Value(int32_t{1}), builder);
  lize::codec::Serialize(Value("two"), builder);
  lize::codec::Serialize(Value::MakeSmallU8(3), builder);
  auto reader = loopback.GetReader();
  ASSERT_EQ(lize::codec::Decode(reader), Value(int32_t{1}));
  ASSERT_EQ(reader->GetPos(), 5);
  ASSERT_EQ(lize::codec::Decode(reader), Value("two"));
  ASSERT_EQ(lize::codec::Decode(reader), Value::MakeSmallU8(3));
}

TEST(CodecCore, LargeVector) {
  Value::TVector items;
  for (int64_t i = 0; i < 10000; ++i) {
    items.emplace_back(i);
  }
  const Value original(std::move(items));
  const auto encoded = lize::codec::Serialize(original);
  ASSERT_EQ(encoded.size(), 1 + sizeof(lize::codec::LengthPrefix) + 10000 * 9);
  ASSERT_EQ(lize::codec::Deserialize(encoded), original);
}
