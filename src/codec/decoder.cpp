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

#include "codec/decoder.hpp"

#include <algorithm>
#include <utility>

#include "codec/codes.hpp"
#include "codec/exceptions.hpp"
#include "utils/cast.hpp"
#include "utils/endian.hpp"
#include "utils/logging.hpp"

namespace lize::codec {

namespace {

// Counts come from the input, so only this many elements are reserved upfront.
// A Value takes far more memory than its smallest encoding; larger composites
// grow while they are decoded.
constexpr size_t kMaxReservedElements = 1024;

template <typename T>
T LoadPrimitive(Reader *reader) {
  T value;
  reader->Load(reinterpret_cast<uint8_t *>(&value), sizeof(T));
  return utils::LittleEndianToHost(value);
}

uint8_t LoadByte(Reader *reader) { return LoadPrimitive<uint8_t>(reader); }

// Reads a length prefix and checks it against the configured maximum and the
// platform's size_t.
size_t LoadLength(Reader *reader, const DecoderOptions &options) {
  const auto length = LoadPrimitive<LengthPrefix>(reader);
  if (length > options.max_length) {
    throw LengthOverflowException("Length {} exceeds the maximum of {}", length, options.max_length);
  }
  const auto narrowed = utils::NarrowCast<size_t>(length);
  if (!narrowed) {
    throw LengthOverflowException("Length {} isn't representable on this platform", length);
  }
  return *narrowed;
}

// Every element of a composite occupies at least `min_element_size` bytes, so
// a count that can't possibly fit is rejected before anything is allocated.
size_t LoadCount(Reader *reader, const DecoderOptions &options, size_t min_element_size) {
  const auto count = LoadLength(reader, options);
  if (count > reader->GetRemaining() / min_element_size) {
    throw TruncationException("Declared {} elements, but only {} bytes remain at position {}", count,
                              reader->GetRemaining(), reader->GetPos());
  }
  return count;
}

Value DecodeAt(Reader *reader, const DecoderOptions &options, uint64_t depth);

Value DecodeOptional(Reader *reader, const DecoderOptions &options, uint64_t depth) {
  const auto presence = LoadByte(reader);
  switch (static_cast<Presence>(presence)) {
    case Presence::Absent:
      return Value::MakeNone();
    case Presence::Present:
      return Value::MakeOptional(DecodeAt(reader, options, depth + 1));
  }
  throw UnknownVariantException("Unknown presence flag {:#04x} at position {}", presence, reader->GetPos() - 1);
}

Value DecodeVector(Reader *reader, const DecoderOptions &options, uint64_t depth) {
  const auto count = LoadCount(reader, options, 1);
  Value::TVector vector;
  vector.reserve(std::min(count, kMaxReservedElements));
  for (size_t i = 0; i < count; ++i) {
    vector.emplace_back(DecodeAt(reader, options, depth + 1));
  }
  return Value(std::move(vector));
}

Value DecodeHashMap(Reader *reader, const DecoderOptions &options, uint64_t depth) {
  const auto count = LoadCount(reader, options, 2);
  Value::THashMap hash_map;
  hash_map.reserve(std::min(count, kMaxReservedElements));
  for (size_t i = 0; i < count; ++i) {
    auto key = DecodeAt(reader, options, depth + 1);
    auto item = DecodeAt(reader, options, depth + 1);
    hash_map.emplace_back(std::move(key), std::move(item));
  }
  return Value(std::move(hash_map));
}

Value DecodeAt(Reader *reader, const DecoderOptions &options, uint64_t depth) {
  if (depth > options.max_depth) {
    throw NestingDepthException("Buffer is nested deeper than the maximum depth of {}", options.max_depth);
  }
  const auto tag = LoadByte(reader);
  if (tag >= utils::UnderlyingCast(Marker::SmallU8Base)) {
    return Value::MakeSmallU8(static_cast<uint8_t>(tag - utils::UnderlyingCast(Marker::SmallU8Base)));
  }
  switch (static_cast<Marker>(tag)) {
    case Marker::I64:
      return Value(LoadPrimitive<int64_t>(reader));
    case Marker::Slice: {
      const auto length = LoadLength(reader, options);
      return Value(reader->LoadView(length));
    }
    case Marker::Vector:
      return DecodeVector(reader, options, depth);
    case Marker::HashMap:
      return DecodeHashMap(reader, options, depth);
    case Marker::True:
      return Value(true);
    case Marker::False:
      return Value(false);
    case Marker::F64:
      return Value(utils::MemcpyCast<double>(LoadPrimitive<uint64_t>(reader)));
    case Marker::Optional:
      return DecodeOptional(reader, options, depth);
    case Marker::I32:
      return Value(LoadPrimitive<int32_t>(reader));
    case Marker::F32:
      return Value(utils::MemcpyCast<float>(LoadPrimitive<uint32_t>(reader)));
    case Marker::U8:
      return Value(LoadByte(reader));
    case Marker::Opaque: {
      const auto length = LoadLength(reader, options);
      const auto bytes = reader->LoadView(length);
      return Value::MakeOpaque(Value::TBytes(bytes.begin(), bytes.end()));
    }
    case Marker::SmallU8Base:
      break;
  }
  throw UnknownVariantException("Unknown tag {:#04x} at position {}", tag, reader->GetPos() - 1);
}

}  // namespace

Value Decode(Reader *reader, const DecoderOptions &options) {
  DLIZE_ASSERT(reader != nullptr, "Decode requires a reader!");
  return DecodeAt(reader, options, 1);
}

}  // namespace lize::codec
