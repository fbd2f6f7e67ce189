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

#include "codec/encoder.hpp"

#include "codec/codes.hpp"
#include "codec/exceptions.hpp"
#include "utils/cast.hpp"
#include "utils/endian.hpp"
#include "utils/logging.hpp"

namespace lize::codec {

namespace {

void SaveMarker(Marker marker, Builder *builder) {
  const auto byte = utils::UnderlyingCast(marker);
  builder->Save(&byte, 1);
}

template <typename T>
void SavePrimitive(T value, Builder *builder) {
  T encoded = utils::HostToLittleEndian(value);
  builder->Save(reinterpret_cast<const uint8_t *>(&encoded), sizeof(T));
}

void SaveLength(uint64_t length, Builder *builder) { SavePrimitive<LengthPrefix>(length, builder); }

void SaveBytes(Value::TSlice bytes, Builder *builder) {
  SaveLength(bytes.size(), builder);
  builder->Save(bytes.data(), bytes.size());
}

void CheckSmallU8(uint8_t value) {
  if (value > kSmallU8Max) {
    throw ConstructionException("SmallU8 must be less than or equal to {}, got {}", kSmallU8Max, value);
  }
}

void Validate(const Value &value, const EncoderOptions &options, uint64_t depth) {
  if (depth > options.max_depth) {
    throw NestingDepthException("Value is nested deeper than the maximum depth of {}", options.max_depth);
  }
  switch (value.type()) {
    case Value::Type::SmallU8:
      CheckSmallU8(value.ValueSmallU8());
      return;
    case Value::Type::Optional:
      if (const auto *inner = value.ValueOptional(); inner != nullptr) {
        Validate(*inner, options, depth + 1);
      }
      return;
    case Value::Type::Vector:
      for (const auto &item : value.ValueVector()) {
        Validate(item, options, depth + 1);
      }
      return;
    case Value::Type::HashMap:
      for (const auto &[key, item] : value.ValueHashMap()) {
        Validate(key, options, depth + 1);
        Validate(item, options, depth + 1);
      }
      return;
    default:
      return;
  }
}

}  // namespace

void Validate(const Value &value, const EncoderOptions &options) { Validate(value, options, 1); }

void Encode(const Value &value, Builder *builder) {
  switch (value.type()) {
    case Value::Type::Bool:
      SaveMarker(value.ValueBool() ? Marker::True : Marker::False, builder);
      return;
    case Value::Type::U8:
      SaveMarker(Marker::U8, builder);
      SavePrimitive(value.ValueU8(), builder);
      return;
    case Value::Type::SmallU8: {
      // The whole value is a single byte above the last real marker.
      const auto small = value.ValueSmallU8();
      CheckSmallU8(small);
      const auto byte = static_cast<uint8_t>(utils::UnderlyingCast(Marker::SmallU8Base) + small);
      builder->Save(&byte, 1);
      return;
    }
    case Value::Type::I32:
      SaveMarker(Marker::I32, builder);
      SavePrimitive(value.ValueI32(), builder);
      return;
    case Value::Type::I64:
      SaveMarker(Marker::I64, builder);
      SavePrimitive(value.ValueI64(), builder);
      return;
    case Value::Type::F32:
      SaveMarker(Marker::F32, builder);
      SavePrimitive(utils::MemcpyCast<uint32_t>(value.ValueF32()), builder);
      return;
    case Value::Type::F64:
      SaveMarker(Marker::F64, builder);
      SavePrimitive(utils::MemcpyCast<uint64_t>(value.ValueF64()), builder);
      return;
    case Value::Type::Slice:
    case Value::Type::SliceLike:
      SaveMarker(Marker::Slice, builder);
      SaveBytes(value.BytesView(), builder);
      return;
    case Value::Type::Opaque:
      SaveMarker(Marker::Opaque, builder);
      SaveBytes(value.BytesView(), builder);
      return;
    case Value::Type::Optional: {
      SaveMarker(Marker::Optional, builder);
      const auto *inner = value.ValueOptional();
      const auto presence = utils::UnderlyingCast(inner != nullptr ? Presence::Present : Presence::Absent);
      builder->Save(&presence, 1);
      if (inner != nullptr) {
        Encode(*inner, builder);
      }
      return;
    }
    case Value::Type::Vector: {
      const auto &vector = value.ValueVector();
      SaveMarker(Marker::Vector, builder);
      SaveLength(vector.size(), builder);
      for (const auto &item : vector) {
        Encode(item, builder);
      }
      return;
    }
    case Value::Type::HashMap: {
      const auto &hash_map = value.ValueHashMap();
      SaveMarker(Marker::HashMap, builder);
      SaveLength(hash_map.size(), builder);
      for (const auto &[key, item] : hash_map) {
        Encode(key, builder);
        Encode(item, builder);
      }
      return;
    }
  }
  LOG_FATAL("Unsupported Value::Type");
}

}  // namespace lize::codec
