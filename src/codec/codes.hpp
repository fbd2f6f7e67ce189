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

#pragma once

#include <cstdint>

#include "utils/cast.hpp"

namespace lize::codec {

/// Tag bytes written in front of every encoded value. The assignments are part
/// of the format and must never change.
enum class Marker : uint8_t {
  I64 = 0x00,
  Slice = 0x01,
  Vector = 0x02,
  HashMap = 0x04,
  True = 0x06,
  False = 0x07,
  F64 = 0x08,
  Optional = 0x09,
  I32 = 0x0B,
  F32 = 0x0C,
  U8 = 0x0D,
  Opaque = 0x0E,

  // Every byte from here up to 0xFF is a SmallU8 whose value is `byte - SmallU8Base`.
  SmallU8Base = 0x14,
};

/// Presence flag written after `Marker::Optional`.
enum class Presence : uint8_t { Absent = 0x00, Present = 0x01 };

/// Largest value a SmallU8 can carry (0xFF - 0x14).
inline constexpr uint8_t kSmallU8Max = 0xFF - utils::UnderlyingCast(Marker::SmallU8Base);

static_assert(kSmallU8Max == 235);

/// Length prefixes of byte payloads and element counts of composites.
using LengthPrefix = uint64_t;

}  // namespace lize::codec
