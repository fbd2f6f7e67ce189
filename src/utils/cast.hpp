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
#include <cstring>
#include <optional>
#include <type_traits>
#include <utility>

namespace lize::utils {

template <typename T>
constexpr std::underlying_type_t<T> UnderlyingCast(T e) {
  return static_cast<std::underlying_type_t<T>>(e);
}

/**
 * Reinterprets the bytes of `src` as `TDest`. Used to move floating point
 * values through the integer endian helpers without undefined behaviour.
 *
 * @tparam TDest Returned datatype.
 * @tparam TSrc Input datatype.
 *
 * @return "copy casted" value.
 */
template <typename TDest, typename TSrc>
TDest MemcpyCast(TSrc src) {
  TDest dest;
  static_assert(sizeof(dest) == sizeof(src), "MemcpyCast expects source and destination to be of same size");
  static_assert(std::is_arithmetic_v<TSrc>, "MemcpyCast expects source is an arithmetic type");
  static_assert(std::is_arithmetic_v<TDest>, "MemcpyCast expects destination is an arithmetic type");
  std::memcpy(&dest, &src, sizeof(src));
  return dest;
}

/// Converts an integer to a narrower (or differently signed) integer type.
/// Returns `std::nullopt` when the value isn't representable in `TDest`.
template <typename TDest, typename TSrc>
requires std::is_integral_v<TDest> && std::is_integral_v<TSrc>
constexpr std::optional<TDest> NarrowCast(TSrc src) {
  if (!std::in_range<TDest>(src)) return std::nullopt;
  return static_cast<TDest>(src);
}

}  // namespace lize::utils
