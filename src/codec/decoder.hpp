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

#include "codec/encoder.hpp"
#include "codec/streams.hpp"
#include "codec/value.hpp"

namespace lize::codec {

/// Largest length prefix (or element count) accepted by default: 4 GiB.
inline constexpr uint64_t kDefaultMaxLength = uint64_t{1} << 32U;

struct DecoderOptions {
  /// Deepest nesting accepted, the top-level value being at depth 1.
  uint64_t max_depth{kDefaultMaxDepth};
  /// Largest byte length or element count accepted from a length prefix.
  uint64_t max_length{kDefaultMaxLength};
};

/// Decodes exactly one value starting at the current position of `reader`
/// and leaves the reader right after it. Slices in the result borrow from the
/// reader's buffer.
///
/// @throw TruncationException
/// @throw UnknownVariantException
/// @throw LengthOverflowException
/// @throw NestingDepthException
Value Decode(Reader *reader, const DecoderOptions &options = {});

}  // namespace lize::codec
