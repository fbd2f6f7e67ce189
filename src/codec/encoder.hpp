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

#include "codec/streams.hpp"
#include "codec/value.hpp"

namespace lize::codec {

/// Default limit for how deep values may be nested, both when encoding and
/// when decoding.
inline constexpr uint64_t kDefaultMaxDepth = 512;

struct EncoderOptions {
  uint64_t max_depth{kDefaultMaxDepth};
};

/// Checks that `value` can be encoded: every SmallU8 is within its bound and
/// the tree is not nested deeper than `options.max_depth`.
///
/// @throw ConstructionException
/// @throw NestingDepthException
void Validate(const Value &value, const EncoderOptions &options = {});

/// Appends the encoding of `value` to `builder`. The value must have been
/// validated; use `Serialize` to do both.
void Encode(const Value &value, Builder *builder);

}  // namespace lize::codec
