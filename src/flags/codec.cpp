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

#include "flags/codec.hpp"

#include "utils/flag_validation.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(max_depth, lize::codec::kDefaultMaxDepth,
                        "Maximum nesting depth of a decoded value. The top-level value is at depth 1.",
                        FLAG_IN_RANGE(1, 4096));

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_uint64(max_length, lize::codec::kDefaultMaxLength,
              "Maximum byte length or element count a length prefix may declare.");

lize::codec::DecoderOptions lize::flags::DecoderOptionsFromFlags() {
  return {.max_depth = FLAGS_max_depth, .max_length = FLAGS_max_length};
}
