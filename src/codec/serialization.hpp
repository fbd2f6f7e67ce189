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
#include <span>
#include <vector>

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "codec/exceptions.hpp"
#include "codec/streams.hpp"
#include "codec/value.hpp"

namespace lize::codec {

/// Encodes `value` into a new buffer. The whole tree is validated before the
/// first byte is written.
///
/// @throw ConstructionException
/// @throw NestingDepthException
std::vector<uint8_t> Serialize(const Value &value, const EncoderOptions &options = {});

/// Same as above, but appends to `builder`. Nothing is appended if the value
/// fails validation. The caller is responsible for calling
/// `Builder::Finalize`.
void Serialize(const Value &value, Builder *builder, const EncoderOptions &options = {});

/// Decodes the single value that `data` holds. Slices in the result borrow
/// from `data`.
///
/// @throw DecodeException (or one of its subclasses)
/// @throw NestingDepthException
Value Deserialize(std::span<const uint8_t> data, const DecoderOptions &options = {});

}  // namespace lize::codec
