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

#include "codec/serialization.hpp"

#include "utils/logging.hpp"

namespace lize::codec {

std::vector<uint8_t> Serialize(const Value &value, const EncoderOptions &options) {
  std::vector<uint8_t> out;
  Builder builder(&out);
  Serialize(value, &builder, options);
  builder.Finalize();
  return out;
}

void Serialize(const Value &value, Builder *builder, const EncoderOptions &options) {
  Validate(value, options);
  const auto start = builder->GetPos();
  Encode(value, builder);
  spdlog::trace("Encoded {} value into {} bytes", value.type(), builder->GetPos() - start);
}

Value Deserialize(std::span<const uint8_t> data, const DecoderOptions &options) {
  Reader reader(data);
  try {
    auto value = Decode(&reader, options);
    reader.Finalize();
    spdlog::trace("Decoded {} value from {} bytes", value.type(), data.size());
    return value;
  } catch (const CodecException &e) {
    spdlog::debug("Failed to decode a buffer of {} bytes at position {}: {}: {}", data.size(), reader.GetPos(),
                  e.name(), e.what());
    throw;
  }
}

}  // namespace lize::codec
