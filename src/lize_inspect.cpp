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

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <new>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <gflags/gflags.h>

#include "codec/exceptions.hpp"
#include "codec/serialization.hpp"
#include "flags/codec.hpp"
#include "flags/log_level.hpp"
#include "utils/logging.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(input, "", "Path to the file holding one encoded value.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(hex, false, "Treat the input as hex text instead of raw bytes. Whitespace is ignored.");

namespace {

std::optional<std::vector<uint8_t>> ReadFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return std::nullopt;
  std::vector<uint8_t> data{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
  if (file.bad()) return std::nullopt;
  return data;
}

std::optional<uint8_t> HexDigit(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return std::nullopt;
}

std::optional<std::vector<uint8_t>> ParseHex(const std::vector<uint8_t> &text) {
  std::vector<uint8_t> data;
  data.reserve(text.size() / 2);
  std::optional<uint8_t> high;
  for (const auto c : text) {
    if (std::isspace(c)) continue;
    const auto digit = HexDigit(static_cast<char>(c));
    if (!digit) {
      spdlog::error("Invalid hex character '{}'", static_cast<char>(c));
      return std::nullopt;
    }
    if (!high) {
      high = *digit;
      continue;
    }
    data.push_back(static_cast<uint8_t>(*high << 4U | *digit));
    high.reset();
  }
  if (high) {
    spdlog::error("Hex input has an odd number of digits");
    return std::nullopt;
  }
  return data;
}

}  // namespace

int main(int argc, char *argv[]) {
  gflags::SetUsageMessage("Decode a lize encoded value and print it.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  lize::flags::InitializeLogger();

  if (FLAGS_input.empty()) {
    spdlog::error("The --input flag is required!");
    return 1;
  }

  auto data = ReadFile(FLAGS_input);
  if (!data) {
    spdlog::error("Couldn't read {}", FLAGS_input);
    return 1;
  }
  if (FLAGS_hex) {
    data = ParseHex(*data);
    if (!data) return 1;
  }
  spdlog::info("Loaded {} bytes from {}", data->size(), FLAGS_input);

  try {
    const auto value = lize::codec::Deserialize(*data, lize::flags::DecoderOptionsFromFlags());
    fmt::print("{}\n", value);
    fmt::print("type: {}, encoded size: {} bytes\n", value.type(), data->size());
  } catch (const lize::codec::CodecException &e) {
    spdlog::error("{}: {}", e.name(), e.what());
    return 1;
  } catch (const std::bad_alloc &e) {
    spdlog::error("Ran out of memory while decoding {}: {}", FLAGS_input, e.what());
    return 1;
  }

  return 0;
}
