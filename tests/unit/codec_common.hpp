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
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "codec/streams.hpp"
#include "utils/logging.hpp"

inline std::vector<uint8_t> GetRandomData(size_t const size) {
  std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<uint16_t> dis(0, 255);
  std::vector<uint8_t> ret(size);
  for (auto &byte : ret) {
    byte = static_cast<uint8_t>(dis(gen));
  }
  return ret;
}

inline std::vector<uint8_t> StringToBytes(std::string_view str) {
  return {reinterpret_cast<const uint8_t *>(str.data()), reinterpret_cast<const uint8_t *>(str.data()) + str.size()};
}

namespace lize::codec {

/// Class used for codec tests. It creates a `lize::codec::Builder` that can be
/// written to. After you have written the data to the builder, you can get a
/// `lize::codec::Reader` and try to decode the encoded data.
class Loopback {
 public:
  ~Loopback() {
    LIZE_ASSERT(builder_, "You haven't created a builder!");
    LIZE_ASSERT(reader_, "You haven't created a reader!");
    EXPECT_EQ(reader_->GetRemaining(), 0) << "Not all of the encoded data was decoded";
  }

  lize::codec::Builder *GetBuilder() {
    LIZE_ASSERT(!builder_, "You have already allocated a builder!");
    builder_ = std::make_unique<lize::codec::Builder>([this](const uint8_t *data, size_t size) { Write(data, size); });
    return builder_.get();
  }

  lize::codec::Reader *GetReader() {
    LIZE_ASSERT(builder_, "You must first get a builder before getting a reader!");
    LIZE_ASSERT(!reader_, "You have already allocated a reader!");
    builder_->Finalize();
    LIZE_ASSERT(builder_->GetPos() == data_.size(), "The builder lost some of the data!");
    Dump();
    reader_ = std::make_unique<lize::codec::Reader>(data_.data(), data_.size());
    return reader_.get();
  }

  size_t size() const { return data_.size(); }

  const std::vector<uint8_t> &data() const { return data_; }

  /// Number of times the builder handed data to the sink.
  size_t writes() const { return writes_; }

 private:
  void Write(const uint8_t *data, size_t size) {
    ++writes_;
    data_.insert(data_.end(), data, data + size);
  }

  void Dump() {
    std::string dump;
    for (size_t i = 0; i < data_.size(); ++i) {
      dump += fmt::format("{:02x}", data_[i]);
      if (i != data_.size() - 1) {
        dump += " ";
      }
    }
    // This stores the encoded stream into the test XML output. To get the
    // data you have to specify to the test (during runtime) that it should
    // create an XML output.
    ::testing::Test::RecordProperty("lize_stream", dump);
  }

  std::vector<uint8_t> data_;
  std::unique_ptr<lize::codec::Builder> builder_;
  std::unique_ptr<lize::codec::Reader> reader_;
  size_t writes_{0};
};

}  // namespace lize::codec
