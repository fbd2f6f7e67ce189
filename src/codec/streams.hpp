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

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace lize::codec {

// The builder stages small writes in a buffer of this size so that encoding a
// tree of scalars doesn't call the sink once per byte.
constexpr size_t kBuilderBufferSize = 128;

/// Builder is the appendable byte sink used by the encoder. Data is staged in
/// an internal buffer and handed to `write_func` whenever the buffer fills up
/// and when `Finalize` is called. Payloads that don't fit into the staging
/// buffer are passed through without copying.
///
/// The builder never reads back what it has written.
class Builder {
 public:
  explicit Builder(std::function<void(const uint8_t *, size_t)> write_func);

  /// Appends everything to the end of `out`.
  explicit Builder(std::vector<uint8_t> *out);

  Builder(const Builder &) = delete;
  Builder &operator=(const Builder &) = delete;
  Builder(Builder &&) = delete;
  Builder &operator=(Builder &&) = delete;
  ~Builder() = default;

  /// Function used internally by the encoder to serialize the data.
  void Save(const uint8_t *data, uint64_t size);

  /// Hands the staged data over to the sink. Must be called once all values
  /// have been encoded; the builder can be reused afterwards.
  void Finalize();

  bool IsEmpty() const;

  /// Total number of bytes saved so far, flushed or not.
  size_t GetPos() const;

 private:
  void Flush();

  std::function<void(const uint8_t *, size_t)> write_func_;
  size_t flushed_{0};
  size_t pos_{0};
  std::array<uint8_t, kBuilderBufferSize> buffer_;
};

/// Reader is the byte cursor used by the decoder. Every load is checked
/// against the remaining size and throws `TruncationException` instead of
/// reading out of bounds.
class Reader {
 public:
  Reader(const uint8_t *data, size_t size);

  explicit Reader(std::span<const uint8_t> data) : Reader(data.data(), data.size()) {}

  /// Copies the next `size` bytes into `data` and advances the cursor.
  void Load(uint8_t *data, uint64_t size);

  /// Returns a view of the next `size` bytes and advances the cursor. The view
  /// points into the buffer the reader was constructed with.
  std::span<const uint8_t> LoadView(uint64_t size);

  /// Function that should be called after all values have been decoded.
  /// Throws `TrailingDataException` if any bytes are left.
  void Finalize() const;

  size_t GetPos() const { return pos_; }

  size_t GetRemaining() const { return size_ - pos_; }

  const uint8_t *GetData() const { return data_; }

 private:
  void CheckAvailable(uint64_t size) const;

  const uint8_t *data_;
  size_t size_;

  size_t pos_{0};
};

}  // namespace lize::codec
