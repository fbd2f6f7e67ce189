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

#include "codec/streams.hpp"

#include <cstring>
#include <utility>

#include "codec/exceptions.hpp"
#include "utils/logging.hpp"

namespace lize::codec {

Builder::Builder(std::function<void(const uint8_t *, size_t)> write_func) : write_func_(std::move(write_func)) {}

Builder::Builder(std::vector<uint8_t> *out)
    : Builder([out](const uint8_t *data, size_t size) { out->insert(out->end(), data, data + size); }) {
  LIZE_ASSERT(out != nullptr, "Builder requires an output vector!");
}

bool Builder::IsEmpty() const { return flushed_ + pos_ == 0; }

size_t Builder::GetPos() const { return flushed_ + pos_; }

void Builder::Save(const uint8_t *data, uint64_t size) {
  if (size == 0) return;
  if (size >= kBuilderBufferSize) {
    // Large payloads skip the staging buffer, but whatever is staged has to go
    // out first so the order is kept.
    Flush();
    write_func_(data, size);
    flushed_ += size;
    return;
  }
  if (pos_ + size > kBuilderBufferSize) {
    Flush();
  }
  memcpy(buffer_.data() + pos_, data, size);
  pos_ += size;
}

void Builder::Finalize() { Flush(); }

void Builder::Flush() {
  if (pos_ == 0) return;
  DLIZE_ASSERT(pos_ <= kBuilderBufferSize, "Builder staged more data than it can hold!");
  write_func_(buffer_.data(), pos_);
  flushed_ += pos_;
  pos_ = 0;
}

Reader::Reader(const uint8_t *data, size_t const size) : data_(data), size_(size) {
  LIZE_ASSERT(data_ != nullptr || size_ == 0, "Reader got a null buffer with a non-zero size!");
}

void Reader::CheckAvailable(uint64_t const size) const {
  if (size > GetRemaining()) {
    throw TruncationException("There isn't enough data in the buffer! Pos: {}, requested: {}, size: {}", pos_, size,
                              size_);
  }
}

void Reader::Load(uint8_t *data, uint64_t const size) {
  CheckAvailable(size);
  if (size == 0) return;
  memcpy(data, data_ + pos_, size);
  pos_ += size;
}

std::span<const uint8_t> Reader::LoadView(uint64_t const size) {
  CheckAvailable(size);
  std::span<const uint8_t> view{data_ + pos_, static_cast<size_t>(size)};
  pos_ += size;
  return view;
}

void Reader::Finalize() const {
  if (GetRemaining() != 0) {
    throw TrailingDataException("There is still leftover data in the buffer! {} bytes after position {}",
                                GetRemaining(), pos_);
  }
}

}  // namespace lize::codec
