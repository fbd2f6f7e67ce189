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

#ifdef __APPLE__
#include <libkern/OSByteOrder.h>
#else
#include <endian.h>
#endif

#include "utils/cast.hpp"

// Every multi-byte value on the lize wire is little-endian. Only the
// conversions the codec needs are provided.
namespace lize::utils {

#ifdef __APPLE__
inline uint32_t HostToLittleEndian(uint32_t value) { return OSSwapHostToLittleInt32(value); }
inline uint64_t HostToLittleEndian(uint64_t value) { return OSSwapHostToLittleInt64(value); }
inline uint32_t LittleEndianToHost(uint32_t value) { return OSSwapLittleToHostInt32(value); }
inline uint64_t LittleEndianToHost(uint64_t value) { return OSSwapLittleToHostInt64(value); }
#else
inline uint32_t HostToLittleEndian(uint32_t value) { return htole32(value); }
inline uint64_t HostToLittleEndian(uint64_t value) { return htole64(value); }
inline uint32_t LittleEndianToHost(uint32_t value) { return le32toh(value); }
inline uint64_t LittleEndianToHost(uint64_t value) { return le64toh(value); }
#endif

inline uint8_t HostToLittleEndian(uint8_t value) { return value; }
inline uint8_t LittleEndianToHost(uint8_t value) { return value; }

inline int32_t HostToLittleEndian(int32_t value) {
  return MemcpyCast<int32_t>(HostToLittleEndian(MemcpyCast<uint32_t>(value)));
}
inline int64_t HostToLittleEndian(int64_t value) {
  return MemcpyCast<int64_t>(HostToLittleEndian(MemcpyCast<uint64_t>(value)));
}
inline int32_t LittleEndianToHost(int32_t value) {
  return MemcpyCast<int32_t>(LittleEndianToHost(MemcpyCast<uint32_t>(value)));
}
inline int64_t LittleEndianToHost(int64_t value) {
  return MemcpyCast<int64_t>(LittleEndianToHost(MemcpyCast<uint64_t>(value)));
}

}  // namespace lize::utils
