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

#include "codec/value.hpp"

#include <algorithm>
#include <ostream>

#include "codec/exceptions.hpp"
#include "utils/logging.hpp"

namespace lize::codec {

Value::Value(Type type, uint8_t value) : type_(type) {
  DLIZE_ASSERT(type == Type::U8 || type == Type::SmallU8, "Only U8 and SmallU8 hold a single byte!");
  u8_v = value;
}

Value::Value(Type type, TBytes bytes) : type_(type) {
  DLIZE_ASSERT(type == Type::SliceLike || type == Type::Opaque, "Only SliceLike and Opaque own their bytes!");
  new (&bytes_v) TBytes(std::move(bytes));
}

Value::Value(const Value &other) : type_(other.type_) { CopyFrom(other); }

Value::Value(Value &&other) noexcept : type_(other.type_) { MoveFrom(std::move(other)); }

Value &Value::operator=(const Value &other) {
  if (this == &other) return *this;
  // `other` may be owned by this value, so copy it before anything is destroyed.
  Value copy(other);
  return *this = std::move(copy);
}

Value &Value::operator=(Value &&other) noexcept {
  if (this == &other) return *this;
  // Same as above, `other` may be one of our children.
  Value tmp(std::move(other));
  DestroyValue();
  type_ = tmp.type_;
  MoveFrom(std::move(tmp));
  return *this;
}

Value::~Value() { DestroyValue(); }

void Value::CopyFrom(const Value &other) {
  switch (other.type_) {
    case Type::Bool:
      bool_v = other.bool_v;
      return;
    case Type::U8:
    case Type::SmallU8:
      u8_v = other.u8_v;
      return;
    case Type::I32:
      i32_v = other.i32_v;
      return;
    case Type::I64:
      i64_v = other.i64_v;
      return;
    case Type::F32:
      f32_v = other.f32_v;
      return;
    case Type::F64:
      f64_v = other.f64_v;
      return;
    case Type::Slice:
      new (&slice_v) TSlice(other.slice_v);
      return;
    case Type::SliceLike:
    case Type::Opaque:
      new (&bytes_v) TBytes(other.bytes_v);
      return;
    case Type::Optional:
      new (&optional_v) std::unique_ptr<Value>(other.optional_v ? std::make_unique<Value>(*other.optional_v) : nullptr);
      return;
    case Type::Vector:
      new (&vector_v) TVector(other.vector_v);
      return;
    case Type::HashMap:
      new (&hash_map_v) THashMap(other.hash_map_v);
      return;
  }
  LOG_FATAL("Unsupported Value::Type");
}

// After the move `other` is an absent Optional.
void Value::MoveFrom(Value &&other) noexcept {
  switch (other.type_) {
    case Type::Bool:
      bool_v = other.bool_v;
      break;
    case Type::U8:
    case Type::SmallU8:
      u8_v = other.u8_v;
      break;
    case Type::I32:
      i32_v = other.i32_v;
      break;
    case Type::I64:
      i64_v = other.i64_v;
      break;
    case Type::F32:
      f32_v = other.f32_v;
      break;
    case Type::F64:
      f64_v = other.f64_v;
      break;
    case Type::Slice:
      new (&slice_v) TSlice(other.slice_v);
      break;
    case Type::SliceLike:
    case Type::Opaque:
      new (&bytes_v) TBytes(std::move(other.bytes_v));
      break;
    case Type::Optional:
      new (&optional_v) std::unique_ptr<Value>(std::move(other.optional_v));
      break;
    case Type::Vector:
      new (&vector_v) TVector(std::move(other.vector_v));
      break;
    case Type::HashMap:
      new (&hash_map_v) THashMap(std::move(other.hash_map_v));
      break;
  }
  other.DestroyValue();
  other.type_ = Type::Optional;
  new (&other.optional_v) std::unique_ptr<Value>();
}

void Value::DestroyValue() noexcept {
  switch (type_) {
    case Type::Bool:
    case Type::U8:
    case Type::SmallU8:
    case Type::I32:
    case Type::I64:
    case Type::F32:
    case Type::F64:
    case Type::Slice:
      return;
    case Type::SliceLike:
    case Type::Opaque:
      std::destroy_at(&bytes_v);
      return;
    case Type::Optional:
      std::destroy_at(&optional_v);
      return;
    case Type::Vector:
      std::destroy_at(&vector_v);
      return;
    case Type::HashMap:
      std::destroy_at(&hash_map_v);
      return;
  }
}

#define DEFINE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(type_param, type_enum, field)           \
  type_param Value::Value##type_enum() const {                                          \
    if (type_ != Type::type_enum) [[unlikely]]                                          \
      throw ValueException("Value is of type '{}', not '{}'", type_, Type::type_enum); \
    return field;                                                                       \
  }

#define DEFINE_VALUE_AND_TYPE_GETTERS(type_param, type_enum, field)                     \
  type_param &Value::Value##type_enum() {                                               \
    if (type_ != Type::type_enum) [[unlikely]]                                          \
      throw ValueException("Value is of type '{}', not '{}'", type_, Type::type_enum); \
    return field;                                                                       \
  }                                                                                     \
  const type_param &Value::Value##type_enum() const {                                   \
    if (type_ != Type::type_enum) [[unlikely]]                                          \
      throw ValueException("Value is of type '{}', not '{}'", type_, Type::type_enum); \
    return field;                                                                       \
  }

DEFINE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(bool, Bool, bool_v)
DEFINE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(uint8_t, SmallU8, u8_v)
DEFINE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(int32_t, I32, i32_v)
DEFINE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(int64_t, I64, i64_v)
DEFINE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(float, F32, f32_v)
DEFINE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(double, F64, f64_v)
DEFINE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(Value::TSlice, Slice, slice_v)

DEFINE_VALUE_AND_TYPE_GETTERS(Value::TBytes, SliceLike, bytes_v)
DEFINE_VALUE_AND_TYPE_GETTERS(Value::TBytes, Opaque, bytes_v)
DEFINE_VALUE_AND_TYPE_GETTERS(Value::TVector, Vector, vector_v)
DEFINE_VALUE_AND_TYPE_GETTERS(Value::THashMap, HashMap, hash_map_v)

#undef DEFINE_VALUE_AND_TYPE_GETTERS
#undef DEFINE_VALUE_AND_TYPE_GETTERS_PRIMITIVE

uint8_t Value::ValueU8() const {
  if (type_ != Type::U8 && type_ != Type::SmallU8) [[unlikely]]
    throw ValueException("Value is of type '{}', not '{}' or '{}'", type_, Type::U8, Type::SmallU8);
  return u8_v;
}

const Value *Value::ValueOptional() const {
  if (type_ != Type::Optional) [[unlikely]]
    throw ValueException("Value is of type '{}', not '{}'", type_, Type::Optional);
  return optional_v.get();
}

Value *Value::ValueOptional() {
  if (type_ != Type::Optional) [[unlikely]]
    throw ValueException("Value is of type '{}', not '{}'", type_, Type::Optional);
  return optional_v.get();
}

std::string_view Value::ValueString() const {
  if (type_ != Type::Slice && type_ != Type::SliceLike) [[unlikely]]
    throw ValueException("Value is of type '{}', not '{}' or '{}'", type_, Type::Slice, Type::SliceLike);
  auto bytes = BytesView();
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

bool Value::IsBytes() const { return type_ == Type::Slice || type_ == Type::SliceLike || type_ == Type::Opaque; }

Value::TSlice Value::BytesView() const {
  switch (type_) {
    case Type::Slice:
      return slice_v;
    case Type::SliceLike:
    case Type::Opaque:
      return {bytes_v.data(), bytes_v.size()};
    default:
      throw ValueException("Value of type '{}' doesn't hold bytes", type_);
  }
}

bool operator==(const Value &a, const Value &b) {
  if (a.type_ != b.type_) return false;
  switch (a.type_) {
    case Value::Type::Bool:
      return a.bool_v == b.bool_v;
    case Value::Type::U8:
    case Value::Type::SmallU8:
      return a.u8_v == b.u8_v;
    case Value::Type::I32:
      return a.i32_v == b.i32_v;
    case Value::Type::I64:
      return a.i64_v == b.i64_v;
    case Value::Type::F32:
      return a.f32_v == b.f32_v;
    case Value::Type::F64:
      return a.f64_v == b.f64_v;
    case Value::Type::Slice:
      return std::ranges::equal(a.slice_v, b.slice_v);
    case Value::Type::SliceLike:
    case Value::Type::Opaque:
      return a.bytes_v == b.bytes_v;
    case Value::Type::Optional:
      if (!a.optional_v || !b.optional_v) return !a.optional_v && !b.optional_v;
      return *a.optional_v == *b.optional_v;
    case Value::Type::Vector:
      return a.vector_v == b.vector_v;
    case Value::Type::HashMap:
      return a.hash_map_v == b.hash_map_v;
  }
  LOG_FATAL("Unsupported Value::Type");
}

bool BytesEqual(const Value &a, const Value &b) {
  if (!a.IsBytes() || !b.IsBytes()) return false;
  return std::ranges::equal(a.BytesView(), b.BytesView());
}

std::ostream &operator<<(std::ostream &os, const Value::Type &type) {
  switch (type) {
    case Value::Type::Bool:
      return os << "bool";
    case Value::Type::U8:
      return os << "u8";
    case Value::Type::SmallU8:
      return os << "small_u8";
    case Value::Type::I32:
      return os << "i32";
    case Value::Type::I64:
      return os << "i64";
    case Value::Type::F32:
      return os << "f32";
    case Value::Type::F64:
      return os << "f64";
    case Value::Type::Slice:
      return os << "slice";
    case Value::Type::SliceLike:
      return os << "slice_like";
    case Value::Type::Opaque:
      return os << "opaque";
    case Value::Type::Optional:
      return os << "optional";
    case Value::Type::Vector:
      return os << "vector";
    case Value::Type::HashMap:
      return os << "hash_map";
  }
  LOG_FATAL("Unsupported Value::Type");
}

namespace {

// Printable ASCII is written as is, everything else as a \xNN escape.
void WriteEscapedBytes(std::ostream &os, Value::TSlice bytes) {
  os << '"';
  for (auto byte : bytes) {
    if (byte == '"' || byte == '\\') {
      os << '\\' << static_cast<char>(byte);
    } else if (byte >= 0x20 && byte < 0x7F) {
      os << static_cast<char>(byte);
    } else {
      os << fmt::format("\\x{:02x}", byte);
    }
  }
  os << '"';
}

}  // namespace

std::ostream &operator<<(std::ostream &os, const Value &value) {
  switch (value.type()) {
    case Value::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case Value::Type::U8:
      return os << "u8(" << static_cast<int>(value.ValueU8()) << ")";
    case Value::Type::SmallU8:
      return os << "small_u8(" << static_cast<int>(value.ValueSmallU8()) << ")";
    case Value::Type::I32:
      return os << "i32(" << value.ValueI32() << ")";
    case Value::Type::I64:
      return os << value.ValueI64();
    case Value::Type::F32:
      return os << "f32(" << fmt::format("{}", value.ValueF32()) << ")";
    case Value::Type::F64:
      return os << "f64(" << fmt::format("{}", value.ValueF64()) << ")";
    case Value::Type::Slice:
      WriteEscapedBytes(os, value.ValueSlice());
      return os;
    case Value::Type::SliceLike:
      os << "owned";
      WriteEscapedBytes(os, value.BytesView());
      return os;
    case Value::Type::Opaque:
      return os << "opaque(" << value.ValueOpaque().size() << " bytes)";
    case Value::Type::Optional:
      if (const auto *inner = value.ValueOptional(); inner != nullptr) {
        return os << "some(" << *inner << ")";
      }
      return os << "none";
    case Value::Type::Vector: {
      os << "[";
      const auto &vector = value.ValueVector();
      for (size_t i = 0; i < vector.size(); ++i) {
        if (i != 0) os << ", ";
        os << vector[i];
      }
      return os << "]";
    }
    case Value::Type::HashMap: {
      os << "{";
      const auto &hash_map = value.ValueHashMap();
      for (size_t i = 0; i < hash_map.size(); ++i) {
        if (i != 0) os << ", ";
        os << hash_map[i].first << ": " << hash_map[i].second;
      }
      return os << "}";
    }
  }
  LOG_FATAL("Unsupported Value::Type");
}

}  // namespace lize::codec
