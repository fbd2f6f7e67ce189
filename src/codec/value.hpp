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
#include <iosfwd>
#include <memory>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/ostream.h>

namespace lize::codec {

/**
 * Stores a value of the lize format and its type.
 *
 * Values can be of a number of predefined types that are enumerated in
 * Value::Type. Each such type corresponds to exactly one C++ type:
 *
 *  - Bool, U8, SmallU8, I32, I64, F32, F64 are stored inline,
 *  - Slice is a `std::span` that borrows its bytes, typically from the buffer
 *    the value was decoded from; that buffer must outlive the value,
 *  - SliceLike and Opaque own their bytes,
 *  - Optional, Vector and HashMap exclusively own their children.
 *
 * SliceLike is written exactly like Slice, so decoding its encoding yields a
 * Slice. Opaque carries bytes produced by an external runtime (e.g. a
 * marshaled function) which are never interpreted here.
 *
 * The default constructed value is an absent Optional.
 */
class Value {
 public:
  /** A value type. Each type corresponds to exactly one C++ type */
  enum class Type : uint8_t {
    Bool,
    U8,
    SmallU8,
    I32,
    I64,
    F32,
    F64,
    Slice,
    SliceLike,
    Opaque,
    Optional,
    Vector,
    HashMap
  };

  // Since C++17 std::vector explicitly supports incomplete element types, so
  // the containers can be declared while Value is still incomplete.
  using TBytes = std::vector<uint8_t>;
  using TSlice = std::span<const uint8_t>;
  using TVector = std::vector<Value>;
  using TPair = std::pair<Value, Value>;
  using THashMap = std::vector<TPair>;

  /** Construct an absent Optional. */
  Value() : type_(Type::Optional) { new (&optional_v) std::unique_ptr<Value>(); }

  Value(const Value &other);
  Value(Value &&other) noexcept;
  Value &operator=(const Value &other);
  Value &operator=(Value &&other) noexcept;
  ~Value();

  explicit Value(bool value) : type_(Type::Bool) { bool_v = value; }
  explicit Value(uint8_t value) : Value(Type::U8, value) {}
  explicit Value(int32_t value) : type_(Type::I32) { i32_v = value; }
  explicit Value(int64_t value) : type_(Type::I64) { i64_v = value; }
  explicit Value(float value) : type_(Type::F32) { f32_v = value; }
  explicit Value(double value) : type_(Type::F64) { f64_v = value; }

  /** Construct a Slice. The bytes are borrowed, not copied. */
  explicit Value(TSlice value) : type_(Type::Slice) { new (&slice_v) TSlice(value); }
  /** Construct a Slice over the characters of `value`. The bytes are borrowed, not copied. */
  explicit Value(std::string_view value)
      : Value(TSlice(reinterpret_cast<const uint8_t *>(value.data()), value.size())) {}
  explicit Value(const char *value) : Value(std::string_view(value)) {}

  // A Slice over a temporary would dangle; use MakeSliceLike for owned bytes.
  explicit Value(std::string &&) = delete;
  explicit Value(TBytes &&) = delete;

  explicit Value(TVector value) : type_(Type::Vector) { new (&vector_v) TVector(std::move(value)); }
  explicit Value(THashMap value) : type_(Type::HashMap) { new (&hash_map_v) THashMap(std::move(value)); }

  /// SmallU8 values above kSmallU8Max can be constructed, but are rejected by
  /// the encoder with ConstructionException.
  static Value MakeSmallU8(uint8_t value) { return {Type::SmallU8, value}; }
  static Value MakeSliceLike(TBytes bytes) { return {Type::SliceLike, std::move(bytes)}; }
  static Value MakeSliceLike(std::string_view bytes) {
    return MakeSliceLike(TBytes(reinterpret_cast<const uint8_t *>(bytes.data()),
                                reinterpret_cast<const uint8_t *>(bytes.data()) + bytes.size()));
  }
  static Value MakeOpaque(TBytes bytes) { return {Type::Opaque, std::move(bytes)}; }
  static Value MakeOptional(Value inner) { return Value(std::make_unique<Value>(std::move(inner))); }
  static Value MakeNone() { return {}; }

  Type type() const { return type_; }

#define DECLARE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(type_param, type_enum) \
  /** Gets the value of type field. Throws if value is not field*/      \
  type_param Value##type_enum() const;                                  \
  /** Checks if it's the value is of the given type */                  \
  bool Is##type_enum() const { return type_ == Type::type_enum; }

#define DECLARE_VALUE_AND_TYPE_GETTERS(type_param, type_enum)         \
  /** Gets the value of type field. Throws if value is not field*/    \
  type_param &Value##type_enum();                                     \
  /** Gets the value of type field. Throws if value is not field*/    \
  const type_param &Value##type_enum() const;                         \
  /** Checks if it's the value is of the given type */                \
  bool Is##type_enum() const { return type_ == Type::type_enum; }

  DECLARE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(bool, Bool)
  /** Gets the payload of a U8 or a SmallU8. Throws for any other type. */
  uint8_t ValueU8() const;
  bool IsU8() const { return type_ == Type::U8; }
  DECLARE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(uint8_t, SmallU8)
  DECLARE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(int32_t, I32)
  DECLARE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(int64_t, I64)
  DECLARE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(float, F32)
  DECLARE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(double, F64)
  DECLARE_VALUE_AND_TYPE_GETTERS_PRIMITIVE(TSlice, Slice)

  DECLARE_VALUE_AND_TYPE_GETTERS(TBytes, SliceLike)
  DECLARE_VALUE_AND_TYPE_GETTERS(TBytes, Opaque)
  DECLARE_VALUE_AND_TYPE_GETTERS(TVector, Vector)
  DECLARE_VALUE_AND_TYPE_GETTERS(THashMap, HashMap)

#undef DECLARE_VALUE_AND_TYPE_GETTERS
#undef DECLARE_VALUE_AND_TYPE_GETTERS_PRIMITIVE

  bool IsOptional() const { return type_ == Type::Optional; }
  /** Checks if the value is an absent Optional. */
  bool IsNone() const { return type_ == Type::Optional && !optional_v; }

  /**
   * Returns the value boxed in an Optional, or nullptr if the Optional is
   * absent. Throws if the value is not an Optional.
   */
  const Value *ValueOptional() const;
  Value *ValueOptional();

  /** Returns the bytes of a Slice or SliceLike as characters. No UTF-8 validation is done. */
  std::string_view ValueString() const;

  /** Checks if the value is a Slice, SliceLike or Opaque. */
  bool IsBytes() const;

  /** Returns the bytes of a Slice, SliceLike or Opaque. Throws for any other type. */
  TSlice BytesView() const;

  /**
   * Structural equality. Values of different types are never equal, so a
   * Slice is not equal to a SliceLike holding the same bytes. Floating point
   * payloads are compared with `==`.
   */
  friend bool operator==(const Value &a, const Value &b);

 private:
  Value(Type type, uint8_t value);
  Value(Type type, TBytes bytes);
  explicit Value(std::unique_ptr<Value> inner) : type_(Type::Optional) {
    new (&optional_v) std::unique_ptr<Value>(std::move(inner));
  }

  void CopyFrom(const Value &other);
  void MoveFrom(Value &&other) noexcept;
  // Destroys the active member. The caller must construct a new one.
  void DestroyValue() noexcept;

  // payload of the active type
  union {
    bool bool_v;
    uint8_t u8_v;
    int32_t i32_v;
    int64_t i64_v;
    float f32_v;
    double f64_v;
    TSlice slice_v;
    TBytes bytes_v;
    std::unique_ptr<Value> optional_v;
    TVector vector_v;
    THashMap hash_map_v;
  };

  Type type_;
};

/// Compares the bytes of two byte-bearing values regardless of their variant.
/// Returns false if either value doesn't carry bytes.
bool BytesEqual(const Value &a, const Value &b);

std::ostream &operator<<(std::ostream &os, const Value::Type &type);
std::ostream &operator<<(std::ostream &os, const Value &value);

}  // namespace lize::codec

template <>
class fmt::formatter<lize::codec::Value::Type> : public fmt::ostream_formatter {};
template <>
class fmt::formatter<lize::codec::Value> : public fmt::ostream_formatter {};
