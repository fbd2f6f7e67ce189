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
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "codec/exceptions.hpp"
#include "codec/serialization.hpp"
#include "codec/value.hpp"

// Conversions between native C++ types and `Value`. Strings are converted to
// Slices that borrow the characters of the converted object, so the object
// must outlive the produced value.
namespace lize::codec {

inline Value ToValue(bool obj) { return Value(obj); }
inline Value ToValue(uint8_t obj) { return Value(obj); }
inline Value ToValue(int32_t obj) { return Value(obj); }
inline Value ToValue(int64_t obj) { return Value(obj); }
inline Value ToValue(float obj) { return Value(obj); }
inline Value ToValue(double obj) { return Value(obj); }
inline Value ToValue(std::string_view obj) { return Value(obj); }
inline Value ToValue(const char *obj) { return Value(obj); }
inline Value ToValue(const std::string &obj) { return Value(std::string_view(obj)); }
Value ToValue(std::string &&) = delete;

inline void FromValue(const Value &value, bool *obj) { *obj = value.ValueBool(); }
inline void FromValue(const Value &value, uint8_t *obj) { *obj = value.ValueU8(); }
inline void FromValue(const Value &value, int32_t *obj) { *obj = value.ValueI32(); }
inline void FromValue(const Value &value, int64_t *obj) { *obj = value.ValueI64(); }
inline void FromValue(const Value &value, float *obj) { *obj = value.ValueF32(); }
inline void FromValue(const Value &value, double *obj) { *obj = value.ValueF64(); }
/// The result borrows from `value`.
inline void FromValue(const Value &value, std::string_view *obj) { *obj = value.ValueString(); }
inline void FromValue(const Value &value, std::string *obj) { *obj = std::string(value.ValueString()); }

// Forward declarations for all recursive `ToValue` and `FromValue` functions
// must be here because C++ doesn't know how to resolve the function call if it
// isn't in the global namespace.

template <typename T>
Value ToValue(const std::vector<T> &obj);
template <typename T>
void FromValue(const Value &value, std::vector<T> *obj);

template <typename K, typename V>
Value ToValue(const std::vector<std::pair<K, V>> &obj);
template <typename K, typename V>
void FromValue(const Value &value, std::vector<std::pair<K, V>> *obj);

template <typename K, typename V>
Value ToValue(const std::map<K, V> &obj);
template <typename K, typename V>
void FromValue(const Value &value, std::map<K, V> *obj);

template <typename K, typename V>
Value ToValue(const std::unordered_map<K, V> &obj);
template <typename K, typename V>
void FromValue(const Value &value, std::unordered_map<K, V> *obj);

template <typename T>
Value ToValue(const std::optional<T> &obj);
template <typename T>
void FromValue(const Value &value, std::optional<T> *obj);

// Implementation of templated ToValue/FromValue functions

template <typename T>
inline Value ToValue(const std::vector<T> &obj) {
  Value::TVector vector;
  vector.reserve(obj.size());
  for (const auto &item : obj) {
    vector.push_back(ToValue(item));
  }
  return Value(std::move(vector));
}

template <typename T>
inline void FromValue(const Value &value, std::vector<T> *obj) {
  const auto &vector = value.ValueVector();
  obj->clear();
  obj->reserve(vector.size());
  for (const auto &item : vector) {
    T current{};
    FromValue(item, &current);
    obj->push_back(std::move(current));
  }
}

namespace impl {

template <typename TRange>
Value PairsToValue(const TRange &pairs, size_t size) {
  Value::THashMap hash_map;
  hash_map.reserve(size);
  for (const auto &[key, item] : pairs) {
    hash_map.emplace_back(ToValue(key), ToValue(item));
  }
  return Value(std::move(hash_map));
}

template <typename K, typename V, typename TInsert>
void PairsFromValue(const Value &value, TInsert insert) {
  for (const auto &[key_value, item_value] : value.ValueHashMap()) {
    K key{};
    FromValue(key_value, &key);
    V item{};
    FromValue(item_value, &item);
    insert(std::move(key), std::move(item));
  }
}

}  // namespace impl

template <typename K, typename V>
inline Value ToValue(const std::vector<std::pair<K, V>> &obj) {
  return impl::PairsToValue(obj, obj.size());
}

template <typename K, typename V>
inline void FromValue(const Value &value, std::vector<std::pair<K, V>> *obj) {
  obj->clear();
  impl::PairsFromValue<K, V>(value, [obj](K &&key, V &&item) { obj->emplace_back(std::move(key), std::move(item)); });
}

// A decoded HashMap may repeat a key. The last occurrence wins when
// converting to an associative container.

template <typename K, typename V>
inline Value ToValue(const std::map<K, V> &obj) {
  return impl::PairsToValue(obj, obj.size());
}

template <typename K, typename V>
inline void FromValue(const Value &value, std::map<K, V> *obj) {
  obj->clear();
  impl::PairsFromValue<K, V>(value,
                             [obj](K &&key, V &&item) { obj->insert_or_assign(std::move(key), std::move(item)); });
}

template <typename K, typename V>
inline Value ToValue(const std::unordered_map<K, V> &obj) {
  return impl::PairsToValue(obj, obj.size());
}

template <typename K, typename V>
inline void FromValue(const Value &value, std::unordered_map<K, V> *obj) {
  obj->clear();
  impl::PairsFromValue<K, V>(value,
                             [obj](K &&key, V &&item) { obj->insert_or_assign(std::move(key), std::move(item)); });
}

template <typename T>
inline Value ToValue(const std::optional<T> &obj) {
  if (!obj) return Value::MakeNone();
  return Value::MakeOptional(ToValue(*obj));
}

template <typename T>
inline void FromValue(const Value &value, std::optional<T> *obj) {
  const auto *inner = value.ValueOptional();
  if (inner == nullptr) {
    *obj = std::nullopt;
    return;
  }
  T item{};
  FromValue(*inner, &item);
  *obj = std::move(item);
}

/// Converts `obj` with `ToValue` and encodes it.
template <typename T>
std::vector<uint8_t> Serialize(const T &obj) {
  return Serialize(ToValue(obj));
}

/// Decodes `data` and converts the value with `FromValue`.
///
/// @throw ValueException if the decoded value doesn't have the shape of `T`
template <typename T>
T Deserialize(std::span<const uint8_t> data, const DecoderOptions &options = {}) {
  const auto value = Deserialize(data, options);
  T obj{};
  FromValue(value, &obj);
  return obj;
}

}  // namespace lize::codec
