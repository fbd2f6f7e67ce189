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

#include "utils/exceptions.hpp"

namespace lize::codec {

/// Base class of every error raised by the codec.
class CodecException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(CodecException)
};

/// A value was built outside of its legal domain, e.g. a SmallU8 above 235.
/// Raised by the encoder before a single byte is written.
class ConstructionException : public CodecException {
 public:
  using CodecException::CodecException;
  SPECIALIZE_GET_EXCEPTION_NAME(ConstructionException)
};

/// A value tree (or an encoded buffer) is nested deeper than allowed.
class NestingDepthException : public CodecException {
 public:
  using CodecException::CodecException;
  SPECIALIZE_GET_EXCEPTION_NAME(NestingDepthException)
};

/// Accessing a `Value` as a type it doesn't hold, or converting it to a native
/// type of a different shape.
class ValueException : public CodecException {
 public:
  using CodecException::CodecException;
  SPECIALIZE_GET_EXCEPTION_NAME(ValueException)
};

/// Base class of the errors that can be raised while decoding a buffer. After
/// any of them the position of the reader is unspecified.
class DecodeException : public CodecException {
 public:
  using CodecException::CodecException;
  SPECIALIZE_GET_EXCEPTION_NAME(DecodeException)
};

/// The buffer ends before a declared length or a fixed-width payload is
/// fully present.
class TruncationException : public DecodeException {
 public:
  using DecodeException::DecodeException;
  SPECIALIZE_GET_EXCEPTION_NAME(TruncationException)
};

/// A tag (or presence flag) byte matches no known variant.
class UnknownVariantException : public DecodeException {
 public:
  using DecodeException::DecodeException;
  SPECIALIZE_GET_EXCEPTION_NAME(UnknownVariantException)
};

/// A length prefix isn't representable on this platform or exceeds the
/// configured maximum.
class LengthOverflowException : public DecodeException {
 public:
  using DecodeException::DecodeException;
  SPECIALIZE_GET_EXCEPTION_NAME(LengthOverflowException)
};

/// Bytes are left over after the top-level value was decoded.
class TrailingDataException : public DecodeException {
 public:
  using DecodeException::DecodeException;
  SPECIALIZE_GET_EXCEPTION_NAME(TrailingDataException)
};

}  // namespace lize::codec
