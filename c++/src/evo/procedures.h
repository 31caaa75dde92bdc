// Copyright (c) 2013-2014 Sandstorm Development Group, Inc. and contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#pragma once

#include "common.h"
#include "schema.h"
#include <kj/array.h>
#include <kj/function.h>
#include <kj/memory.h>

EVO_BEGIN_HEADER

namespace evo {

template <typename T>
using EncodeProc = kj::ConstFunction<void(kj::Array<byte>& buffer, size_t& offset, const T& value)>;
// Writes `value` at `offset`, growing `buffer` as needed, and advances `offset` past it.

template <typename T>
using DecodeProc = kj::ConstFunction<void(kj::ArrayPtr<const byte> buffer, size_t& offset,
                                          T& value)>;
// Reads into the existing instance `value` from `offset` and advances `offset`.  `buffer` ends
// where the value's data ends as far as the caller knows; reading past it is an error.

class ProcedurePairBase {
public:
  virtual ~ProcedurePairBase() noexcept(false);

  virtual Type getType() const = 0;
};

template <typename T>
class ProcedurePair final: public ProcedurePairBase {
  // The encode and decode procedures of one type, bound to one schema.  Immutable, and both
  // procedures are safe to call concurrently as long as each caller uses its own buffer.

public:
  inline ProcedurePair(EncodeProc<T> encode, DecodeProc<T> decode)
      : encode(kj::mv(encode)), decode(kj::mv(decode)) {}
  KJ_DISALLOW_COPY_AND_MOVE(ProcedurePair);

  Type getType() const override { return Type::from<T>(); }

  const EncodeProc<T> encode;
  const DecodeProc<T> decode;
};

class FormatterResolver {
  // Supplies the procedures of any field type.  Generated procedures call this once per field
  // while they are being built, never while encoding or decoding.

public:
  virtual const ProcedurePairBase& resolveBase(Type type) = 0;
  // Returns procedures that stay valid as long as the resolver lives.  Throws if `type` is unknown.

  virtual const ProcedurePairBase& resolveSchemaBase(Schema schema) = 0;
  // Like resolveBase(), but the procedures are bound to `schema` instead of the current schema of
  // its owner type.  Only value types can be resolved this way.

  template <typename T>
  const ProcedurePair<T>& resolve() {
    return kj::downcast<const ProcedurePair<T>>(resolveBase(Type::from<T>()));
  }
};

}  // namespace evo

EVO_END_HEADER
