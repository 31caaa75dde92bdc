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

#include "procedures.h"
#include "wire.h"
#include <kj/map.h>
#include <kj/mutex.h>

EVO_BEGIN_HEADER

namespace evo {

class FormatterRegistry {
  // Procedures for types that are not described by a schema:  the built-in primitives and
  // anything added with add().  Registered procedures are never removed or replaced.
  //
  // Built-in encodings:
  // - Integers and floating point:  fixed width, little-endian.
  // - bool:  one byte, 0 or 1.
  // - kj::String:  the raw bytes, no terminator and no length.  The enclosing field frame
  //   gives the extent, so a string decoder consumes everything up to the end of its buffer.

public:
  FormatterRegistry();
  ~FormatterRegistry() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(FormatterRegistry);

  template <typename T>
  void add(EncodeProc<T> encode, DecodeProc<T> decode) {
    addBase(Type::from<T>(), kj::heap<ProcedurePair<T>>(kj::mv(encode), kj::mv(decode)));
  }

  kj::Maybe<const ProcedurePairBase&> find(Type type) const;

private:
  kj::MutexGuarded<kj::HashMap<Type, kj::Own<ProcedurePairBase>>> pairs;

  void addBase(Type type, kj::Own<ProcedurePairBase> pair);

  template <typename T>
  void addFixedWidth();
};

}  // namespace evo

EVO_END_HEADER
