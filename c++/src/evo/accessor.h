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

#include "schema.h"
#include "procedures.h"
#include <kj/debug.h>

EVO_BEGIN_HEADER

namespace evo {

template <typename T>
class MemberAccessor: public MemberAccessorBase {
  // Typed access to one member of T.  The bind methods look up the field's procedures once and
  // return a procedure that reads or writes only this member.

public:
  Type getOwnerType() const override { return Type::from<T>(); }

  virtual EncodeProc<T> bindEncoder(FormatterResolver& resolver) const = 0;
  virtual DecodeProc<T> bindDecoder(FormatterResolver& resolver) const = 0;
};

template <typename T, typename F>
class FieldAccessor final: public MemberAccessor<T> {
  // Accesses a data member through a pointer-to-member.

public:
  inline explicit FieldAccessor(F T::* field): field(field) {}

  Type getFieldType() const override { return Type::from<F>(); }

  EncodeProc<T> bindEncoder(FormatterResolver& resolver) const override {
    const ProcedurePair<F>& procedures = resolver.template resolve<F>();
    F T::* member = field;
    return [&procedures, member](kj::Array<byte>& buffer, size_t& offset, const T& value) {
      procedures.encode(buffer, offset, value.*member);
    };
  }

  DecodeProc<T> bindDecoder(FormatterResolver& resolver) const override {
    const ProcedurePair<F>& procedures = resolver.template resolve<F>();
    F T::* member = field;
    return [&procedures, member](kj::ArrayPtr<const byte> buffer, size_t& offset, T& value) {
      procedures.decode(buffer, offset, value.*member);
    };
  }

private:
  F T::* field;
};

template <typename T>
const MemberAccessor<T>& getAccessor(const SchemaMember& member) {
  const MemberAccessorBase& base = member.getAccessor();
  KJ_REQUIRE(base.getOwnerType() == Type::from<T>(),
             "schema member belongs to a different type", member.getName(),
             base.getOwnerType(), Type::from<T>());
  return kj::downcast<const MemberAccessor<T>>(base);
}

}  // namespace evo

EVO_END_HEADER
