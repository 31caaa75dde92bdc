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
#include <kj/array.h>
#include <kj/string.h>

EVO_BEGIN_HEADER

namespace evo {

class SchemaDatabase;

class MemberAccessorBase {
  // Gets and sets one data member of an instance of the owning type.  The typed interface is
  // MemberAccessor<T>, see accessor.h.

public:
  virtual ~MemberAccessorBase() noexcept(false);

  virtual Type getOwnerType() const = 0;
  virtual Type getFieldType() const = 0;
};

class SchemaMember {
  // One field slot of a Schema.

public:
  SchemaMember(kj::String name, Type type, const MemberAccessorBase* accessor);
  // `accessor` is null for a skip member.

  inline kj::StringPtr getName() const { return name; }

  inline Type getType() const { return type; }
  // Declared field type.  Unknown for skip members.

  inline bool isSkip() const { return accessor == nullptr; }
  // The slot exists in the encoded data but the reader has no field to store it in.

  const MemberAccessorBase& getAccessor() const;
  // Throws for skip members.

  bool operator==(const SchemaMember& other) const;
  inline bool operator!=(const SchemaMember& other) const { return !(*this == other); }

private:
  kj::String name;
  Type type;
  const MemberAccessorBase* accessor;
};

namespace _ {  // private

struct RawSchema {
  Type owner;
  bool isPrimary;
  kj::Array<SchemaMember> members;
  uint hash;
};

extern const RawSchema NULL_SCHEMA;

}  // namespace _ (private)

class Schema {
  // The ordered fields of one type as they appear in encoded data.  A Schema is a cheap handle;
  // the data it refers to is owned by the SchemaDatabase that created it and is never modified.
  //
  // Exactly one schema per type is primary: the type's current field set.  All others are
  // historical, reconstructed from data written by an older version of the type, and may contain
  // skip members.  Historical schemas can only be read.

public:
  inline Schema(): raw(&_::NULL_SCHEMA) {}
  // An empty schema of unknown type.

  inline Type getOwnerType() const { return raw->owner; }
  inline bool isPrimary() const { return raw->isPrimary; }

  inline kj::ArrayPtr<const SchemaMember> getMembers() const { return raw->members; }
  inline size_t size() const { return raw->members.size(); }
  inline bool empty() const { return raw->members.size() == 0; }

  bool operator==(const Schema& other) const;
  inline bool operator!=(const Schema& other) const { return !(*this == other); }
  // Structural equality:  same owner, same members in the same order with the same skip flags.
  // Whether a schema is primary is not part of its identity.

  inline uint hashCode() const { return raw->hash; }

private:
  const _::RawSchema* raw;

  inline explicit Schema(const _::RawSchema* raw): raw(raw) {}

  friend class SchemaDatabase;
};

kj::String KJ_STRINGIFY(const Schema& schema);

class SchemaComplex {
  // A type's own schema together with the current schemas of the value types inlined into it.
  // Procedures generated for a type depend on all of them, so this is what they are cached by.

public:
  SchemaComplex() = default;
  SchemaComplex(Schema root, kj::Array<Schema> inlined);
  SchemaComplex(SchemaComplex&&) = default;
  SchemaComplex& operator=(SchemaComplex&&) = default;

  inline Schema getRoot() const { return root; }
  inline kj::ArrayPtr<const Schema> getInlined() const { return inlined; }

  SchemaComplex clone() const;

  bool operator==(const SchemaComplex& other) const;
  inline bool operator!=(const SchemaComplex& other) const { return !(*this == other); }
  uint hashCode() const;

private:
  Schema root;
  kj::Array<Schema> inlined;
};

kj::String KJ_STRINGIFY(const SchemaComplex& complex);

}  // namespace evo

EVO_END_HEADER
