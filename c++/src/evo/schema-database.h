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
#include "accessor.h"
#include <kj/map.h>
#include <kj/mutex.h>
#include <kj/vector.h>

EVO_BEGIN_HEADER

namespace evo {

template <typename T>
class TypeDescription;

class SchemaDatabase {
  // Owns the descriptions of all known types and every Schema created from them.  Schemas are
  // interned:  loading a schema that is structurally equal to one already known returns the
  // existing one.  Schemas stay valid as long as the database lives.
  //
  // All methods are thread-safe.

public:
  SchemaDatabase();
  ~SchemaDatabase() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(SchemaDatabase);

  template <typename T>
  TypeDescription<T> describe() { return TypeDescription<T>(*this); }
  // Begins the description of T's members.  Each type can be described once.

  bool isDescribed(Type type) const;

  Schema getOrCreatePrimarySchema(Type type) const;
  // Returns the primary schema of `type`, creating it from the type's description on first use.
  // Throws if the type was never described.

  Schema loadHistorical(Type type, kj::ArrayPtr<const kj::StringPtr> memberNames) const;
  // Reconstructs the schema that data written by an older version of `type` was encoded with, from
  // the member names found in that data, in order.  Names that the type still has map to its
  // current members; unknown names become skip members.  If the result is structurally equal to
  // the primary schema, the primary schema is returned.

private:
  struct MemberDescription {
    kj::String name;
    kj::Own<MemberAccessorBase> accessor;
  };

  struct TypeEntry {
    kj::Array<MemberDescription> members;
    kj::Maybe<kj::Own<_::RawSchema>> primary;
    kj::Vector<kj::Own<_::RawSchema>> historical;
  };

  kj::MutexGuarded<kj::HashMap<Type, kj::Own<TypeEntry>>> types;

  void addDescription(Type type, kj::Array<MemberDescription> members);
  static Schema getOrCreatePrimary(Type type, TypeEntry& entry);

  template <typename T>
  friend class TypeDescription;
};

template <typename T>
class TypeDescription {
  // Builds the description of T:  its serializable members in order, each bound to a
  // pointer-to-member.  Obtained from SchemaDatabase::describe<T>().
  //
  //     database.describe<Point>()
  //         .field("x", &Point::x)
  //         .field("y", &Point::y)
  //         .build();

public:
  explicit TypeDescription(SchemaDatabase& database): database(database) {}
  TypeDescription(TypeDescription&&) = default;

  template <typename F>
  TypeDescription& field(kj::StringPtr name, F T::* member) {
    members.add(SchemaDatabase::MemberDescription {
      kj::heapString(name), kj::heap<FieldAccessor<T, F>>(member)
    });
    return *this;
  }

  Schema build() {
    Type type = Type::from<T>();
    database.addDescription(type, members.releaseAsArray());
    return database.getOrCreatePrimarySchema(type);
  }

private:
  SchemaDatabase& database;
  kj::Vector<SchemaDatabase::MemberDescription> members;
};

}  // namespace evo

EVO_END_HEADER
