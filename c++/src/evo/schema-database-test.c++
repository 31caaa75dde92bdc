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

#include "schema-database.h"
#include "test-util.h"
#include <kj/test.h>

namespace evo {
namespace {

using test::Point;
using test::Record;
using test::Triple;

void describeRecord(SchemaDatabase& database) {
  database.describe<Record>()
      .field("id", &Record::id)
      .field("name", &Record::name)
      .build();
}

KJ_TEST("primary schema lists described members in order") {
  SchemaDatabase database;
  KJ_EXPECT(!database.isDescribed(Type::from<Record>()));

  Schema built = database.describe<Record>()
      .field("id", &Record::id)
      .field("name", &Record::name)
      .build();

  KJ_EXPECT(database.isDescribed(Type::from<Record>()));
  Schema schema = database.getOrCreatePrimarySchema(Type::from<Record>());
  KJ_EXPECT(schema == built);
  KJ_EXPECT(schema.isPrimary());
  KJ_EXPECT(schema.getOwnerType() == Type::from<Record>());
  KJ_ASSERT(schema.size() == 2);
  KJ_EXPECT(schema.getMembers()[0].getName() == "id");
  KJ_EXPECT(schema.getMembers()[0].getType() == Type::from<int32_t>());
  KJ_EXPECT(schema.getMembers()[1].getName() == "name");
  KJ_EXPECT(schema.getMembers()[1].getType() == Type::from<kj::String>());
  KJ_EXPECT(!schema.getMembers()[1].isSkip());

  KJ_EXPECT(kj::str(schema) == "Record (primary) {id: int32, name: string}");
}

KJ_TEST("types must be described once, without duplicate members") {
  SchemaDatabase database;
  describeRecord(database);

  KJ_EXPECT_THROW_MESSAGE("type was already described", describeRecord(database));

  KJ_EXPECT_THROW_MESSAGE("duplicate member name", database.describe<Triple>()
      .field("first", &Triple::first)
      .field("first", &Triple::third)
      .build());

  KJ_EXPECT_THROW_MESSAGE("cannot be described", database.describe<test::Trigger>()
      .field("value", &test::Trigger::value)
      .build());

  KJ_EXPECT_THROW_MESSAGE("type has no description",
      database.getOrCreatePrimarySchema(Type::from<Point>()));
}

KJ_TEST("historical schema maps unknown names to skip members") {
  SchemaDatabase database;
  describeRecord(database);

  kj::StringPtr names[] = { "id", "legacy", "name" };
  Schema schema = database.loadHistorical(Type::from<Record>(), names);

  KJ_EXPECT(!schema.isPrimary());
  KJ_ASSERT(schema.size() == 3);
  KJ_EXPECT(!schema.getMembers()[0].isSkip());
  KJ_EXPECT(schema.getMembers()[1].isSkip());
  KJ_EXPECT(schema.getMembers()[1].getType().isUnknown());
  KJ_EXPECT(!schema.getMembers()[2].isSkip());
  KJ_EXPECT(schema.getMembers()[2].getType() == Type::from<kj::String>());
  KJ_EXPECT_THROW_MESSAGE("skip members have no accessor", schema.getMembers()[1].getAccessor());

  KJ_EXPECT(kj::str(schema) == "Record (historical) {id: int32, legacy: skip, name: string}");
}

KJ_TEST("historical schemas are interned") {
  SchemaDatabase database;
  describeRecord(database);
  Type type = Type::from<Record>();

  kj::StringPtr same[] = { "id", "name" };
  Schema primary = database.getOrCreatePrimarySchema(type);
  Schema loaded = database.loadHistorical(type, same);
  KJ_EXPECT(loaded.isPrimary());
  KJ_EXPECT(loaded == primary);

  kj::StringPtr reordered[] = { "name", "id" };
  Schema a = database.loadHistorical(type, reordered);
  Schema b = database.loadHistorical(type, reordered);
  KJ_EXPECT(!a.isPrimary());
  KJ_EXPECT(a != primary);
  KJ_EXPECT(a == b);
  KJ_EXPECT((a.getMembers().begin() == b.getMembers().begin()), "not interned");

  kj::StringPtr subset[] = { "id" };
  KJ_EXPECT(database.loadHistorical(type, subset) != a);

  kj::StringPtr none[] = { "gone" };
  Schema onlySkip = database.loadHistorical(type, none);
  KJ_ASSERT(onlySkip.size() == 1);
  KJ_EXPECT(onlySkip.getMembers()[0].isSkip());
}

KJ_TEST("historical schema rejects bad input") {
  SchemaDatabase database;
  describeRecord(database);

  kj::StringPtr duplicate[] = { "id", "id" };
  KJ_EXPECT_THROW_MESSAGE("duplicate member name in historical schema",
      database.loadHistorical(Type::from<Record>(), duplicate));

  kj::StringPtr names[] = { "x" };
  KJ_EXPECT_THROW_MESSAGE("type has no description",
      database.loadHistorical(Type::from<Point>(), names));
}

}  // namespace
}  // namespace evo
