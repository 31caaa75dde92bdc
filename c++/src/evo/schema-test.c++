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

KJ_TEST("Type identifies native types") {
  KJ_EXPECT(Type::from<int32_t>() == Type::from<int32_t>());
  KJ_EXPECT(Type::from<const int32_t&>() == Type::from<int32_t>());
  KJ_EXPECT(Type::from<int32_t>() != Type::from<uint32_t>());
  KJ_EXPECT(Type::from<Point>().getName() == "Point");
  KJ_EXPECT(Type::from<Point>().getKind() == Kind::VALUE);
  KJ_EXPECT(Type::from<test::Handle>().getKind() == Kind::REFERENCE);
  KJ_EXPECT(Type::from<double>().getName() == "float64");
  KJ_EXPECT(Type().isUnknown());
  KJ_EXPECT(!Type::from<Point>().isUnknown());
  KJ_EXPECT(kj::str(Kind::VALUE) == "value");
}

KJ_TEST("default schema is empty") {
  Schema schema;
  KJ_EXPECT(schema.empty());
  KJ_EXPECT(schema.size() == 0);
  KJ_EXPECT(!schema.isPrimary());
  KJ_EXPECT(schema.getOwnerType().isUnknown());
  KJ_EXPECT(schema == Schema());
}

KJ_TEST("schema equality is structural") {
  SchemaDatabase database;
  database.describe<Record>()
      .field("id", &Record::id)
      .field("name", &Record::name)
      .build();
  database.describe<Point>()
      .field("x", &Point::x)
      .field("y", &Point::y)
      .build();

  Type record = Type::from<Record>();
  Schema primary = database.getOrCreatePrimarySchema(record);

  kj::StringPtr skipName[] = { "id", "title" };
  kj::StringPtr skipId[] = { "number", "name" };
  kj::StringPtr justId[] = { "id" };
  Schema a = database.loadHistorical(record, skipName);
  Schema b = database.loadHistorical(record, skipId);
  Schema c = database.loadHistorical(record, justId);

  KJ_EXPECT(a != primary);
  KJ_EXPECT(a != b);
  KJ_EXPECT(a != c);
  KJ_EXPECT(b != c);

  // Same member names and skip flags, different owner.
  kj::StringPtr pointNames[] = { "x", "y" };
  Schema point = database.getOrCreatePrimarySchema(Type::from<Point>());
  KJ_EXPECT(database.loadHistorical(Type::from<Point>(), pointNames) == point);
  KJ_EXPECT(point != primary);

  KJ_EXPECT(a.hashCode() == database.loadHistorical(record, skipName).hashCode());
}

KJ_TEST("schema complexes compare their root and inlined schemas") {
  SchemaDatabase database;
  database.describe<Point>()
      .field("x", &Point::x)
      .field("y", &Point::y)
      .build();
  database.describe<test::Shape>()
      .field("label", &test::Shape::label)
      .field("origin", &test::Shape::origin)
      .field("extent", &test::Shape::extent)
      .build();

  Schema shape = database.getOrCreatePrimarySchema(Type::from<test::Shape>());
  Schema point = database.getOrCreatePrimarySchema(Type::from<Point>());
  kj::StringPtr names[] = { "x" };
  Schema oldPoint = database.loadHistorical(Type::from<Point>(), names);

  SchemaComplex current(shape, kj::heapArray<Schema>({ point }));
  SchemaComplex same(shape, kj::heapArray<Schema>({ point }));
  SchemaComplex migrated(shape, kj::heapArray<Schema>({ oldPoint }));

  KJ_EXPECT(current == same);
  KJ_EXPECT(current.hashCode() == same.hashCode());
  KJ_EXPECT(current != migrated);
  KJ_EXPECT(current.clone() == current);
  KJ_EXPECT(SchemaComplex(shape, nullptr) != current);

  KJ_EXPECT(kj::str(migrated) ==
      "Shape (primary) {label: string, origin: Point, extent: Point} "
      "inlining [Point (historical) {x: int32}]");
}

}  // namespace
}  // namespace evo
