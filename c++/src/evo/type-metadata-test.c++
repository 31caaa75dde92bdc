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

#include "type-metadata.h"
#include "test-util.h"
#include <kj/test.h>

namespace evo {
namespace {

using test::Point;

class RecordingObserver final: public SchemaChangeObserver {
public:
  RecordingObserver(kj::Vector<kj::String>& log, kj::StringPtr name): log(log), name(name) {}

  void onSchemaChanged(const TypeMetadata& metadata) override {
    log.add(kj::str(name, ": ", metadata.getType(), " ",
                    metadata.getCurrentSchema().isPrimary() ? "primary" : "historical"));
    KJ_REQUIRE(!fail, "observer failed on purpose");
  }

  bool fail = false;

private:
  kj::Vector<kj::String>& log;
  kj::StringPtr name;
};

void describePoint(SchemaDatabase& database) {
  database.describe<Point>()
      .field("x", &Point::x)
      .field("y", &Point::y)
      .build();
}

KJ_TEST("current schema starts as the primary schema") {
  SchemaDatabase database;
  describePoint(database);
  TypeMetadataService service(database);
  Type type = Type::from<Point>();

  Schema primary = database.getOrCreatePrimarySchema(type);
  KJ_EXPECT(service.getCurrentSchema(type) == primary);
  KJ_EXPECT(service.getCurrentSchema(type).isPrimary());

  auto metadata = service.getMetadata(type);
  KJ_EXPECT(metadata.getType() == type);
  KJ_EXPECT(metadata.getPrimarySchema() == primary);
  KJ_EXPECT(metadata.getCurrentSchema() == primary);

  KJ_EXPECT_THROW_MESSAGE("type has no description",
      service.getCurrentSchema(Type::from<test::Record>()));
}

KJ_TEST("schema changes are published to observers in subscription order") {
  SchemaDatabase database;
  describePoint(database);
  TypeMetadataService service(database);
  Type type = Type::from<Point>();

  kj::Vector<kj::String> log;
  RecordingObserver first(log, "first");
  RecordingObserver second(log, "second");
  auto firstSubscription = service.subscribe(type, first);
  auto secondSubscription = service.subscribe(type, second);

  kj::StringPtr names[] = { "x" };
  Schema historical = database.loadHistorical(type, names);
  service.setCurrentSchema(type, historical);

  KJ_EXPECT(service.getCurrentSchema(type) == historical);
  KJ_EXPECT(service.getMetadata(type).getPrimarySchema().isPrimary());
  KJ_ASSERT(log.size() == 2);
  KJ_EXPECT(log[0] == "first: Point historical");
  KJ_EXPECT(log[1] == "second: Point historical");

  firstSubscription = nullptr;
  service.setCurrentSchema(type, database.getOrCreatePrimarySchema(type));
  KJ_ASSERT(log.size() == 3);
  KJ_EXPECT(log[2] == "second: Point primary");
}

KJ_TEST("observer exceptions reach the publisher") {
  SchemaDatabase database;
  describePoint(database);
  TypeMetadataService service(database);
  Type type = Type::from<Point>();

  kj::Vector<kj::String> log;
  RecordingObserver failing(log, "failing");
  RecordingObserver later(log, "later");
  failing.fail = true;
  auto failingSubscription = service.subscribe(type, failing);
  auto laterSubscription = service.subscribe(type, later);

  kj::StringPtr names[] = { "y" };
  Schema historical = database.loadHistorical(type, names);
  KJ_EXPECT_THROW_MESSAGE("observer failed on purpose",
      service.setCurrentSchema(type, historical));

  // The change itself stays in effect.
  KJ_EXPECT(service.getCurrentSchema(type) == historical);
  KJ_ASSERT(log.size() == 1);
  KJ_EXPECT(log[0] == "failing: Point historical");
}

KJ_TEST("schemas must belong to the type they are published for") {
  SchemaDatabase database;
  describePoint(database);
  database.describe<test::Record>()
      .field("id", &test::Record::id)
      .build();
  TypeMetadataService service(database);

  KJ_EXPECT_THROW_MESSAGE("schema belongs to a different type",
      service.setCurrentSchema(Type::from<Point>(),
          database.getOrCreatePrimarySchema(Type::from<test::Record>())));
}

}  // namespace
}  // namespace evo
