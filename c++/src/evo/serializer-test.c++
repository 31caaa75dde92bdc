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

#include "serializer.h"
#include "test-util.h"
#include <kj/test.h>
#include <kj/thread.h>

namespace evo {
namespace {

using test::Point;
using test::Record;
using test::Shape;
using test::bytes;

KJ_TEST("values round-trip") {
  Serializer serializer;
  test::describeShape(serializer);
  test::describeRecord(serializer);

  Shape shape;
  serializer.decode(serializer.encode(Shape { kj::str("box"), { -1, 2 }, { 30, 40 } }), shape);
  KJ_EXPECT(shape.label == "box");
  KJ_EXPECT(shape.origin.x == -1);
  KJ_EXPECT(shape.origin.y == 2);
  KJ_EXPECT(shape.extent.x == 30);
  KJ_EXPECT(shape.extent.y == 40);

  auto encoded = serializer.encode(Record { 7, kj::str("ok") });
  auto expected = bytes({
    0x04, 0x00, 0x00, 0x00, 0x07, 0x00, 0x00, 0x00,
    0x02, 0x00, 0x00, 0x00, 0x6f, 0x6b
  });
  KJ_EXPECT((encoded.asPtr() == expected.asPtr()), "unexpected encoding");
}

KJ_TEST("encoding grows a small initial buffer") {
  SerializerConfig config;
  config.initialBufferSize = 0;
  Serializer serializer(kj::mv(config));
  test::describeRecord(serializer);

  auto name = kj::heapString(1000);
  for (auto& c: name) c = 'z';

  Record decoded;
  serializer.decode(serializer.encode(Record { 12, kj::mv(name) }), decoded);
  KJ_EXPECT(decoded.id == 12);
  KJ_ASSERT(decoded.name.size() == 1000);
  KJ_EXPECT(decoded.name[999] == 'z');
}

KJ_TEST("all of the input must be consumed") {
  Serializer serializer;
  test::describePoint(serializer);

  auto input = bytes({
    0x04, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
    0x04, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00,
    0xff
  });
  Point point;
  KJ_EXPECT_THROW_MESSAGE("trailing bytes after encoded value", serializer.decode(input, point));
  KJ_EXPECT_THROW_MESSAGE("premature end of input",
      serializer.decode(input.slice(0, 10), point));
}

KJ_TEST("reference members go through their own formatter") {
  Serializer serializer;
  serializer.describe<test::Handle>()
      .field("id", &test::Handle::id)
      .build();
  serializer.describe<test::Account>()
      .field("owner", &test::Account::owner)
      .field("handle", &test::Account::handle)
      .build();

  test::Account account;
  serializer.decode(serializer.encode(test::Account { kj::str("ann"), { 99 } }), account);
  KJ_EXPECT(account.owner == "ann");
  KJ_EXPECT(account.handle.id == 99);
}

KJ_TEST("reference members follow schema changes of their type") {
  SerializerConfig config;
  config.versionTolerance = VersionTolerance::AUTOMATIC;
  Serializer serializer(kj::mv(config));
  serializer.describe<test::Handle>()
      .field("id", &test::Handle::id)
      .build();
  serializer.describe<test::Account>()
      .field("owner", &test::Account::owner)
      .field("handle", &test::Account::handle)
      .build();

  auto& formatter = serializer.getFormatter<test::Account>();
  auto before = serializer.encode(test::Account { kj::str("ann"), { 99 } });
  KJ_EXPECT(formatter.getGenerationCount() == 1);

  Type handleType = Type::from<test::Handle>();
  kj::StringPtr names[] = { "legacy", "id" };
  Schema oldHandle = serializer.getSchemaDatabase().loadHistorical(handleType, names);
  serializer.getTypeMetadata().setCurrentSchema(handleType, oldHandle);
  KJ_EXPECT(serializer.getFormatter<test::Handle>().getActiveSchema() == oldHandle);

  // The handle is written in the old layout; Account's own procedures are unchanged.
  test::Account account;
  serializer.decode(bytes({
    0x03, 0x00, 0x00, 0x00, 'a', 'n', 'n',
    0x10, 0x00, 0x00, 0x00,
    0x04, 0x00, 0x00, 0x00, 0x63, 0x00, 0x00, 0x00,
    0x04, 0x00, 0x00, 0x00, 0x2a, 0x00, 0x00, 0x00
  }), account);
  KJ_EXPECT(account.owner == "ann");
  KJ_EXPECT(account.handle.id == 42);
  KJ_EXPECT(formatter.getGenerationCount() == 1);
  KJ_EXPECT(formatter.getActiveSchema().isPrimary());

  KJ_EXPECT_THROW_MESSAGE("cannot encode using a non-primary schema",
      serializer.encode(test::Account { kj::str("ann"), { 99 } }));

  serializer.getTypeMetadata().setCurrentSchema(
      handleType, serializer.getSchemaDatabase().getOrCreatePrimarySchema(handleType));
  auto after = serializer.encode(test::Account { kj::str("ann"), { 99 } });
  KJ_EXPECT((after.asPtr() == before.asPtr()), "encoding changed after switching back");
}

KJ_TEST("serializer rejects undescribed and misregistered types") {
  Serializer serializer;
  test::describePoint(serializer);

  KJ_EXPECT_THROW_MESSAGE("type has no description", serializer.getFormatter<Record>());
  KJ_EXPECT_THROW_MESSAGE("type was already described", test::describePoint(serializer));

  // Tagged contains a primitive nobody registered procedures for.
  serializer.describe<test::Tagged>()
      .field("trigger", &test::Tagged::trigger)
      .field("origin", &test::Tagged::origin)
      .build();
  KJ_EXPECT_THROW_MESSAGE("no procedures registered for primitive type",
      serializer.getFormatter<test::Tagged>());

  KJ_EXPECT_THROW_MESSAGE("only primitive types take custom procedures",
      serializer.addProcedures<Point>(
          [](kj::Array<byte>&, size_t&, const Point&) {},
          [](kj::ArrayPtr<const byte>, size_t&, Point&) {}));
  KJ_EXPECT_THROW_MESSAGE("type already has procedures",
      serializer.addProcedures<int32_t>(
          [](kj::Array<byte>&, size_t&, const int32_t&) {},
          [](kj::ArrayPtr<const byte>, size_t&, int32_t&) {}));
}

KJ_TEST("concurrent use from several threads") {
  Serializer serializer;
  test::describeShape(serializer);

  constexpr uint THREADS = 4;
  constexpr uint ROUNDS = 200;
  uint failures[THREADS] = {};

  {
    auto threads = kj::heapArrayBuilder<kj::Own<kj::Thread>>(THREADS);
    for (uint t = 0; t < THREADS; t++) {
      threads.add(kj::heap<kj::Thread>([&serializer, &failures, t]() {
        for (uint i = 0; i < ROUNDS; i++) {
          int32_t n = t * ROUNDS + i;
          Shape shape;
          serializer.decode(serializer.encode(Shape { kj::str(n), { n, -n }, { 1, 2 } }), shape);
          if (shape.label != kj::str(n) || shape.origin.x != n || shape.origin.y != -n) {
            ++failures[t];
          }
        }
      }));
    }
  }

  for (auto count: failures) {
    KJ_EXPECT(count == 0);
  }
}

}  // namespace
}  // namespace evo
