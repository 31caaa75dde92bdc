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

#include "schema-formatter.h"
#include "test-util.h"
#include <kj/mutex.h>
#include <kj/test.h>
#include <kj/thread.h>

namespace evo {
namespace {

using test::Point;
using test::Record;
using test::Shape;
using test::Tagged;
using test::Trigger;
using test::bytes;

SerializerConfig tolerantConfig() {
  SerializerConfig config;
  config.versionTolerance = VersionTolerance::AUTOMATIC;
  return config;
}

Schema loadPoint(Serializer& serializer, kj::ArrayPtr<const kj::StringPtr> names) {
  return serializer.getSchemaDatabase().loadHistorical(Type::from<Point>(), names);
}

KJ_TEST("procedures are generated once per schema") {
  Serializer serializer(tolerantConfig());
  test::describePoint(serializer);
  test::describeRecord(serializer);

  auto& formatter = serializer.getFormatter<Point>();
  Schema primary = serializer.getSchemaDatabase().getOrCreatePrimarySchema(Type::from<Point>());
  KJ_EXPECT(formatter.getActiveSchema() == primary);
  KJ_EXPECT(formatter.getGenerationCount() == 1);

  formatter.activate(primary);
  KJ_EXPECT(formatter.getGenerationCount() == 1);

  kj::StringPtr names[] = { "x" };
  Schema historical = loadPoint(serializer, names);
  formatter.activate(historical);
  KJ_EXPECT(formatter.getActiveSchema() == historical);
  KJ_EXPECT(formatter.getGenerationCount() == 2);

  formatter.activate(primary);
  formatter.activate(historical);
  formatter.activate(loadPoint(serializer, names));
  KJ_EXPECT(formatter.getGenerationCount() == 2);

  KJ_EXPECT_THROW_MESSAGE("schema belongs to a different type", formatter.activate(
      serializer.getSchemaDatabase().getOrCreatePrimarySchema(Type::from<Record>())));
}

KJ_TEST("historical schemas are read-only") {
  Serializer serializer(tolerantConfig());
  test::describePoint(serializer);
  auto& formatter = serializer.getFormatter<Point>();

  kj::StringPtr names[] = { "y" };
  formatter.activate(loadPoint(serializer, names));

  KJ_EXPECT_THROW_MESSAGE("cannot encode using a non-primary schema",
      serializer.encode(Point { 1, 2 }));

  Point point { 7, 0 };
  serializer.decode(bytes({ 0x04, 0x00, 0x00, 0x00, 0x09, 0x00, 0x00, 0x00 }), point);
  KJ_EXPECT(point.x == 7);
  KJ_EXPECT(point.y == 9);
}

KJ_TEST("formatters follow published schema changes of inlined value types") {
  Serializer serializer(tolerantConfig());
  test::describeShape(serializer);
  auto& metadata = serializer.getTypeMetadata();
  Type pointType = Type::from<Point>();

  auto& formatter = serializer.getFormatter<Shape>();
  Schema shapePrimary = formatter.getActiveSchema();
  KJ_EXPECT(formatter.getGenerationCount() == 1);

  kj::StringPtr names[] = { "x" };
  Schema oldPoint = loadPoint(serializer, names);
  metadata.setCurrentSchema(pointType, oldPoint);

  // Shape's own schema is unchanged, but its procedures now read the old Point layout.
  KJ_EXPECT(formatter.getActiveSchema() == shapePrimary);
  KJ_EXPECT(formatter.getGenerationCount() == 2);
  KJ_EXPECT(serializer.getFormatter<Point>().getActiveSchema() == oldPoint);

  Shape shape;
  shape.origin.y = 9;
  serializer.decode(bytes({
    0x01, 0x00, 0x00, 0x00, 'a',
    0x08, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
    0x08, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00
  }), shape);
  KJ_EXPECT(shape.label == "a");
  KJ_EXPECT(shape.origin.x == 1);
  KJ_EXPECT(shape.origin.y == 9);
  KJ_EXPECT(shape.extent.x == 2);
  KJ_EXPECT(shape.extent.y == 0);

  KJ_EXPECT_THROW_MESSAGE("cannot encode using a non-primary schema",
      serializer.encode(Shape { kj::str("b"), { 1, 2 }, { 3, 4 } }));

  metadata.setCurrentSchema(pointType, metadata.getOrCreatePrimarySchema(pointType));
  KJ_EXPECT(formatter.getGenerationCount() == 2);
  auto encoded = serializer.encode(Shape { kj::str("b"), { 1, 2 }, { 3, 4 } });
  KJ_EXPECT(encoded.size() == (4 + 1) + 2 * (4 + 2 * (4 + 4)));
}

KJ_TEST("formatters pick up schemas published before they were created") {
  Serializer serializer(tolerantConfig());
  test::describePoint(serializer);

  kj::StringPtr names[] = { "y", "x" };
  Schema swapped = loadPoint(serializer, names);
  serializer.getTypeMetadata().setCurrentSchema(Type::from<Point>(), swapped);

  auto& formatter = serializer.getFormatter<Point>();
  KJ_EXPECT(formatter.getActiveSchema() == swapped);
  KJ_EXPECT(formatter.getGenerationCount() == 2);
}

KJ_TEST("disabled version tolerance ignores schema changes") {
  Serializer serializer;
  KJ_EXPECT(serializer.getConfig().versionTolerance == VersionTolerance::DISABLED);
  test::describeShape(serializer);
  auto& formatter = serializer.getFormatter<Shape>();
  auto& pointFormatter = serializer.getFormatter<Point>();

  kj::StringPtr names[] = { "x" };
  Schema oldPoint = loadPoint(serializer, names);
  serializer.getTypeMetadata().setCurrentSchema(Type::from<Point>(), oldPoint);

  KJ_EXPECT(serializer.getTypeMetadata().getCurrentSchema(Type::from<Point>()) == oldPoint);
  KJ_EXPECT(pointFormatter.getActiveSchema().isPrimary());
  KJ_EXPECT(formatter.getGenerationCount() == 1);

  Shape shape;
  serializer.decode(serializer.encode(Shape { kj::str("c"), { 1, 2 }, { 3, 4 } }), shape);
  KJ_EXPECT(shape.label == "c");
  KJ_EXPECT(shape.extent.y == 4);
}

KJ_TEST("empty schemas do not generate procedures") {
  Serializer serializer(tolerantConfig());
  serializer.describe<test::Nothing>().build();
  test::describeRecord(serializer);

  auto& nothing = serializer.getFormatter<test::Nothing>();
  KJ_EXPECT(nothing.getGenerationCount() == 0);
  KJ_EXPECT(serializer.encode(test::Nothing()).size() == 0);
  test::Nothing value;
  serializer.decode(nullptr, value);

  auto& formatter = serializer.getFormatter<Record>();
  Schema empty = serializer.getSchemaDatabase().loadHistorical(Type::from<Record>(), nullptr);
  KJ_EXPECT(empty.empty());
  KJ_EXPECT(!empty.isPrimary());

  formatter.activate(empty);
  KJ_EXPECT(formatter.getActiveSchema() == empty);
  KJ_EXPECT(formatter.getGenerationCount() == 1);

  Record record { 4, kj::str("four") };
  serializer.decode(nullptr, record);
  KJ_EXPECT(record.id == 4);
  KJ_EXPECT(record.name == "four");
  KJ_EXPECT_THROW_MESSAGE("cannot encode using a non-primary schema", serializer.encode(record));
}

KJ_TEST("unsupported types get no schema formatter") {
  SerializerConfig config;
  config.bannedTypes.add(Type::from<Record>());
  Serializer serializer(kj::mv(config));
  test::describeRecord(serializer);

  KJ_EXPECT_THROW_MESSAGE("type is not supported by the schema formatter",
      serializer.getFormatter<Record>());
  KJ_EXPECT_THROW_MESSAGE("type is not supported by the schema formatter",
      serializer.encode(Record { 1, kj::str("x") }));

  KJ_EXPECT_THROW_MESSAGE("type is not supported by the schema formatter",
      checkSupported(Type::from<int32_t>(), serializer.getConfig()));
  KJ_EXPECT_THROW_MESSAGE("type is not supported by the schema formatter",
      checkSupported(Type(), serializer.getConfig()));
  checkSupported(Type::from<Point>(), serializer.getConfig());
  checkSupported(Type::from<test::Handle>(), serializer.getConfig());
}

KJ_TEST("only value members are inlined") {
  Serializer serializer;
  test::describeShape(serializer);
  serializer.describe<test::Handle>()
      .field("id", &test::Handle::id)
      .build();
  serializer.describe<test::Account>()
      .field("owner", &test::Account::owner)
      .field("handle", &test::Account::handle)
      .build();

  auto& database = serializer.getSchemaDatabase();
  auto shapeInlined = findInlinedTypes(
      database.getOrCreatePrimarySchema(Type::from<Shape>()));
  KJ_ASSERT(shapeInlined.size() == 1);
  KJ_EXPECT(shapeInlined[0] == Type::from<Point>());

  KJ_EXPECT(findInlinedTypes(
      database.getOrCreatePrimarySchema(Type::from<test::Account>())).size() == 0);
}

KJ_TEST("generated procedures inline the member schemas they were keyed by") {
  Serializer serializer(tolerantConfig());
  test::describeShape(serializer);
  test::describeRecord(serializer);
  Type pointType = Type::from<Point>();

  kj::StringPtr names[] = { "x" };
  Schema oldPoint = loadPoint(serializer, names);
  Schema pins[] = { oldPoint };
  _::PinnedResolver pinned(serializer, kj::arrayPtr(pins, 1));

  // The metadata still says Point is primary.
  KJ_EXPECT(serializer.getTypeMetadata().getCurrentSchema(pointType).isPrimary());
  KJ_EXPECT(&pinned.resolveBase(pointType) ==
            &serializer.getFormatter<Point>().getProceduresFor(oldPoint));
  KJ_EXPECT(&pinned.resolveBase(pointType) != &serializer.resolveBase(pointType));
  KJ_EXPECT(&pinned.resolveBase(Type::from<Record>()) ==
            &serializer.resolveBase(Type::from<Record>()));

  auto decoder = generateDecoder<Shape>(
      serializer.getSchemaDatabase().getOrCreatePrimarySchema(Type::from<Shape>()), pinned);
  auto input = bytes({
    0x00, 0x00, 0x00, 0x00,
    0x08, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00,
    0x08, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x06, 0x00, 0x00, 0x00
  });
  Shape shape;
  shape.origin.y = 3;
  size_t offset = 0;
  decoder(input, offset, shape);
  KJ_EXPECT(offset == input.size());
  KJ_EXPECT(shape.origin.x == 5);
  KJ_EXPECT(shape.origin.y == 3);
  KJ_EXPECT(shape.extent.x == 6);

  KJ_EXPECT_THROW_MESSAGE("schema belongs to a different type",
      serializer.getFormatter<Shape>().getProceduresFor(oldPoint));
}

class GateObserver final: public SchemaChangeObserver {
  // Holds up the publisher of `held` until release() is called.

public:
  explicit GateObserver(Schema held): held(held) {}

  void onSchemaChanged(const TypeMetadata& changed) override {
    if (changed.getCurrentSchema() != held) return;
    state.lockExclusive()->entered = true;
    state.when([](const Gate& gate) { return gate.released; }, [](Gate&) {});
  }

  void waitEntered() {
    state.when([](const Gate& gate) { return gate.entered; }, [](Gate&) {});
  }

  void release() {
    state.lockExclusive()->released = true;
  }

private:
  struct Gate {
    bool entered = false;
    bool released = false;
  };

  Schema held;
  kj::MutexGuarded<Gate> state;
};

KJ_TEST("out-of-order change notifications settle on the latest schema") {
  Serializer serializer(tolerantConfig());
  test::describeShape(serializer);
  auto& metadata = serializer.getTypeMetadata();
  Type pointType = Type::from<Point>();

  kj::StringPtr onlyX[] = { "x" };
  kj::StringPtr onlyY[] = { "y" };
  Schema first = loadPoint(serializer, onlyX);
  Schema second = loadPoint(serializer, onlyY);

  // Subscribed before the formatters, so it hears of each change first.
  GateObserver gate(first);
  auto gateSubscription = metadata.subscribe(pointType, gate);

  auto& formatter = serializer.getFormatter<Shape>();
  auto& pointFormatter = serializer.getFormatter<Point>();

  {
    kj::Thread publisher([&]() {
      metadata.setCurrentSchema(pointType, first);
    });

    // The first change is stored, but its notification reaches the formatters only after the
    // second change has been fully published.
    gate.waitEntered();
    metadata.setCurrentSchema(pointType, second);
    gate.release();
  }

  KJ_EXPECT(metadata.getCurrentSchema(pointType) == second);
  KJ_EXPECT(pointFormatter.getActiveSchema() == second);
  KJ_EXPECT(pointFormatter.getSwitchCount() == 1);
  KJ_EXPECT(formatter.getSwitchCount() == 1);

  Shape shape;
  shape.origin.x = 5;
  shape.extent.x = 6;
  serializer.decode(bytes({
    0x01, 0x00, 0x00, 0x00, 'a',
    0x08, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x07, 0x00, 0x00, 0x00,
    0x08, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00
  }), shape);
  KJ_EXPECT(shape.origin.x == 5);
  KJ_EXPECT(shape.origin.y == 7);
  KJ_EXPECT(shape.extent.x == 6);
  KJ_EXPECT(shape.extent.y == 8);
}

KJ_TEST("procedures generated by racing threads are counted once") {
  Serializer serializer(tolerantConfig());
  test::describePoint(serializer);
  auto& formatter = serializer.getFormatter<Point>();

  kj::StringPtr names[] = { "y", "x" };
  Schema swapped = loadPoint(serializer, names);

  constexpr uint THREADS = 4;
  const ProcedurePairBase* results[THREADS] = {};
  {
    auto threads = kj::heapArrayBuilder<kj::Own<kj::Thread>>(THREADS);
    for (uint t = 0; t < THREADS; t++) {
      threads.add(kj::heap<kj::Thread>([&formatter, &results, swapped, t]() {
        results[t] = &formatter.getProceduresFor(swapped);
      }));
    }
  }

  for (auto result: results) {
    KJ_EXPECT(result == results[0]);
  }
  KJ_EXPECT(formatter.getGenerationCount() == 2);
  KJ_EXPECT(formatter.getActiveSchema().isPrimary());
}

struct MigrationHook {
  Serializer* serializer = nullptr;
  Schema schema;
  bool armed = false;
  uint depthSeen = 0;
};

void addTriggerProcedures(Serializer& serializer, MigrationHook& hook) {
  serializer.addProcedures<Trigger>(
      [](kj::Array<byte>& buffer, size_t& offset, const Trigger& value) {
        writeFixed<uint8_t>(buffer, offset, value.value);
      },
      [&hook](kj::ArrayPtr<const byte> buffer, size_t& offset, Trigger& value) {
        value.value = readFixed<uint8_t>(buffer, offset);
        if (hook.armed) {
          hook.armed = false;
          hook.depthSeen = hook.serializer->getFormatter<Tagged>().getDecodeDepth();
          hook.serializer->getTypeMetadata().setCurrentSchema(Type::from<Point>(), hook.schema);
        }
      });
}

KJ_TEST("schema changes are refused while a value of the type is being decoded") {
  Serializer serializer(tolerantConfig());
  test::describePoint(serializer);
  MigrationHook hook;
  hook.serializer = &serializer;
  addTriggerProcedures(serializer, hook);
  serializer.describe<Tagged>()
      .field("trigger", &Tagged::trigger)
      .field("origin", &Tagged::origin)
      .build();

  auto& formatter = serializer.getFormatter<Tagged>();
  auto encoded = serializer.encode(Tagged { { 5 }, { 1, 2 } });
  KJ_EXPECT(formatter.getDecodeDepth() == 0);

  kj::StringPtr names[] = { "x" };
  hook.schema = loadPoint(serializer, names);
  hook.armed = true;

  Tagged decoded;
  KJ_EXPECT_THROW_MESSAGE("unsafe schema migration while decoding",
      serializer.decode(encoded, decoded));
  KJ_EXPECT(hook.depthSeen == 1);
  KJ_EXPECT(formatter.getDecodeDepth() == 0);
  KJ_EXPECT(formatter.getGenerationCount() == 1);

  // The same change goes through once no decode is in progress.
  serializer.getTypeMetadata().setCurrentSchema(Type::from<Point>(), hook.schema);
  KJ_EXPECT(formatter.getGenerationCount() == 2);
  KJ_EXPECT(serializer.getFormatter<Point>().getActiveSchema() == hook.schema);

  Tagged migrated;
  migrated.origin.y = 3;
  serializer.decode(bytes({
    0x01, 0x00, 0x00, 0x00, 0x06,
    0x08, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, 0x0b, 0x00, 0x00, 0x00
  }), migrated);
  KJ_EXPECT(migrated.trigger.value == 6);
  KJ_EXPECT(migrated.origin.x == 11);
  KJ_EXPECT(migrated.origin.y == 3);
}

}  // namespace
}  // namespace evo
