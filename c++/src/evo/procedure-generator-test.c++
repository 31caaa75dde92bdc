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

#include "procedure-generator.h"
#include "formatter-registry.h"
#include "schema-database.h"
#include "test-util.h"
#include <kj/test.h>

namespace evo {
namespace {

using test::Flags;
using test::Record;
using test::Triple;
using test::bytes;

class PrimitiveResolver final: public FormatterResolver {
public:
  const ProcedurePairBase& resolveBase(Type type) override {
    return KJ_REQUIRE_NONNULL(registry.find(type), "no procedures", type);
  }

  const ProcedurePairBase& resolveSchemaBase(Schema schema) override {
    KJ_FAIL_REQUIRE("no value members expected", schema);
  }

private:
  FormatterRegistry registry;
};

class GeneratorFixture {
public:
  GeneratorFixture() {
    database.describe<Record>()
        .field("id", &Record::id)
        .field("name", &Record::name)
        .build();
    database.describe<Flags>()
        .field("enabled", &Flags::enabled)
        .field("ratio", &Flags::ratio)
        .field("mask", &Flags::mask)
        .build();
    database.describe<Triple>()
        .field("first", &Triple::first)
        .field("second", &Triple::second)
        .field("third", &Triple::third)
        .build();
  }

  Schema primary() { return database.getOrCreatePrimarySchema(Type::from<Record>()); }

  Schema historical(kj::ArrayPtr<const kj::StringPtr> names) {
    return database.loadHistorical(Type::from<Record>(), names);
  }

  kj::Array<byte> encode(const Record& record) {
    auto encoder = generateEncoder<Record>(primary(), resolver);
    auto buffer = kj::heapArray<byte>(1);
    size_t offset = 0;
    encoder(buffer, offset, record);
    return kj::heapArray<byte>(buffer.slice(0, offset));
  }

  void decode(Schema schema, kj::ArrayPtr<const byte> input, Record& record) {
    auto decoder = generateDecoder<Record>(schema, resolver);
    size_t offset = 0;
    decoder(input, offset, record);
    KJ_EXPECT(offset == input.size());
  }

  SchemaDatabase database;
  PrimitiveResolver resolver;
};

KJ_TEST("fields are framed by their payload size") {
  GeneratorFixture fixture;

  auto encoded = fixture.encode(Record { 7, kj::str("ok") });
  auto expected = bytes({
    0x04, 0x00, 0x00, 0x00, 0x07, 0x00, 0x00, 0x00,
    0x02, 0x00, 0x00, 0x00, 0x6f, 0x6b
  });
  KJ_EXPECT((encoded.asPtr() == expected.asPtr()), "unexpected encoding");

  Record decoded;
  fixture.decode(fixture.primary(), encoded, decoded);
  KJ_EXPECT(decoded.id == 7);
  KJ_EXPECT(decoded.name == "ok");
}

KJ_TEST("empty string payload still has a frame") {
  GeneratorFixture fixture;

  auto encoded = fixture.encode(Record { -1, kj::str() });
  auto expected = bytes({
    0x04, 0x00, 0x00, 0x00, 0xff, 0xff, 0xff, 0xff,
    0x00, 0x00, 0x00, 0x00
  });
  KJ_EXPECT((encoded.asPtr() == expected.asPtr()), "unexpected encoding");

  Record decoded { 3, kj::str("previous") };
  fixture.decode(fixture.primary(), encoded, decoded);
  KJ_EXPECT(decoded.id == -1);
  KJ_EXPECT(decoded.name == "");
}

KJ_TEST("skip members are stepped over and leave fields untouched") {
  GeneratorFixture fixture;
  auto encoded = fixture.encode(Record { 7, kj::str("ok") });

  kj::StringPtr skipSecond[] = { "id", "title" };
  Record decoded { 1, kj::str("kept") };
  fixture.decode(fixture.historical(skipSecond), encoded, decoded);
  KJ_EXPECT(decoded.id == 7);
  KJ_EXPECT(decoded.name == "kept");

  kj::StringPtr skipFirst[] = { "number", "name" };
  Record other { 5, kj::str("old") };
  fixture.decode(fixture.historical(skipFirst), encoded, other);
  KJ_EXPECT(other.id == 5);
  KJ_EXPECT(other.name == "ok");
}

KJ_TEST("a skipped middle field leaves its neighbours intact") {
  GeneratorFixture fixture;
  Type type = Type::from<Triple>();
  kj::StringPtr names[] = { "first", "legacy", "third" };
  Schema historical = fixture.database.loadHistorical(type, names);
  auto decoder = generateDecoder<Triple>(historical, fixture.resolver);

  {
    // Garbage of odd length in the middle.
    auto input = bytes({
      0x04, 0x00, 0x00, 0x00, 0x2a, 0x00, 0x00, 0x00,
      0x09, 0x00, 0x00, 0x00, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
      0x08, 0x00, 0x00, 0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08
    });
    Triple triple { 0, kj::str("kept"), 0 };
    size_t offset = 0;
    decoder(input, offset, triple);
    KJ_EXPECT(offset == input.size());
    KJ_EXPECT(triple.first == 42);
    KJ_EXPECT(triple.second == "kept");
    KJ_EXPECT(triple.third == 0x0807060504030201ll);
  }

  {
    // Empty middle frame.
    auto input = bytes({
      0x04, 0x00, 0x00, 0x00, 0xff, 0xff, 0xff, 0xff,
      0x00, 0x00, 0x00, 0x00,
      0x08, 0x00, 0x00, 0x00, 0xfe, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff
    });
    Triple triple { 0, kj::str("kept"), 0 };
    size_t offset = 0;
    decoder(input, offset, triple);
    KJ_EXPECT(offset == input.size());
    KJ_EXPECT(triple.first == -1);
    KJ_EXPECT(triple.second == "kept");
    KJ_EXPECT(triple.third == -2);
  }

  {
    // Written with the primary schema, where the middle field is a string.
    auto encoder = generateEncoder<Triple>(
        fixture.database.getOrCreatePrimarySchema(type), fixture.resolver);
    auto buffer = kj::heapArray<byte>(0);
    size_t end = 0;
    encoder(buffer, end, Triple { 7, kj::str("hello"), -9 });

    Triple triple { 0, kj::str("kept"), 0 };
    size_t offset = 0;
    decoder(buffer.slice(0, end), offset, triple);
    KJ_EXPECT(offset == end);
    KJ_EXPECT(triple.first == 7);
    KJ_EXPECT(triple.second == "kept");
    KJ_EXPECT(triple.third == -9);
  }

  {
    // Middle frame claims more than remains.
    auto input = bytes({
      0x04, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
      0x20, 0x00, 0x00, 0x00, 0xff, 0xff
    });
    Triple triple;
    size_t offset = 0;
    KJ_EXPECT_THROW_MESSAGE("truncated field frame", decoder(input, offset, triple));
  }
}

KJ_TEST("historical schema reads data written in another field order") {
  GeneratorFixture fixture;

  auto input = bytes({
    0x03, 0x00, 0x00, 0x00, 'a', 'b', 'c',
    0x04, 0x00, 0x00, 0x00, 0x2a, 0x00, 0x00, 0x00
  });

  kj::StringPtr names[] = { "name", "id" };
  Record decoded;
  fixture.decode(fixture.historical(names), input, decoded);
  KJ_EXPECT(decoded.id == 42);
  KJ_EXPECT(decoded.name == "abc");
}

KJ_TEST("malformed frames are rejected") {
  GeneratorFixture fixture;
  auto decoder = generateDecoder<Record>(fixture.primary(), fixture.resolver);
  Record record;

  {
    // Frame claims more bytes than remain.
    auto input = bytes({ 0x04, 0x00, 0x00, 0x00, 0x07, 0x00 });
    size_t offset = 0;
    KJ_EXPECT_THROW_MESSAGE("truncated field frame", decoder(input, offset, record));
  }

  {
    // Size prefix itself cut short.
    auto input = bytes({ 0x04, 0x00 });
    size_t offset = 0;
    KJ_EXPECT_THROW_MESSAGE("premature end of input", decoder(input, offset, record));
  }

  {
    // Frame larger than the int32 inside it.
    auto input = bytes({
      0x05, 0x00, 0x00, 0x00, 0x07, 0x00, 0x00, 0x00, 0x00,
      0x00, 0x00, 0x00, 0x00
    });
    size_t offset = 0;
    KJ_EXPECT_THROW_MESSAGE("field payload length mismatch", decoder(input, offset, record));
  }

  {
    // Frame smaller than the int32 inside it.
    auto input = bytes({
      0x02, 0x00, 0x00, 0x00, 0x07, 0x00,
      0x00, 0x00, 0x00, 0x00
    });
    size_t offset = 0;
    KJ_EXPECT_THROW_MESSAGE("premature end of input", decoder(input, offset, record));
  }
}

KJ_TEST("primitive encodings") {
  GeneratorFixture fixture;
  Schema schema = fixture.database.getOrCreatePrimarySchema(Type::from<Flags>());
  auto encoder = generateEncoder<Flags>(schema, fixture.resolver);
  auto decoder = generateDecoder<Flags>(schema, fixture.resolver);

  auto buffer = kj::heapArray<byte>(0);
  size_t offset = 0;
  encoder(buffer, offset, Flags { true, 0.5, 0xbeef });
  KJ_EXPECT(offset == (4 + 1) + (4 + 8) + (4 + 2));
  KJ_EXPECT(buffer[4] == 1);
  KJ_EXPECT(buffer[offset - 2] == 0xef);
  KJ_EXPECT(buffer[offset - 1] == 0xbe);

  Flags decoded;
  size_t readOffset = 0;
  decoder(buffer.slice(0, offset), readOffset, decoded);
  KJ_EXPECT(readOffset == offset);
  KJ_EXPECT(decoded.enabled);
  KJ_EXPECT(decoded.ratio == 0.5);
  KJ_EXPECT(decoded.mask == 0xbeef);

  buffer[4] = 2;
  readOffset = 0;
  KJ_EXPECT_THROW_MESSAGE("invalid bool encoding",
      decoder(buffer.slice(0, offset), readOffset, decoded));
}

KJ_TEST("only primary schemas can be encoded") {
  GeneratorFixture fixture;
  kj::StringPtr names[] = { "id" };
  Schema historical = fixture.historical(names);

  KJ_EXPECT_THROW_MESSAGE("cannot encode using a non-primary schema",
      generateEncoder<Record>(historical, fixture.resolver));

  auto refusing = newRefusingEncoder<Record>(historical);
  auto buffer = kj::heapArray<byte>(0);
  size_t offset = 0;
  KJ_EXPECT_THROW_MESSAGE("cannot encode using a non-primary schema",
      refusing(buffer, offset, Record { 1, kj::str("x") }));
  KJ_EXPECT(offset == 0);
}

KJ_TEST("empty procedures do nothing") {
  SchemaDatabase database;
  database.describe<test::Nothing>().build();
  Schema primary = database.getOrCreatePrimarySchema(Type::from<test::Nothing>());

  auto procedures = newEmptyProcedures<test::Nothing>(primary);
  auto buffer = kj::heapArray<byte>(0);
  size_t offset = 0;
  procedures->encode(buffer, offset, test::Nothing());
  KJ_EXPECT(offset == 0);

  test::Nothing value;
  procedures->decode(nullptr, offset, value);
  KJ_EXPECT(offset == 0);

  GeneratorFixture fixture;
  KJ_EXPECT_THROW_MESSAGE("schema.empty()", newEmptyProcedures<Record>(fixture.primary()));
}

}  // namespace
}  // namespace evo
