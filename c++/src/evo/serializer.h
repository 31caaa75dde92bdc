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

#include "config.h"
#include "formatter-registry.h"
#include "schema-database.h"
#include "schema-formatter.h"
#include "type-metadata.h"
#include <kj/map.h>
#include <kj/mutex.h>

EVO_BEGIN_HEADER

namespace evo {

class Serializer final: public FormatterResolver {
  // Owns the schema database, type metadata and procedure registry, and one SchemaFormatter per
  // described type, created on first use.
  //
  //     Serializer serializer;
  //     serializer.describe<Point>().field("x", &Point::x).field("y", &Point::y).build();
  //     kj::Array<byte> bytes = serializer.encode(Point { 1, 2 });
  //
  // Describe a type before anything that contains it is encoded or decoded.  Encoding, decoding
  // and publishing schema changes are thread-safe.

public:
  explicit Serializer(SerializerConfig config = SerializerConfig());
  ~Serializer() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(Serializer);

  template <typename T>
  TypeDescription<T> describe();

  template <typename T>
  void addProcedures(EncodeProc<T> encode, DecodeProc<T> decode) {
    registry.add<T>(kj::mv(encode), kj::mv(decode));
  }
  // Registers procedures for a primitive type that has no built-in ones.

  template <typename T>
  SchemaFormatter<T>& getFormatter();

  template <typename T>
  kj::Array<byte> encode(const T& value);

  template <typename T>
  void decode(kj::ArrayPtr<const byte> bytes, T& value);
  // `bytes` must contain exactly one encoded value.

  inline const SerializerConfig& getConfig() const { return config; }
  inline SchemaDatabase& getSchemaDatabase() { return database; }
  inline TypeMetadataService& getTypeMetadata() { return metadata; }

  const ProcedurePairBase& resolveBase(Type type) override;
  // Value types resolve to the procedures of their current schema, inlined into the caller.
  // Reference types resolve to procedures that go through the type's formatter on every call,
  // so they always use whatever procedures that formatter has active.

  const ProcedurePairBase& resolveSchemaBase(Schema schema) override;

private:
  typedef kj::ConstFunction<kj::Own<SchemaFormatterBase>()> FormatterFactory;

  struct FormatterSlot {
    FormatterFactory factory;
    kj::Maybe<kj::Own<ProcedurePairBase>> forwarding;
    // Set for reference types.
    kj::Maybe<kj::Own<SchemaFormatterBase>> formatter;
  };

  SerializerConfig config;
  SchemaDatabase database;
  TypeMetadataService metadata;
  FormatterRegistry registry;
  kj::MutexGuarded<kj::HashMap<Type, kj::Own<FormatterSlot>>> formatters;

  void addFormatterFactory(Type type, FormatterFactory factory,
                           kj::Maybe<kj::Own<ProcedurePairBase>> forwarding);
  SchemaFormatterBase& getFormatterBase(Type type);
};

// =======================================================================================
// inline implementation details

template <typename T>
TypeDescription<T> Serializer::describe() {
  kj::Maybe<kj::Own<ProcedurePairBase>> forwarding;
  if (Type::from<T>().getKind() == Kind::REFERENCE) {
    Serializer* self = this;
    kj::Own<ProcedurePairBase> pair = kj::heap<ProcedurePair<T>>(
        [self](kj::Array<byte>& buffer, size_t& offset, const T& value) {
      self->getFormatter<T>().encode(buffer, offset, value);
    }, [self](kj::ArrayPtr<const byte> buffer, size_t& offset, T& value) {
      self->getFormatter<T>().decode(buffer, offset, value);
    });
    forwarding = kj::mv(pair);
  }

  addFormatterFactory(Type::from<T>(), [this]() -> kj::Own<SchemaFormatterBase> {
    return kj::heap<SchemaFormatter<T>>(*this, metadata, config);
  }, kj::mv(forwarding));
  return database.describe<T>();
}

template <typename T>
SchemaFormatter<T>& Serializer::getFormatter() {
  return kj::downcast<SchemaFormatter<T>>(getFormatterBase(Type::from<T>()));
}

template <typename T>
kj::Array<byte> Serializer::encode(const T& value) {
  auto buffer = kj::heapArray<byte>(config.initialBufferSize);
  size_t offset = 0;
  getFormatter<T>().encode(buffer, offset, value);
  return kj::heapArray<byte>(buffer.slice(0, offset));
}

template <typename T>
void Serializer::decode(kj::ArrayPtr<const byte> bytes, T& value) {
  size_t offset = 0;
  getFormatter<T>().decode(bytes, offset, value);
  KJ_REQUIRE(offset == bytes.size(), "trailing bytes after encoded value",
             Type::from<T>(), offset, bytes.size());
}

}  // namespace evo

EVO_END_HEADER
