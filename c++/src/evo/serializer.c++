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
#include <kj/debug.h>

namespace evo {

Serializer::Serializer(SerializerConfig config)
    : config(kj::mv(config)), metadata(database) {}

Serializer::~Serializer() noexcept(false) {}

void Serializer::addFormatterFactory(Type type, FormatterFactory factory,
                                     kj::Maybe<kj::Own<ProcedurePairBase>> forwarding) {
  auto lock = formatters.lockExclusive();
  KJ_REQUIRE(lock->find(type) == kj::none, "type was already described", type);
  lock->insert(type, kj::heap<FormatterSlot>(
      FormatterSlot { kj::mv(factory), kj::mv(forwarding), kj::none }));
}

SchemaFormatterBase& Serializer::getFormatterBase(Type type) {
  FormatterSlot* slot;
  {
    auto lock = formatters.lockExclusive();
    auto& found = KJ_REQUIRE_NONNULL(lock->find(type),
        "type has no description; describe it with Serializer::describe() first", type);
    KJ_IF_SOME(formatter, found->formatter) {
      return *formatter;
    }
    slot = found.get();
  }

  // Build without holding the lock:  the new formatter resolves the procedures of its members,
  // which may create their formatters.  Slots are never removed, so `slot` stays valid.
  auto formatter = slot->factory();

  auto lock = formatters.lockExclusive();
  KJ_IF_SOME(existing, slot->formatter) {
    // Another thread got there first.
    return *existing;
  }
  SchemaFormatterBase& result = *formatter;
  slot->formatter = kj::mv(formatter);
  return result;
}

const ProcedurePairBase& Serializer::resolveBase(Type type) {
  KJ_IF_SOME(procedures, registry.find(type)) {
    return procedures;
  }
  KJ_REQUIRE(type.getKind() != Kind::PRIMITIVE, "no procedures registered for primitive type",
             type);

  if (type.getKind() == Kind::REFERENCE) {
    auto lock = formatters.lockShared();
    auto& slot = KJ_REQUIRE_NONNULL(lock->find(type),
        "type has no description; describe it with Serializer::describe() first", type);
    // Slots are never removed, so the pair outlives the lock.
    return *KJ_ASSERT_NONNULL(slot->forwarding);
  }

  return getFormatterBase(type).getCurrentProcedures();
}

const ProcedurePairBase& Serializer::resolveSchemaBase(Schema schema) {
  Type type = schema.getOwnerType();
  KJ_REQUIRE(type.getKind() == Kind::VALUE, "only value types are bound to a schema", type);
  return getFormatterBase(type).getProceduresFor(schema);
}

}  // namespace evo
