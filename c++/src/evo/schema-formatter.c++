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
#include <kj/debug.h>

namespace evo {

SchemaFormatterBase::~SchemaFormatterBase() noexcept(false) {}

void checkSupported(Type type, const SerializerConfig& config) {
  KJ_REQUIRE(!type.isUnknown(), "type is not supported by the schema formatter; it is unknown");
  KJ_REQUIRE(type.getKind() != Kind::PRIMITIVE,
             "type is not supported by the schema formatter; primitive types are encoded by "
             "dedicated formatters", type);
  for (auto banned: config.bannedTypes) {
    KJ_REQUIRE(banned != type,
               "type is not supported by the schema formatter; it is banned by the serializer "
               "configuration", type);
  }
}

kj::Array<Type> findInlinedTypes(Schema primarySchema) {
  kj::Vector<Type> result;
  for (auto& member: primarySchema.getMembers()) {
    Type type = member.getType();
    if (type.getKind() != Kind::VALUE) continue;

    bool seen = false;
    for (auto other: result) {
      if (other == type) {
        seen = true;
        break;
      }
    }
    if (!seen) result.add(type);
  }
  return result.releaseAsArray();
}

namespace _ {  // private

const ProcedurePairBase& PinnedResolver::resolveBase(Type type) {
  for (auto schema: pinned) {
    if (schema.getOwnerType() == type) {
      return inner.resolveSchemaBase(schema);
    }
  }
  return inner.resolveBase(type);
}

const ProcedurePairBase& PinnedResolver::resolveSchemaBase(Schema schema) {
  return inner.resolveSchemaBase(schema);
}

}  // namespace _ (private)

}  // namespace evo
