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

#include "schema.h"
#include <kj/debug.h>
#include <kj/vector.h>

namespace evo {

namespace _ {  // private

const RawSchema NULL_SCHEMA = { Type(), false, nullptr, 0 };

}  // namespace _ (private)

MemberAccessorBase::~MemberAccessorBase() noexcept(false) {}

SchemaMember::SchemaMember(kj::String name, Type type, const MemberAccessorBase* accessor)
    : name(kj::mv(name)), type(type), accessor(accessor) {}

const MemberAccessorBase& SchemaMember::getAccessor() const {
  KJ_REQUIRE(accessor != nullptr, "skip members have no accessor", name);
  return *accessor;
}

bool SchemaMember::operator==(const SchemaMember& other) const {
  return name == other.name && type == other.type && isSkip() == other.isSkip();
}

bool Schema::operator==(const Schema& other) const {
  if (raw == other.raw) return true;
  if (raw->hash != other.raw->hash || raw->owner != other.raw->owner) return false;

  auto a = getMembers();
  auto b = other.getMembers();
  if (a.size() != b.size()) return false;
  for (auto i: kj::indices(a)) {
    if (a[i] != b[i]) return false;
  }
  return true;
}

kj::String KJ_STRINGIFY(const Schema& schema) {
  kj::Vector<kj::String> parts(schema.size());
  for (auto& member: schema.getMembers()) {
    if (member.isSkip()) {
      parts.add(kj::str(member.getName(), ": skip"));
    } else {
      parts.add(kj::str(member.getName(), ": ", member.getType()));
    }
  }
  return kj::str(schema.getOwnerType(), schema.isPrimary() ? " (primary) {" : " (historical) {",
                 kj::strArray(parts, ", "), "}");
}

// =======================================================================================

SchemaComplex::SchemaComplex(Schema root, kj::Array<Schema> inlined)
    : root(root), inlined(kj::mv(inlined)) {}

SchemaComplex SchemaComplex::clone() const {
  return SchemaComplex(root, kj::heapArray<Schema>(inlined.asPtr()));
}

bool SchemaComplex::operator==(const SchemaComplex& other) const {
  if (root != other.root || inlined.size() != other.inlined.size()) return false;
  for (auto i: kj::indices(inlined)) {
    if (inlined[i] != other.inlined[i]) return false;
  }
  return true;
}

uint SchemaComplex::hashCode() const {
  uint hash = root.hashCode();
  for (auto& schema: inlined) {
    hash = kj::hashCode(hash, schema.hashCode());
  }
  return hash;
}

kj::String KJ_STRINGIFY(const SchemaComplex& complex) {
  if (complex.getInlined().size() == 0) {
    return kj::str(complex.getRoot());
  }
  return kj::str(complex.getRoot(), " inlining [", kj::strArray(complex.getInlined(), ", "), "]");
}

}  // namespace evo
