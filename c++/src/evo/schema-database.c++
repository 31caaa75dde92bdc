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
#include <kj/debug.h>

namespace evo {

namespace {

uint hashMembers(Type owner, kj::ArrayPtr<const SchemaMember> members) {
  uint hash = owner.hashCode();
  for (auto& member: members) {
    hash = kj::hashCode(hash, member.getName(), member.getType(), uint(member.isSkip()));
  }
  return hash;
}

kj::Own<_::RawSchema> newRawSchema(Type owner, bool isPrimary, kj::Array<SchemaMember> members) {
  uint hash = hashMembers(owner, members);
  return kj::heap<_::RawSchema>(_::RawSchema { owner, isPrimary, kj::mv(members), hash });
}

}  // namespace

SchemaDatabase::SchemaDatabase() {}
SchemaDatabase::~SchemaDatabase() noexcept(false) {}

bool SchemaDatabase::isDescribed(Type type) const {
  return types.lockShared()->find(type) != kj::none;
}

void SchemaDatabase::addDescription(Type type, kj::Array<MemberDescription> members) {
  KJ_REQUIRE(type.getKind() != Kind::PRIMITIVE,
             "primitive types are encoded by dedicated formatters and cannot be described", type);

  for (auto i: kj::indices(members)) {
    KJ_ASSERT(members[i].accessor->getOwnerType() == type);
    for (auto j: kj::zeroTo(i)) {
      KJ_REQUIRE(members[i].name != members[j].name,
                 "duplicate member name in type description", type, members[i].name);
    }
  }

  auto lock = types.lockExclusive();
  KJ_REQUIRE(lock->find(type) == kj::none, "type was already described", type);

  auto entry = kj::heap<TypeEntry>();
  entry->members = kj::mv(members);
  lock->insert(type, kj::mv(entry));
}

Schema SchemaDatabase::getOrCreatePrimarySchema(Type type) const {
  auto lock = types.lockExclusive();
  KJ_IF_SOME(entry, lock->find(type)) {
    return getOrCreatePrimary(type, *entry);
  }
  KJ_FAIL_REQUIRE("type has no description; describe it before using it", type);
}

Schema SchemaDatabase::getOrCreatePrimary(Type type, TypeEntry& entry) {
  KJ_IF_SOME(primary, entry.primary) {
    return Schema(primary.get());
  }

  auto builder = kj::heapArrayBuilder<SchemaMember>(entry.members.size());
  for (auto& member: entry.members) {
    builder.add(kj::heapString(member.name), member.accessor->getFieldType(),
                member.accessor.get());
  }

  auto raw = newRawSchema(type, true, builder.finish());
  Schema result(raw.get());
  entry.primary = kj::mv(raw);
  return result;
}

Schema SchemaDatabase::loadHistorical(
    Type type, kj::ArrayPtr<const kj::StringPtr> memberNames) const {
  auto lock = types.lockExclusive();
  auto& entry = *KJ_REQUIRE_NONNULL(lock->find(type),
      "type has no description; describe it before loading its historical schemas", type);
  Schema primary = getOrCreatePrimary(type, entry);

  auto builder = kj::heapArrayBuilder<SchemaMember>(memberNames.size());
  for (auto i: kj::indices(memberNames)) {
    auto name = memberNames[i];
    for (auto j: kj::zeroTo(i)) {
      KJ_REQUIRE(memberNames[j] != name, "duplicate member name in historical schema", type, name);
    }

    const SchemaMember* match = nullptr;
    for (auto& member: primary.getMembers()) {
      if (member.getName() == name) {
        match = &member;
        break;
      }
    }

    if (match == nullptr) {
      builder.add(kj::heapString(name), Type(), nullptr);
    } else {
      builder.add(kj::heapString(name), match->getType(), &match->getAccessor());
    }
  }

  auto raw = newRawSchema(type, false, builder.finish());
  Schema candidate(raw.get());

  if (candidate == primary) {
    return primary;
  }
  for (auto& existing: entry.historical) {
    if (candidate == Schema(existing.get())) {
      return Schema(existing.get());
    }
  }

  entry.historical.add(kj::mv(raw));
  KJ_LOG(INFO, "loaded historical schema", candidate);
  return candidate;
}

}  // namespace evo
