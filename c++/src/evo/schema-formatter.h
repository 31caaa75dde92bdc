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
#include "procedure-generator.h"
#include "reentrancy.h"
#include "type-metadata.h"
#include <kj/map.h>
#include <kj/mutex.h>
#include <kj/vector.h>

EVO_BEGIN_HEADER

namespace evo {

class SchemaFormatterBase {
public:
  virtual ~SchemaFormatterBase() noexcept(false);

  virtual Type getType() const = 0;

  virtual const ProcedurePairBase& getCurrentProcedures() = 0;
  // Procedures for the type's current schema as published by the TypeMetadataService (or its
  // primary schema if version tolerance is disabled), built on demand.  Does not change which
  // procedures the formatter itself uses.

  virtual const ProcedurePairBase& getProceduresFor(Schema schema) = 0;
  // Procedures for `schema`, which must belong to this type, built on demand.  Containing types
  // inline these into their own procedures.
};

void checkSupported(Type type, const SerializerConfig& config);
// Throws if no schema formatter may be built for `type`.

kj::Array<Type> findInlinedTypes(Schema primarySchema);
// The distinct value types among the members of `primarySchema`.

namespace _ {  // private

class PinnedResolver final: public FormatterResolver {
  // Resolves each value type that has a schema in `pinned` to the procedures of that schema, and
  // everything else through `inner`.  Used while generating the procedures of one schema complex,
  // so that they inline exactly the member schemas the complex names.

public:
  inline PinnedResolver(FormatterResolver& inner, kj::ArrayPtr<const Schema> pinned)
      : inner(inner), pinned(pinned) {}

  const ProcedurePairBase& resolveBase(Type type) override;
  const ProcedurePairBase& resolveSchemaBase(Schema schema) override;

private:
  FormatterResolver& inner;
  kj::ArrayPtr<const Schema> pinned;
};

}  // namespace _ (private)

template <typename T>
class SchemaFormatter final: public SchemaFormatterBase, private SchemaChangeObserver {
  // Encodes and decodes T according to its active schema, using procedures generated for that
  // schema.  Procedures are cached per schema complex (T's schema plus the schemas of the value
  // types inlined into it) and are never discarded, so switching back to a schema seen before
  // costs a lookup.
  //
  // If version tolerance is enabled, the formatter subscribes to schema changes of T and of every
  // value type in T's primary schema, and activates the matching procedures when one is
  // published.  Such a change is refused with an exception while the calling thread is inside
  // decode() of this formatter:  procedures of the decode in progress have the old member
  // procedures built in.
  //
  // encode() and decode() may be called concurrently from any thread.  A call keeps using the
  // procedures that were active when it started.  Activations are serialized per formatter, and
  // a change notification activates whatever the metadata holds once it gets its turn, so the
  // formatter ends up on the latest published schemas however the notifications interleave.

public:
  SchemaFormatter(FormatterResolver& resolver, TypeMetadataService& metadata,
                  const SerializerConfig& config);
  KJ_DISALLOW_COPY_AND_MOVE(SchemaFormatter);

  void encode(kj::Array<byte>& buffer, size_t& offset, const T& value) const;
  // Throws if the active schema is not primary.

  void decode(kj::ArrayPtr<const byte> buffer, size_t& offset, T& value) const;
  // Fields not present in the active schema keep their previous values.

  void activate(Schema schema);
  // Makes `schema` the active schema.  No-op if it already is.

  Schema getActiveSchema() const;

  uint getGenerationCount() const;
  // Number of times procedures were generated.  Empty schemas don't count.

  uint getSwitchCount() const;
  // Number of times the active procedures were replaced by others.

  uint getDecodeDepth() const;
  // Number of decode() calls of this formatter in progress on the calling thread.

  Type getType() const override { return Type::from<T>(); }
  const ProcedurePairBase& getCurrentProcedures() override;
  const ProcedurePairBase& getProceduresFor(Schema schema) override;

private:
  typedef kj::HashMap<SchemaComplex, kj::Own<ProcedurePair<T>>> Cache;

  struct State {
    SchemaComplex activeKey;
    const ProcedurePair<T>* active = nullptr;
    Cache cache;
    uint generationCount = 0;
  };

  FormatterResolver& resolver;
  TypeMetadataService& metadata;
  VersionTolerance versionTolerance;
  Schema primarySchema;
  kj::Array<Type> inlinedTypes;
  kj::MutexGuarded<State> state;

  kj::MutexGuarded<uint> activation;
  // Held for the whole of an activation.  Counts switches.

  kj::Vector<kj::Own<SchemaSubscription>> subscriptions;
  // Declared last so that it is destroyed first.

  Schema getCurrentSchema(Type type);
  SchemaComplex makeComplex(Schema root);
  void activateLocked(uint& switches, Schema root);
  const ProcedurePair<T>& getProcedures(const SchemaComplex& key);
  kj::Own<ProcedurePair<T>> generate(const SchemaComplex& key);
  const ProcedurePair<T>& getActive() const;

  void onSchemaChanged(const TypeMetadata& changed) override;
};

// =======================================================================================
// inline implementation details

template <typename T>
SchemaFormatter<T>::SchemaFormatter(
    FormatterResolver& resolver, TypeMetadataService& metadata, const SerializerConfig& config)
    : resolver(resolver), metadata(metadata), versionTolerance(config.versionTolerance) {
  Type type = Type::from<T>();
  checkSupported(type, config);

  primarySchema = metadata.getOrCreatePrimarySchema(type);
  inlinedTypes = findInlinedTypes(primarySchema);
  activate(primarySchema);

  if (versionTolerance == VersionTolerance::DISABLED) return;

  subscriptions.add(metadata.subscribe(type, *this));
  for (auto inlined: inlinedTypes) {
    subscriptions.add(metadata.subscribe(inlined, *this));
  }

  // A historical schema may have been published before this formatter existed.
  Schema current = metadata.getCurrentSchema(type);
  if (current != primarySchema) {
    activate(current);
  }
}

template <typename T>
void SchemaFormatter<T>::encode(kj::Array<byte>& buffer, size_t& offset, const T& value) const {
  getActive().encode(buffer, offset, value);
}

template <typename T>
void SchemaFormatter<T>::decode(
    kj::ArrayPtr<const byte> buffer, size_t& offset, T& value) const {
  ReentrancyGuard guard(this);
  getActive().decode(buffer, offset, value);
}

template <typename T>
void SchemaFormatter<T>::activate(Schema schema) {
  KJ_REQUIRE(schema.getOwnerType() == getType(), "schema belongs to a different type",
             getType(), schema);
  auto lock = activation.lockExclusive();
  activateLocked(*lock, schema);
}

template <typename T>
Schema SchemaFormatter<T>::getActiveSchema() const {
  return state.lockShared()->activeKey.getRoot();
}

template <typename T>
uint SchemaFormatter<T>::getGenerationCount() const {
  return state.lockShared()->generationCount;
}

template <typename T>
uint SchemaFormatter<T>::getSwitchCount() const {
  return *activation.lockShared();
}

template <typename T>
uint SchemaFormatter<T>::getDecodeDepth() const {
  return ReentrancyGuard::depth(this);
}

template <typename T>
const ProcedurePairBase& SchemaFormatter<T>::getCurrentProcedures() {
  return getProcedures(makeComplex(getCurrentSchema(getType())));
}

template <typename T>
const ProcedurePairBase& SchemaFormatter<T>::getProceduresFor(Schema schema) {
  KJ_REQUIRE(schema.getOwnerType() == getType(), "schema belongs to a different type",
             getType(), schema);
  return getProcedures(makeComplex(schema));
}

template <typename T>
Schema SchemaFormatter<T>::getCurrentSchema(Type type) {
  if (versionTolerance == VersionTolerance::DISABLED) {
    return metadata.getOrCreatePrimarySchema(type);
  } else {
    return metadata.getCurrentSchema(type);
  }
}

template <typename T>
SchemaComplex SchemaFormatter<T>::makeComplex(Schema root) {
  auto builder = kj::heapArrayBuilder<Schema>(inlinedTypes.size());
  for (auto inlined: inlinedTypes) {
    builder.add(getCurrentSchema(inlined));
  }
  return SchemaComplex(root, builder.finish());
}

template <typename T>
void SchemaFormatter<T>::activateLocked(uint& switches, Schema root) {
  SchemaComplex key = makeComplex(root);
  {
    auto lock = state.lockShared();
    if (lock->active != nullptr && lock->activeKey == key) return;

    if (ReentrancyGuard::depth(this) > 0) {
      KJ_LOG(WARNING, "refusing to switch procedures of a type that is being decoded",
             getType(), lock->activeKey, key);
      KJ_FAIL_REQUIRE("unsafe schema migration while decoding; the schema of this type or of a "
                      "value type inlined into it changed while one of its values was being "
                      "decoded on this thread", getType(), lock->activeKey, key);
    }
  }

  const ProcedurePair<T>& procedures = getProcedures(key);

  auto lock = state.lockExclusive();
  if (lock->active != nullptr) {
    KJ_LOG(INFO, "switching active schema", getType(), lock->activeKey, key);
    ++switches;
  }
  lock->activeKey = kj::mv(key);
  lock->active = &procedures;
}

template <typename T>
const ProcedurePair<T>& SchemaFormatter<T>::getProcedures(const SchemaComplex& key) {
  {
    auto lock = state.lockShared();
    KJ_IF_SOME(procedures, lock->cache.find(key)) {
      return *procedures;
    }
  }

  // Generate without holding the lock:  resolving member procedures may build procedures of
  // other formatters.
  auto generated = generate(key);

  auto lock = state.lockExclusive();
  auto& procedures = lock->cache.findOrCreate(key, [&]() -> typename Cache::Entry {
    // Not counted if another thread inserted the same complex first.
    if (!key.getRoot().empty()) {
      ++lock->generationCount;
    }
    return { key.clone(), kj::mv(generated) };
  });
  return *procedures;
}

template <typename T>
kj::Own<ProcedurePair<T>> SchemaFormatter<T>::generate(const SchemaComplex& key) {
  Schema schema = key.getRoot();
  if (schema.empty()) {
    return newEmptyProcedures<T>(schema);
  }

  KJ_LOG(INFO, "generating procedures", key);

  // Value members come from the schemas in the key, never from the metadata, which may have
  // moved on since the key was made.
  _::PinnedResolver pinned(resolver, key.getInlined());
  EncodeProc<T> encoder = schema.isPrimary()
      ? generateEncoder<T>(schema, pinned)
      : newRefusingEncoder<T>(schema);
  DecodeProc<T> decoder = generateDecoder<T>(schema, pinned);
  return kj::heap<ProcedurePair<T>>(kj::mv(encoder), kj::mv(decoder));
}

template <typename T>
const ProcedurePair<T>& SchemaFormatter<T>::getActive() const {
  auto lock = state.lockShared();
  KJ_ASSERT(lock->active != nullptr, "formatter has no active procedures", getType());
  // Cached procedures are never destroyed before the formatter, so the reference outlives the
  // lock.
  return *lock->active;
}

template <typename T>
void SchemaFormatter<T>::onSchemaChanged(const TypeMetadata& changed) {
  auto lock = activation.lockExclusive();

  // Notifications of concurrent publishers may arrive in any order, so the schema carried by
  // `changed` may already be stale.  Read the metadata again now that no other activation runs.
  if (changed.getType() == getType()) {
    activateLocked(*lock, getCurrentSchema(getType()));
  } else {
    // A value type inlined into T changed.  Rebuild around T's own active schema.
    activateLocked(*lock, getActiveSchema());
  }
}

}  // namespace evo

EVO_END_HEADER
