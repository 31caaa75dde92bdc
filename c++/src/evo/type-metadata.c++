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
#include <kj/debug.h>

namespace evo {

SchemaSubscription::SchemaSubscription(
    TypeMetadataService& service, Type type, SchemaChangeObserver& observer)
    : service(service), type(type), observer(observer) {}

SchemaSubscription::~SchemaSubscription() noexcept(false) {
  service.unsubscribe(type, observer);
}

// =======================================================================================

TypeMetadataService::TypeMetadataService(SchemaDatabase& database): database(database) {}
TypeMetadataService::~TypeMetadataService() noexcept(false) {}

TypeMetadataService::Entry& TypeMetadataService::getEntry(
    kj::HashMap<Type, Entry>& map, Type type) {
  return map.findOrCreate(type, [&]() -> kj::HashMap<Type, Entry>::Entry {
    return { type, Entry { database.getOrCreatePrimarySchema(type), {} } };
  });
}

Schema TypeMetadataService::getOrCreatePrimarySchema(Type type) {
  return database.getOrCreatePrimarySchema(type);
}

Schema TypeMetadataService::getCurrentSchema(Type type) {
  auto lock = entries.lockExclusive();
  return getEntry(*lock, type).currentSchema;
}

TypeMetadata TypeMetadataService::getMetadata(Type type) {
  auto lock = entries.lockExclusive();
  return TypeMetadata(type, database.getOrCreatePrimarySchema(type),
                      getEntry(*lock, type).currentSchema);
}

kj::Own<SchemaSubscription> TypeMetadataService::subscribe(
    Type type, SchemaChangeObserver& observer) {
  {
    auto lock = entries.lockExclusive();
    getEntry(*lock, type).observers.add(&observer);
  }
  return kj::heap<SchemaSubscription>(*this, type, observer);
}

void TypeMetadataService::unsubscribe(Type type, SchemaChangeObserver& observer) {
  auto lock = entries.lockExclusive();
  KJ_IF_SOME(entry, lock->find(type)) {
    auto& observers = entry.observers;
    for (auto i: kj::indices(observers)) {
      if (observers[i] == &observer) {
        // Keep subscription order for the remaining observers.
        for (auto j = i + 1; j < observers.size(); j++) {
          observers[j - 1] = observers[j];
        }
        observers.removeLast();
        return;
      }
    }
  }
  KJ_LOG(ERROR, "unsubscribing an observer that was not subscribed", type);
}

void TypeMetadataService::setCurrentSchema(Type type, Schema schema) {
  KJ_REQUIRE(schema.getOwnerType() == type, "schema belongs to a different type", type, schema);

  Schema primary = database.getOrCreatePrimarySchema(type);
  kj::Array<SchemaChangeObserver*> observers;
  {
    auto lock = entries.lockExclusive();
    auto& entry = getEntry(*lock, type);
    entry.currentSchema = schema;
    observers = kj::heapArray<SchemaChangeObserver*>(entry.observers.asPtr());
  }

  KJ_LOG(INFO, "schema changed", type, schema, observers.size());

  TypeMetadata metadata(type, primary, schema);
  for (auto observer: observers) {
    observer->onSchemaChanged(metadata);
  }
}

}  // namespace evo
