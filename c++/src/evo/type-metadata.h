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

#include "schema-database.h"
#include <kj/map.h>
#include <kj/mutex.h>
#include <kj/vector.h>

EVO_BEGIN_HEADER

namespace evo {

class TypeMetadata {
  // What observers are told about a type whose current schema changed.

public:
  inline TypeMetadata(Type type, Schema primarySchema, Schema currentSchema)
      : type(type), primarySchema(primarySchema), currentSchema(currentSchema) {}

  inline Type getType() const { return type; }
  inline Schema getPrimarySchema() const { return primarySchema; }
  inline Schema getCurrentSchema() const { return currentSchema; }

private:
  Type type;
  Schema primarySchema;
  Schema currentSchema;
};

class SchemaChangeObserver {
public:
  virtual ~SchemaChangeObserver() noexcept(false) = default;

  virtual void onSchemaChanged(const TypeMetadata& metadata) = 0;
  // Called synchronously by TypeMetadataService::setCurrentSchema().  An exception thrown here
  // propagates to whoever published the change.
};

class TypeMetadataService;

class SchemaSubscription {
  // Keeps an observer registered.  Destroying it unsubscribes.

public:
  SchemaSubscription(TypeMetadataService& service, Type type, SchemaChangeObserver& observer);
  ~SchemaSubscription() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(SchemaSubscription);

private:
  TypeMetadataService& service;
  Type type;
  SchemaChangeObserver& observer;
};

class TypeMetadataService {
  // Tracks the current schema of every type and tells subscribed observers when it changes.  The
  // current schema of a type starts out as its primary schema; the surrounding format switches it
  // to a historical schema when it reads data written by an older version of the type.
  //
  // All methods are thread-safe.  Observers are called without any lock held.

public:
  explicit TypeMetadataService(SchemaDatabase& database);
  ~TypeMetadataService() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(TypeMetadataService);

  inline SchemaDatabase& getSchemaDatabase() { return database; }

  Schema getOrCreatePrimarySchema(Type type);
  Schema getCurrentSchema(Type type);
  TypeMetadata getMetadata(Type type);

  kj::Own<SchemaSubscription> subscribe(Type type, SchemaChangeObserver& observer);
  // Observers subscribed while a notification is in progress only see later notifications.

  void setCurrentSchema(Type type, Schema schema);
  // Makes `schema` the current schema of `type` and notifies the type's observers in the order
  // they subscribed.  If an observer throws, the remaining observers are not notified, but the
  // new schema stays current.

private:
  struct Entry {
    Schema currentSchema;
    kj::Vector<SchemaChangeObserver*> observers;
  };

  SchemaDatabase& database;
  kj::MutexGuarded<kj::HashMap<Type, Entry>> entries;

  Entry& getEntry(kj::HashMap<Type, Entry>& map, Type type);
  void unsubscribe(Type type, SchemaChangeObserver& observer);

  friend class SchemaSubscription;
};

}  // namespace evo

EVO_END_HEADER
