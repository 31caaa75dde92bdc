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

// This file defines the handles and enums shared by every part of the schema formatter:  `Type`,
// which identifies a native C++ type at runtime, its `Kind`, and the version tolerance policy.

#pragma once

#include <kj/common.h>
#include <kj/string.h>
#include <kj/hash.h>
#include <inttypes.h>

#define EVO_BEGIN_HEADER KJ_BEGIN_HEADER
#define EVO_END_HEADER KJ_END_HEADER

EVO_BEGIN_HEADER

namespace evo {

using kj::byte;
using kj::uint;

enum class Kind: uint8_t {
  PRIMITIVE,
  // Encoded by a dedicated formatter.  Has no schema.

  VALUE,
  // Copied by value.  Its encoding is inlined into the procedures generated for any type that
  // contains it, so the containing type has to follow its schema changes.

  REFERENCE
  // Shared by reference.  Serialized through a reference-aware layer that handles schema
  // migration on its own.
};

kj::StringPtr KJ_STRINGIFY(Kind kind);

enum class VersionTolerance: uint8_t {
  DISABLED,
  // Every type only ever uses its primary schema.

  AUTOMATIC
  // Formatters follow schema changes published through the TypeMetadataService.
};

kj::StringPtr KJ_STRINGIFY(VersionTolerance tolerance);

namespace _ {  // private

struct RawType {
  const char* name;
  Kind kind;
};

extern const RawType NULL_TYPE;
// Type of skipped schema members, whose declared type is unknown to the reader.

template <typename T>
struct TypeInfo;
// Specialized by EVO_DECLARE_TYPE().

template <typename T>
inline const RawType& rawType() {
  static constexpr RawType RAW = { TypeInfo<T>::NAME, TypeInfo<T>::KIND };
  return RAW;
}

}  // namespace _ (private)

class Type {
  // Identifies a native type.  Two Types are equal iff they were obtained for the same C++ type.

public:
  inline Type(): raw(&_::NULL_TYPE) {}

  template <typename T>
  static inline Type from() { return Type(&_::rawType<kj::Decay<T>>()); }

  inline kj::StringPtr getName() const { return raw->name; }
  inline Kind getKind() const { return raw->kind; }

  inline bool isUnknown() const { return raw == &_::NULL_TYPE; }

  inline bool operator==(const Type& other) const { return raw == other.raw; }
  inline bool operator!=(const Type& other) const { return raw != other.raw; }

  inline uint hashCode() const { return kj::hashCode(reinterpret_cast<uintptr_t>(raw)); }

private:
  const _::RawType* raw;

  inline explicit Type(const _::RawType* raw): raw(raw) {}
};

inline kj::StringPtr KJ_STRINGIFY(const Type& type) { return type.getName(); }

}  // namespace evo

#define EVO_DECLARE_TYPE(type, displayName, kind) \
  namespace evo { namespace _ { \
    template <> \
    struct TypeInfo<type> { \
      static constexpr const char* NAME = displayName; \
      static constexpr ::evo::Kind KIND = ::evo::Kind::kind; \
    }; \
  } }
// Declares the display name and kind of `type`.  Must be used at the global scope, once per type,
// before Type::from<type>() is used:
//
//     EVO_DECLARE_TYPE(geo::Point, "Point", VALUE)

EVO_DECLARE_TYPE(bool, "bool", PRIMITIVE)
EVO_DECLARE_TYPE(int8_t, "int8", PRIMITIVE)
EVO_DECLARE_TYPE(int16_t, "int16", PRIMITIVE)
EVO_DECLARE_TYPE(int32_t, "int32", PRIMITIVE)
EVO_DECLARE_TYPE(int64_t, "int64", PRIMITIVE)
EVO_DECLARE_TYPE(uint8_t, "uint8", PRIMITIVE)
EVO_DECLARE_TYPE(uint16_t, "uint16", PRIMITIVE)
EVO_DECLARE_TYPE(uint32_t, "uint32", PRIMITIVE)
EVO_DECLARE_TYPE(uint64_t, "uint64", PRIMITIVE)
EVO_DECLARE_TYPE(float, "float32", PRIMITIVE)
EVO_DECLARE_TYPE(double, "float64", PRIMITIVE)
EVO_DECLARE_TYPE(kj::String, "string", PRIMITIVE)

EVO_END_HEADER
