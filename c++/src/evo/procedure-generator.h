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

// Builds the encode and decode procedures of a type for one schema.
//
// Instead of walking the schema on every call, the generator resolves each member's field
// procedures once and closes over them, so that encoding or decoding a value is a plain loop over
// pre-bound per-field procedures.
//
// Each field is framed as
//
//     [payload size: 4-byte little-endian unsigned][payload]
//
// so that a reader whose schema marks the field as skipped can step over it without knowing how
// it was encoded.  Fields appear in schema order; there is no header.

#pragma once

#include "accessor.h"
#include "wire.h"
#include <kj/debug.h>

EVO_BEGIN_HEADER

namespace evo {

template <typename T>
EncodeProc<T> generateEncoder(Schema schema, FormatterResolver& resolver);
// Only primary schemas can be encoded, and they never contain skip members.

template <typename T>
DecodeProc<T> generateDecoder(Schema schema, FormatterResolver& resolver);

template <typename T>
EncodeProc<T> newRefusingEncoder(Schema schema);
// An encoder that always throws.  Used for historical schemas.

template <typename T>
kj::Own<ProcedurePair<T>> newEmptyProcedures(Schema schema);
// Procedures for a schema without members, built without running the generator.  They do nothing,
// except that encoding still throws if the schema is historical.

// =======================================================================================
// inline implementation details

template <typename T>
EncodeProc<T> generateEncoder(Schema schema, FormatterResolver& resolver) {
  KJ_REQUIRE(schema.isPrimary(), "cannot encode using a non-primary schema", schema);

  auto fields = kj::heapArrayBuilder<EncodeProc<T>>(schema.size());
  for (auto& member: schema.getMembers()) {
    KJ_ASSERT(!member.isSkip(), "primary schema contains a skip member", schema);
    fields.add(getAccessor<T>(member).bindEncoder(resolver));
  }

  return [fields = fields.finish()](kj::Array<byte>& buffer, size_t& offset, const T& value) {
    for (auto& field: fields) {
      // Reserve the size prefix, write the payload after it, then go back and fill it in.
      size_t startPos = offset;
      ensureCapacity(buffer, startPos, FIELD_SIZE_PREFIX_BYTES);
      offset += FIELD_SIZE_PREFIX_BYTES;

      field(buffer, offset, value);

      size_t size = offset - startPos - FIELD_SIZE_PREFIX_BYTES;
      KJ_REQUIRE(size <= uint32_t(kj::maxValue), "field payload too large", size);

      offset = startPos;
      writeUInt32Fixed(buffer, offset, static_cast<uint32_t>(size));
      offset = startPos + FIELD_SIZE_PREFIX_BYTES + size;
    }
  };
}

namespace _ {  // private

template <typename T>
struct FieldDecoder {
  kj::StringPtr name;
  bool skip;
  DecodeProc<T> decode;
};

}  // namespace _ (private)

template <typename T>
DecodeProc<T> generateDecoder(Schema schema, FormatterResolver& resolver) {
  auto fields = kj::heapArrayBuilder<_::FieldDecoder<T>>(schema.size());
  for (auto& member: schema.getMembers()) {
    if (member.isSkip()) {
      fields.add(_::FieldDecoder<T> { member.getName(), true, DecodeProc<T>() });
    } else {
      fields.add(_::FieldDecoder<T> {
        member.getName(), false, getAccessor<T>(member).bindDecoder(resolver)
      });
    }
  }

  Type type = schema.getOwnerType();
  return [type, fields = fields.finish()](
      kj::ArrayPtr<const byte> buffer, size_t& offset, T& value) {
    for (auto& field: fields) {
      size_t size = readUInt32Fixed(buffer, offset);
      KJ_REQUIRE(size <= buffer.size() - offset, "truncated field frame",
                 type, field.name, size, buffer.size() - offset);
      size_t start = offset;
      size_t end = start + size;

      if (field.skip) {
        offset = end;
      } else {
        // The field's procedure sees the buffer only up to the end of its frame.
        field.decode(buffer.slice(0, end), offset, value);
        KJ_REQUIRE(offset == end, "field payload length mismatch",
                   type, field.name, size, offset - start);
      }
    }
  };
}

template <typename T>
EncodeProc<T> newRefusingEncoder(Schema schema) {
  return [schema](kj::Array<byte>&, size_t&, const T&) {
    KJ_FAIL_REQUIRE("cannot encode using a non-primary schema; only the primary schema of a type "
                    "can be written", schema.getOwnerType(), schema);
  };
}

template <typename T>
kj::Own<ProcedurePair<T>> newEmptyProcedures(Schema schema) {
  KJ_REQUIRE(schema.empty(), schema);

  DecodeProc<T> decoder = [](kj::ArrayPtr<const byte>, size_t&, T&) {};
  if (schema.isPrimary()) {
    return kj::heap<ProcedurePair<T>>(
        [](kj::Array<byte>&, size_t&, const T&) {}, kj::mv(decoder));
  } else {
    return kj::heap<ProcedurePair<T>>(newRefusingEncoder<T>(schema), kj::mv(decoder));
  }
}

}  // namespace evo

EVO_END_HEADER
