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

// Low-level byte access used by generated procedures and primitive formatters.
//
// Encoding writes into a growable `kj::Array<byte>` at a caller-supplied offset; the array is
// reallocated as needed, so the caller must not hold pointers into it across a write.  Decoding
// reads from a `kj::ArrayPtr<const byte>`; reads past its end fail with "premature end of input".
// All fixed-width values are little-endian.

#pragma once

#include "common.h"
#include <kj/array.h>
#include <string.h>

EVO_BEGIN_HEADER

namespace evo {

constexpr size_t FIELD_SIZE_PREFIX_BYTES = 4;
// Every encoded field is preceded by its payload size as a 4-byte unsigned integer.

void ensureCapacity(kj::Array<byte>& buffer, size_t offset, size_t size);
// Makes sure `size` bytes can be written at `offset`, reallocating `buffer` (at least doubling it)
// if necessary.  Existing content is preserved.

void writeBytes(kj::Array<byte>& buffer, size_t& offset, kj::ArrayPtr<const byte> bytes);
kj::ArrayPtr<const byte> readBytes(kj::ArrayPtr<const byte> buffer, size_t& offset, size_t size);

void requireReadable(kj::ArrayPtr<const byte> buffer, size_t offset, size_t size);
// Throws if fewer than `size` bytes are available at `offset`.

template <typename T>
void writeFixed(kj::Array<byte>& buffer, size_t& offset, T value);
template <typename T>
T readFixed(kj::ArrayPtr<const byte> buffer, size_t& offset);
// Fixed-width little-endian integers and IEEE floats.

inline void writeUInt32Fixed(kj::Array<byte>& buffer, size_t& offset, uint32_t value) {
  writeFixed<uint32_t>(buffer, offset, value);
}
inline uint32_t readUInt32Fixed(kj::ArrayPtr<const byte> buffer, size_t& offset) {
  return readFixed<uint32_t>(buffer, offset);
}

// =======================================================================================
// inline implementation details

namespace _ {  // private

template <size_t size> struct UnsignedOfSize;
template <> struct UnsignedOfSize<1> { typedef uint8_t Type; };
template <> struct UnsignedOfSize<2> { typedef uint16_t Type; };
template <> struct UnsignedOfSize<4> { typedef uint32_t Type; };
template <> struct UnsignedOfSize<8> { typedef uint64_t Type; };

}  // namespace _ (private)

template <typename T>
void writeFixed(kj::Array<byte>& buffer, size_t& offset, T value) {
  typedef typename _::UnsignedOfSize<sizeof(T)>::Type Bits;
  Bits bits;
  memcpy(&bits, &value, sizeof(T));

  ensureCapacity(buffer, offset, sizeof(T));
  byte* out = buffer.begin() + offset;
  for (size_t i = 0; i < sizeof(T); i++) {
    out[i] = static_cast<byte>(bits >> (i * 8));
  }
  offset += sizeof(T);
}

template <typename T>
T readFixed(kj::ArrayPtr<const byte> buffer, size_t& offset) {
  typedef typename _::UnsignedOfSize<sizeof(T)>::Type Bits;
  requireReadable(buffer, offset, sizeof(T));

  const byte* in = buffer.begin() + offset;
  Bits bits = 0;
  for (size_t i = 0; i < sizeof(T); i++) {
    bits |= static_cast<Bits>(in[i]) << (i * 8);
  }
  offset += sizeof(T);

  T result;
  memcpy(&result, &bits, sizeof(T));
  return result;
}

}  // namespace evo

EVO_END_HEADER
