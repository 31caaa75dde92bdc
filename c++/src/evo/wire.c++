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

#include "wire.h"
#include <kj/debug.h>

namespace evo {

void ensureCapacity(kj::Array<byte>& buffer, size_t offset, size_t size) {
  size_t needed = offset + size;
  if (needed <= buffer.size()) return;

  size_t newSize = kj::max(needed, buffer.size() * 2);
  auto newBuffer = kj::heapArray<byte>(newSize);
  if (buffer.size() > 0) {
    memcpy(newBuffer.begin(), buffer.begin(), buffer.size());
  }
  memset(newBuffer.begin() + buffer.size(), 0, newSize - buffer.size());
  buffer = kj::mv(newBuffer);
}

void writeBytes(kj::Array<byte>& buffer, size_t& offset, kj::ArrayPtr<const byte> bytes) {
  ensureCapacity(buffer, offset, bytes.size());
  if (bytes.size() > 0) {
    memcpy(buffer.begin() + offset, bytes.begin(), bytes.size());
  }
  offset += bytes.size();
}

kj::ArrayPtr<const byte> readBytes(kj::ArrayPtr<const byte> buffer, size_t& offset, size_t size) {
  requireReadable(buffer, offset, size);
  auto result = buffer.slice(offset, offset + size);
  offset += size;
  return result;
}

void requireReadable(kj::ArrayPtr<const byte> buffer, size_t offset, size_t size) {
  KJ_REQUIRE(offset <= buffer.size() && size <= buffer.size() - offset,
             "premature end of input", offset, size, buffer.size());
}

}  // namespace evo
