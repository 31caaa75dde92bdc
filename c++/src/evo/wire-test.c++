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
#include <kj/test.h>

namespace evo {
namespace {

KJ_TEST("fixed-width values are little-endian") {
  auto buffer = kj::heapArray<byte>(0);
  size_t offset = 0;
  writeFixed<uint32_t>(buffer, offset, 0x12345678u);
  writeFixed<int16_t>(buffer, offset, -2);

  KJ_ASSERT(offset == 6);
  KJ_EXPECT(buffer[0] == 0x78);
  KJ_EXPECT(buffer[1] == 0x56);
  KJ_EXPECT(buffer[2] == 0x34);
  KJ_EXPECT(buffer[3] == 0x12);
  KJ_EXPECT(buffer[4] == 0xfe);
  KJ_EXPECT(buffer[5] == 0xff);

  size_t readOffset = 0;
  kj::ArrayPtr<const byte> input = buffer.slice(0, offset);
  KJ_EXPECT(readFixed<uint32_t>(input, readOffset) == 0x12345678u);
  KJ_EXPECT(readFixed<int16_t>(input, readOffset) == -2);
  KJ_EXPECT(readOffset == 6);
}

KJ_TEST("floating point values keep their bits") {
  auto buffer = kj::heapArray<byte>(4);
  size_t offset = 0;
  writeFixed<double>(buffer, offset, -1.5);
  writeFixed<float>(buffer, offset, 0.25f);
  KJ_ASSERT(offset == 12);

  size_t readOffset = 0;
  kj::ArrayPtr<const byte> input = buffer.slice(0, offset);
  KJ_EXPECT(readFixed<double>(input, readOffset) == -1.5);
  KJ_EXPECT(readFixed<float>(input, readOffset) == 0.25f);
}

KJ_TEST("buffers grow and keep their content") {
  auto buffer = kj::heapArray<byte>(2);
  size_t offset = 0;
  for (uint i = 0; i < 100; i++) {
    writeFixed<uint8_t>(buffer, offset, static_cast<uint8_t>(i));
  }
  KJ_ASSERT(buffer.size() >= 100);
  for (uint i = 0; i < 100; i++) {
    KJ_EXPECT(buffer[i] == i);
  }

  writeBytes(buffer, offset, kj::StringPtr("xyz").asBytes());
  KJ_EXPECT(offset == 103);
  KJ_EXPECT(buffer[102] == 'z');
}

KJ_TEST("reading past the end fails") {
  byte data[] = { 1, 2, 3 };
  kj::ArrayPtr<const byte> input = kj::arrayPtr(data, sizeof(data));

  size_t offset = 0;
  KJ_EXPECT_THROW_MESSAGE("premature end of input", readFixed<uint32_t>(input, offset));
  KJ_EXPECT(offset == 0);

  offset = 1;
  KJ_EXPECT(readBytes(input, offset, 2).size() == 2);
  KJ_EXPECT(offset == 3);
  KJ_EXPECT_THROW_MESSAGE("premature end of input", readBytes(input, offset, 1));

  offset = 5;
  KJ_EXPECT_THROW_MESSAGE("premature end of input", requireReadable(input, offset, 0));
}

}  // namespace
}  // namespace evo
