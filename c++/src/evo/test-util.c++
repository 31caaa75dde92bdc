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

#include "test-util.h"

namespace evo {
namespace test {

void describePoint(Serializer& serializer) {
  serializer.describe<Point>()
      .field("x", &Point::x)
      .field("y", &Point::y)
      .build();
}

void describeRecord(Serializer& serializer) {
  serializer.describe<Record>()
      .field("id", &Record::id)
      .field("name", &Record::name)
      .build();
}

void describeShape(Serializer& serializer) {
  describePoint(serializer);
  serializer.describe<Shape>()
      .field("label", &Shape::label)
      .field("origin", &Shape::origin)
      .field("extent", &Shape::extent)
      .build();
}

kj::Array<byte> bytes(std::initializer_list<uint8_t> list) {
  auto result = kj::heapArray<byte>(list.size());
  size_t i = 0;
  for (auto b: list) {
    result[i++] = b;
  }
  return result;
}

}  // namespace test
}  // namespace evo
