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

#include "serializer.h"

namespace evo {
namespace test {

struct Point {
  int32_t x = 0;
  int32_t y = 0;
};

struct Record {
  int32_t id = 0;
  kj::String name;
};

struct Triple {
  int32_t first = 0;
  kj::String second;
  int64_t third = 0;
};

struct Shape {
  kj::String label;
  Point origin;
  Point extent;
};

struct Trigger {
  // Primitive with test-supplied procedures, used to run code in the middle of a decode.
  uint8_t value = 0;
};

struct Tagged {
  Trigger trigger;
  Point origin;
};

struct Nothing {};

struct Handle {
  int32_t id = 0;
};

struct Account {
  kj::String owner;
  Handle handle;
};

struct Flags {
  bool enabled = false;
  double ratio = 0;
  uint16_t mask = 0;
};

void describePoint(Serializer& serializer);
void describeRecord(Serializer& serializer);
void describeShape(Serializer& serializer);
// Also describes Point.

kj::Array<byte> bytes(std::initializer_list<uint8_t> list);

}  // namespace test
}  // namespace evo

EVO_DECLARE_TYPE(evo::test::Point, "Point", VALUE)
EVO_DECLARE_TYPE(evo::test::Record, "Record", VALUE)
EVO_DECLARE_TYPE(evo::test::Triple, "Triple", VALUE)
EVO_DECLARE_TYPE(evo::test::Shape, "Shape", VALUE)
EVO_DECLARE_TYPE(evo::test::Trigger, "Trigger", PRIMITIVE)
EVO_DECLARE_TYPE(evo::test::Tagged, "Tagged", VALUE)
EVO_DECLARE_TYPE(evo::test::Nothing, "Nothing", VALUE)
EVO_DECLARE_TYPE(evo::test::Handle, "Handle", REFERENCE)
EVO_DECLARE_TYPE(evo::test::Account, "Account", REFERENCE)
EVO_DECLARE_TYPE(evo::test::Flags, "Flags", VALUE)
