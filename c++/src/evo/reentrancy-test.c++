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

#include "reentrancy.h"
#include <kj/debug.h>
#include <kj/test.h>
#include <kj/thread.h>

namespace evo {
namespace {

KJ_TEST("guards count nested activations per owner") {
  int a, b;
  KJ_EXPECT(ReentrancyGuard::depth(&a) == 0);
  {
    ReentrancyGuard outer(&a);
    KJ_EXPECT(ReentrancyGuard::depth(&a) == 1);
    {
      ReentrancyGuard other(&b);
      ReentrancyGuard inner(&a);
      KJ_EXPECT(ReentrancyGuard::depth(&a) == 2);
      KJ_EXPECT(ReentrancyGuard::depth(&b) == 1);
    }
    KJ_EXPECT(ReentrancyGuard::depth(&a) == 1);
    KJ_EXPECT(ReentrancyGuard::depth(&b) == 0);
  }
  KJ_EXPECT(ReentrancyGuard::depth(&a) == 0);
}

KJ_TEST("guards are released when an exception unwinds") {
  int owner;
  KJ_EXPECT_THROW_MESSAGE("unwound", ([&]() {
    ReentrancyGuard guard(&owner);
    KJ_FAIL_REQUIRE("unwound");
  })());
  KJ_EXPECT(ReentrancyGuard::depth(&owner) == 0);
}

KJ_TEST("guards are per thread") {
  int owner;
  ReentrancyGuard guard(&owner);

  uint seen = 1;
  {
    kj::Thread thread([&]() {
      seen = ReentrancyGuard::depth(&owner);
    });
  }
  KJ_EXPECT(seen == 0);
  KJ_EXPECT(ReentrancyGuard::depth(&owner) == 1);
}

}  // namespace
}  // namespace evo
