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

#include "common.h"

EVO_BEGIN_HEADER

namespace evo {

class ReentrancyGuard {
  // Marks an owner (a formatter) as decoding on the current thread until the guard is destroyed,
  // whether the decode returns or throws.  Guards live on the stack and form a per-thread chain,
  // so nested decodes of the same owner are counted.

public:
  explicit ReentrancyGuard(const void* owner);
  ~ReentrancyGuard() noexcept;
  KJ_DISALLOW_COPY_AND_MOVE(ReentrancyGuard);

  static uint depth(const void* owner);
  // Number of guards for `owner` currently on this thread's chain.

private:
  const void* owner;
  ReentrancyGuard* next;
};

}  // namespace evo

EVO_END_HEADER
