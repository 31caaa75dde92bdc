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

#include "common.h"

namespace evo {

namespace _ {  // private

const RawType NULL_TYPE = { "<unknown>", Kind::PRIMITIVE };

}  // namespace _ (private)

kj::StringPtr KJ_STRINGIFY(Kind kind) {
  switch (kind) {
    case Kind::PRIMITIVE: return "primitive";
    case Kind::VALUE: return "value";
    case Kind::REFERENCE: return "reference";
  }
  return "unknown kind";
}

kj::StringPtr KJ_STRINGIFY(VersionTolerance tolerance) {
  switch (tolerance) {
    case VersionTolerance::DISABLED: return "disabled";
    case VersionTolerance::AUTOMATIC: return "automatic";
  }
  return "unknown tolerance";
}

}  // namespace evo
