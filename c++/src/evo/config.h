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
#include <kj/vector.h>

EVO_BEGIN_HEADER

namespace evo {

struct SerializerConfig {
  // Options for a Serializer and the schema formatters it creates.

  VersionTolerance versionTolerance = VersionTolerance::DISABLED;
  // Whether formatters follow schema changes published through the TypeMetadataService.  Read
  // once, when a formatter is constructed.

  kj::Vector<Type> bannedTypes;
  // Types that must never get a schema formatter.  Constructing one throws.

  size_t initialBufferSize = 256;
  // Size of the first buffer allocated by Serializer::encode().  Buffers grow as needed.
};

}  // namespace evo

EVO_END_HEADER
