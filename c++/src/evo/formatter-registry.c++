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

#include "formatter-registry.h"
#include <kj/debug.h>

namespace evo {

template <typename T>
void FormatterRegistry::addFixedWidth() {
  add<T>(
      [](kj::Array<byte>& buffer, size_t& offset, const T& value) {
        writeFixed<T>(buffer, offset, value);
      },
      [](kj::ArrayPtr<const byte> buffer, size_t& offset, T& value) {
        value = readFixed<T>(buffer, offset);
      });
}

FormatterRegistry::FormatterRegistry() {
  addFixedWidth<int8_t>();
  addFixedWidth<int16_t>();
  addFixedWidth<int32_t>();
  addFixedWidth<int64_t>();
  addFixedWidth<uint8_t>();
  addFixedWidth<uint16_t>();
  addFixedWidth<uint32_t>();
  addFixedWidth<uint64_t>();
  addFixedWidth<float>();
  addFixedWidth<double>();

  add<bool>(
      [](kj::Array<byte>& buffer, size_t& offset, const bool& value) {
        writeFixed<uint8_t>(buffer, offset, value ? 1 : 0);
      },
      [](kj::ArrayPtr<const byte> buffer, size_t& offset, bool& value) {
        uint8_t raw = readFixed<uint8_t>(buffer, offset);
        KJ_REQUIRE(raw <= 1, "invalid bool encoding", raw);
        value = raw != 0;
      });

  add<kj::String>(
      [](kj::Array<byte>& buffer, size_t& offset, const kj::String& value) {
        writeBytes(buffer, offset, value.asBytes());
      },
      [](kj::ArrayPtr<const byte> buffer, size_t& offset, kj::String& value) {
        auto bytes = readBytes(buffer, offset, buffer.size() - kj::min(offset, buffer.size()));
        value = kj::heapString(reinterpret_cast<const char*>(bytes.begin()), bytes.size());
      });
}

FormatterRegistry::~FormatterRegistry() noexcept(false) {}

void FormatterRegistry::addBase(Type type, kj::Own<ProcedurePairBase> pair) {
  KJ_REQUIRE(type.getKind() == Kind::PRIMITIVE,
             "only primitive types take custom procedures; other types are described by schemas",
             type, type.getKind());

  auto lock = pairs.lockExclusive();
  KJ_REQUIRE(lock->find(type) == kj::none, "type already has procedures", type);
  lock->insert(type, kj::mv(pair));
}

kj::Maybe<const ProcedurePairBase&> FormatterRegistry::find(Type type) const {
  auto lock = pairs.lockShared();
  KJ_IF_SOME(pair, lock->find(type)) {
    // Entries are never removed, so the pair outlives the lock.
    return *pair;
  }
  return kj::none;
}

}  // namespace evo
