// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef HARVEST_STREAM_MEMORY_H_
#define HARVEST_STREAM_MEMORY_H_

#include <string>

#include "harvest/base/slice.h"
#include "harvest/base/types.h"
#include "harvest/stream/stream.h"

namespace harvest {

// An InputStream backed by an in-memory array of bytes. The array is not
// owned by the stream and can be larger than what fits in a single chunk,
// e.g. a memory-mapped file.
class ArrayInputStream : public InputStream {
 public:
  ArrayInputStream(const void *data, uint64 size, int block_size = 1 << 20);
  ArrayInputStream(Slice buffer, int block_size = 1 << 20)
      : ArrayInputStream(buffer.data(), buffer.size(), block_size) {}

  // InputStream interface.
  bool Next(const void **data, int *size) override;
  void BackUp(int count) override;
  bool Skip(int count) override;
  int64 ByteCount() const override;

 private:
  const char *data_;
  uint64 size_;
  int block_size_;
  uint64 position_;
  int last_returned_size_;
};

// An InputStream backed by a string. The string must outlive the stream.
class StringInputStream : public ArrayInputStream {
 public:
  StringInputStream(const string &str, int block_size = 1 << 20)
      : ArrayInputStream(str.data(), str.size(), block_size) {}
};

}  // namespace harvest

#endif  // HARVEST_STREAM_MEMORY_H_
