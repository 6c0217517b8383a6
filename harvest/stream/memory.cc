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

#include "harvest/stream/memory.h"

#include "harvest/base/logging.h"

namespace harvest {

ArrayInputStream::ArrayInputStream(const void *data, uint64 size,
                                   int block_size)
    : data_(static_cast<const char *>(data)),
      size_(size),
      block_size_(block_size > 0 ? block_size : 1 << 20),
      position_(0),
      last_returned_size_(0) {}

bool ArrayInputStream::Next(const void **data, int *size) {
  if (position_ >= size_) {
    last_returned_size_ = 0;
    return false;
  }
  uint64 left = size_ - position_;
  int n = left < static_cast<uint64>(block_size_) ? left : block_size_;
  *data = data_ + position_;
  *size = n;
  position_ += n;
  last_returned_size_ = n;
  return true;
}

void ArrayInputStream::BackUp(int count) {
  CHECK_GT(last_returned_size_, 0)
      << "BackUp() can only be called after a successful Next()";
  CHECK_LE(count, last_returned_size_);
  CHECK_GE(count, 0);
  position_ -= count;
  last_returned_size_ = 0;
}

bool ArrayInputStream::Skip(int count) {
  CHECK_GE(count, 0);
  last_returned_size_ = 0;
  if (static_cast<uint64>(count) > size_ - position_) {
    position_ = size_;
    return false;
  }
  position_ += count;
  return true;
}

int64 ArrayInputStream::ByteCount() const {
  return position_;
}

}  // namespace harvest
