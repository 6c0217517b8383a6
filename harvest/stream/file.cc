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

#include "harvest/stream/file.h"

#include <string>

#include "harvest/base/logging.h"

namespace harvest {

FileInputStream::FileInputStream(File *file, int block_size)
    : file_(file), size_(block_size), used_(0), backup_(0), position_(0) {
  buffer_ = new uint8[size_];
}

FileInputStream::~FileInputStream() {
  Status st = file_->Close();
  if (!st.ok()) LOG(ERROR) << "Error closing input file: " << st;
  delete [] buffer_;
}

bool FileInputStream::Next(const void **data, int *size) {
  // Return backed up data if we have any.
  if (backup_ > 0) {
    *data = buffer_ + used_ - backup_;
    *size = backup_;
    backup_ = 0;
    return true;
  }
  if (!status_.ok()) return false;

  uint64 bytes;
  status_ = file_->PRead(position_, buffer_, size_, &bytes);
  if (!status_.ok() || bytes == 0) {
    used_ = 0;
    return false;
  }
  used_ = bytes;
  position_ += bytes;

  *data = buffer_;
  *size = used_;
  return true;
}

void FileInputStream::BackUp(int count) {
  backup_ += count;
  CHECK_LE(backup_, used_);
}

bool FileInputStream::Skip(int count) {
  if (backup_ >= count) {
    backup_ -= count;
    return true;
  }
  count -= backup_;
  backup_ = 0;
  used_ = 0;
  position_ += count;

  uint64 file_size;
  status_ = file_->GetSize(&file_size);
  if (!status_.ok()) return false;
  if (position_ > static_cast<int64>(file_size)) {
    position_ = file_size;
    return false;
  }
  return true;
}

int64 FileInputStream::ByteCount() const {
  return position_ - backup_;
}

}  // namespace harvest
