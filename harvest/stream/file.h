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

#ifndef HARVEST_STREAM_FILE_H_
#define HARVEST_STREAM_FILE_H_

#include <string>

#include "harvest/base/status.h"
#include "harvest/base/types.h"
#include "harvest/file/file.h"
#include "harvest/stream/stream.h"

namespace harvest {

// File-based input stream reading the file sequentially from its start.
class FileInputStream : public InputStream {
 public:
  // Read from file. The stream takes ownership of the file.
  explicit FileInputStream(File *file, int block_size = 1 << 20);
  ~FileInputStream() override;

  // Implementation of InputStream interface.
  bool Next(const void **data, int *size) override;
  void BackUp(int count) override;
  bool Skip(int count) override;
  int64 ByteCount() const override;
  Status status() const override { return status_; }

 private:
  File *file_;         // underlying file to read from
  uint8 *buffer_;      // file buffer
  int size_;           // size of file buffer
  int used_;           // number of current used bytes in buffer
  int backup_;         // number of bytes currently backed up
  int64 position_;     // current file position
  Status status_;      // read error
};

}  // namespace harvest

#endif  // HARVEST_STREAM_FILE_H_
