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

#ifndef HARVEST_STREAM_FILE_INPUT_H_
#define HARVEST_STREAM_FILE_INPUT_H_

#include <string>
#include <vector>

#include "harvest/base/macros.h"
#include "harvest/base/status.h"
#include "harvest/base/types.h"
#include "harvest/stream/stream.h"

namespace harvest {

// Input stream that runs a pipeline of input streams. Data is read from the
// last stream and errors are reported from the first failing stream.
class InputPipeline : public InputStream {
 public:
  InputPipeline() {}
  ~InputPipeline() override;

  // Add input stream to pipeline. Takes ownership of the stream.
  void Add(InputStream *stream);

  // Implementation of InputStream interface.
  bool Next(const void **data, int *size) override;
  void BackUp(int count) override;
  bool Skip(int count) override;
  int64 ByteCount() const override;
  Status status() const override;

 private:
  // Final input stream.
  InputStream *last_ = nullptr;

  // Input stream pipeline.
  std::vector<InputStream *> streams_;
};

// Opens files and adds decompression for compressed files based on the file
// extension (.gz or .bz2).
class FileInput {
 public:
  // Open input file. The caller takes ownership of the returned stream.
  static Status Open(const string &filename, InputStream **stream,
                     int block_size = 1 << 20);

 private:
  DISALLOW_IMPLICIT_CONSTRUCTORS(FileInput);
};

}  // namespace harvest

#endif  // HARVEST_STREAM_FILE_INPUT_H_
