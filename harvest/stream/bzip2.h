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

#ifndef HARVEST_STREAM_BZIP2_H_
#define HARVEST_STREAM_BZIP2_H_

#include <bzlib.h>

#include "harvest/base/status.h"
#include "harvest/base/types.h"
#include "harvest/stream/stream.h"

namespace harvest {

// BZIP2 stream decompression. A multi-stream decompressor restarts after the
// end of each compressed stream and decodes concatenated streams as one. A
// single-stream decompressor stops at the end of the first stream and
// ignores any trailing input, e.g. the following blocks of a multistream
// dump.
class BZip2Decompressor : public InputStream {
 public:
  BZip2Decompressor(InputStream *source,
                    bool multi_stream = true,
                    int block_size = 1 << 20);
  ~BZip2Decompressor() override;

  // Implementation of InputStream interface.
  bool Next(const void **data, int *size) override;
  void BackUp(int count) override;
  bool Skip(int count) override;
  int64 ByteCount() const override;
  Status status() const override;

 private:
  // Source for compressed input.
  InputStream *source_;

  // Decompress across stream boundaries.
  bool multi_stream_;

  // Decompression buffer.
  char *buffer_;
  int block_size_;

  // Decompressor.
  bz_stream stream_;

  // Number of bytes uncompressed.
  uint64 total_bytes_ = 0;

  // Reset decompressor on next chunk.
  bool reset_ = false;

  // Set when a compressed stream has been started but not finished.
  bool in_stream_ = false;

  // Set when the output buffer was filled by the last decompression call.
  bool pending_ = false;

  // Set when no more output will be produced.
  bool finished_ = false;

  // Number of bytes to back up.
  int backup_ = 0;

  // Decompression error.
  Status status_;
};

}  // namespace harvest

#endif  // HARVEST_STREAM_BZIP2_H_
