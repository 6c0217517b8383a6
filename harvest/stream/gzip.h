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

#ifndef HARVEST_STREAM_GZIP_H_
#define HARVEST_STREAM_GZIP_H_

#include <zlib.h>

#include "harvest/base/status.h"
#include "harvest/base/types.h"
#include "harvest/stream/stream.h"

namespace harvest {

// GZIP stream decompression. Concatenated GZIP members are decoded as one
// stream.
class GZipDecompressor : public InputStream {
 public:
  // The default window bits accept both GZIP and ZLIB headers.
  GZipDecompressor(InputStream *source,
                   int block_size = 1 << 20,
                   int window_bits = 15 + 32);
  ~GZipDecompressor() override;

  // Implementation of InputStream interface.
  bool Next(const void **data, int *size) override;
  void BackUp(int count) override;
  bool Skip(int count) override;
  int64 ByteCount() const override;
  Status status() const override { return status_; }

 private:
  // Source for compressed input.
  InputStream *source_;

  // Decompression buffer.
  char *buffer_;
  int block_size_;

  // Decompressor.
  z_stream stream_;

  // Number of bytes uncompressed.
  uint64 total_bytes_ = 0;

  // Reset decompressor on next chunk (for multi-member files).
  bool reset_ = false;

  // Set when a member has been started but not finished.
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

#endif  // HARVEST_STREAM_GZIP_H_
