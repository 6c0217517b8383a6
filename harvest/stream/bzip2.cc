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

#include "harvest/stream/bzip2.h"

#include <errno.h>
#include <string.h>
#include <string>

#include "harvest/base/logging.h"

namespace harvest {

BZip2Decompressor::BZip2Decompressor(InputStream *source, bool multi_stream,
                                     int block_size)
    : source_(source), multi_stream_(multi_stream), block_size_(block_size) {
  memset(&stream_, 0, sizeof(stream_));
  CHECK_EQ(BZ2_bzDecompressInit(&stream_, 0, 0), BZ_OK);
  buffer_ = new char[block_size_];
}

BZip2Decompressor::~BZip2Decompressor() {
  BZ2_bzDecompressEnd(&stream_);
  delete [] buffer_;
}

bool BZip2Decompressor::Next(const void **data, int *size) {
  // Check if there is any backed up data.
  if (backup_ > 0) {
    *data = stream_.next_out - backup_;
    *size = backup_;
    backup_ = 0;
    return true;
  }
  if (finished_) return false;

  // Read next chunk from source unless there is more output pending for the
  // input already consumed.
  while (stream_.avail_in == 0 && !pending_) {
    const void *chunk;
    int bytes;
    if (!source_->Next(&chunk, &bytes)) {
      finished_ = true;
      if (!source_->status().ok()) {
        status_ = source_->status();
      } else if (in_stream_) {
        status_ = Status(EIO, "Truncated BZIP2 input");
      }
      return false;
    }
    stream_.next_in = static_cast<char *>(const_cast<void *>(chunk));
    stream_.avail_in = bytes;
  }

  // Start a new stream with the remaining input after the end of a stream.
  if (reset_) {
    char *next = stream_.next_in;
    unsigned int avail = stream_.avail_in;
    BZ2_bzDecompressEnd(&stream_);
    memset(&stream_, 0, sizeof(stream_));
    CHECK_EQ(BZ2_bzDecompressInit(&stream_, 0, 0), BZ_OK);
    stream_.next_in = next;
    stream_.avail_in = avail;
    reset_ = false;
  }

  // Decompress chunk.
  in_stream_ = true;
  stream_.next_out = buffer_;
  stream_.avail_out = block_size_;
  int rc = BZ2_bzDecompress(&stream_);
  pending_ = rc == BZ_OK && stream_.avail_out == 0;
  if (rc == BZ_STREAM_END) {
    in_stream_ = false;
    if (multi_stream_) {
      reset_ = true;
    } else {
      finished_ = true;
    }
  } else if (rc != BZ_OK) {
    status_ = Status(EIO, "Corrupt BZIP2 input, error " + std::to_string(rc));
    finished_ = true;
    return false;
  }

  // Return uncompressed data.
  int uncompressed = stream_.next_out - buffer_;
  *data = buffer_;
  *size = uncompressed;
  total_bytes_ += uncompressed;
  return true;
}

void BZip2Decompressor::BackUp(int count) {
  backup_ += count;
  CHECK_LE(backup_, stream_.next_out - buffer_);
}

bool BZip2Decompressor::Skip(int count) {
  while (count > 0) {
    const void *chunk;
    int bytes;
    if (!Next(&chunk, &bytes)) return false;
    if (count >= bytes) {
      count -= bytes;
    } else {
      BackUp(bytes - count);
      count = 0;
    }
  }
  return true;
}

int64 BZip2Decompressor::ByteCount() const {
  return total_bytes_ - backup_;
}

Status BZip2Decompressor::status() const {
  return status_;
}

}  // namespace harvest
