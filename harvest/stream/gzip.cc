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

#include "harvest/stream/gzip.h"

#include <errno.h>
#include <string.h>
#include <string>

#include "harvest/base/logging.h"

namespace harvest {

GZipDecompressor::GZipDecompressor(InputStream *source,
                                   int block_size,
                                   int window_bits)
    : source_(source), block_size_(block_size) {
  memset(&stream_, 0, sizeof(stream_));
  CHECK_EQ(inflateInit2(&stream_, window_bits), Z_OK);
  buffer_ = new char[block_size_];
}

GZipDecompressor::~GZipDecompressor() {
  inflateEnd(&stream_);
  delete [] buffer_;
}

bool GZipDecompressor::Next(const void **data, int *size) {
  // Check if there is any backed up data.
  if (backup_ > 0) {
    *data = reinterpret_cast<char *>(stream_.next_out) - backup_;
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
        status_ = Status(EIO, "Truncated GZIP input");
      }
      return false;
    }
    stream_.next_in = static_cast<Bytef *>(const_cast<void *>(chunk));
    stream_.avail_in = bytes;
  }

  // Continue with the next member after the end of a member.
  if (reset_) {
    Bytef *next = stream_.next_in;
    uInt avail = stream_.avail_in;
    CHECK_EQ(inflateReset(&stream_), Z_OK);
    stream_.next_in = next;
    stream_.avail_in = avail;
    reset_ = false;
  }

  // Decompress chunk.
  in_stream_ = true;
  stream_.next_out = reinterpret_cast<Bytef *>(buffer_);
  stream_.avail_out = block_size_;
  int rc = inflate(&stream_, Z_NO_FLUSH);
  pending_ = rc == Z_OK && stream_.avail_out == 0;
  if (rc == Z_STREAM_END) {
    in_stream_ = false;
    reset_ = true;
  } else if (rc != Z_OK && rc != Z_BUF_ERROR) {
    string msg = "GZIP input error " + std::to_string(rc);
    if (stream_.msg != nullptr) msg.append(": ").append(stream_.msg);
    status_ = Status(EIO, msg);
    finished_ = true;
    return false;
  }

  // Return uncompressed data.
  int uncompressed = reinterpret_cast<char *>(stream_.next_out) - buffer_;
  *data = buffer_;
  *size = uncompressed;
  total_bytes_ += uncompressed;
  return true;
}

void GZipDecompressor::BackUp(int count) {
  backup_ += count;
  CHECK_LE(backup_, reinterpret_cast<char *>(stream_.next_out) - buffer_);
}

bool GZipDecompressor::Skip(int count) {
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

int64 GZipDecompressor::ByteCount() const {
  return total_bytes_ - backup_;
}

}  // namespace harvest
