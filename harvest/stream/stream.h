// Copyright 2008 Google Inc.  All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

// Based on ZeroCopy streams from Google Protocol Buffers.
//
// An InputStream hands out buffers owned by the stream instead of copying
// data into caller buffers. Streams can be chained, e.g. a decompressor reads
// compressed chunks from a file stream or from a memory-mapped byte range and
// returns decompressed chunks from its own buffer.

#ifndef HARVEST_STREAM_STREAM_H_
#define HARVEST_STREAM_STREAM_H_

#include "harvest/base/macros.h"
#include "harvest/base/status.h"
#include "harvest/base/types.h"

namespace harvest {

// Abstract input stream interface designed to minimize copying.
class InputStream {
 public:
  InputStream() {}
  virtual ~InputStream() = default;

  // Obtains a chunk of data from the stream. Returns false if there is no
  // more data or an error occurred. All errors are permanent and reported by
  // status(). The returned buffer is owned by the stream and stays valid
  // until the next call to a method of the stream. A chunk may be empty as
  // long as repeated calls eventually return data.
  virtual bool Next(const void **data, int *size) = 0;

  // Backs up a number of bytes so that the next call to Next() returns the
  // last "count" bytes of the previous chunk again. The last method called
  // must have been Next().
  virtual void BackUp(int count) = 0;

  // Skips a number of bytes. Returns false if the end of the stream is
  // reached or an input error occurred.
  virtual bool Skip(int count) = 0;

  // Returns the total number of bytes read since this object was created.
  virtual int64 ByteCount() const = 0;

  // Returns the error that terminated the stream or OK if the stream ended
  // normally or has not ended yet.
  virtual Status status() const { return Status::OK; }

 private:
  DISALLOW_COPY_AND_ASSIGN(InputStream);
};

}  // namespace harvest

#endif  // HARVEST_STREAM_STREAM_H_
