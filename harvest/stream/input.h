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

#ifndef HARVEST_STREAM_INPUT_H_
#define HARVEST_STREAM_INPUT_H_

#include <string>

#include "harvest/base/macros.h"
#include "harvest/base/types.h"
#include "harvest/stream/stream.h"

namespace harvest {

// Input class for reading bytes and lines from an input stream.
class Input {
 public:
  // Initializes input from a stream. This does not take ownership of the
  // underlying stream.
  explicit Input(InputStream *stream);
  ~Input();

  // Reads 'size' bytes from the input. Returns false if not all data could
  // be read.
  bool Read(char *data, int size);

  // Reads one byte from the input. This optimizes the case where we have
  // data buffered from the input stream.
  bool Next(char *ch) {
    if (!empty()) {
      *ch = *current_++;
      return true;
    } else {
      return Read(ch, 1);
    }
  }

  // Reads line from input into the string. The newline is not included.
  // Returns false on end of input.
  bool ReadLine(string *output);

  // Peeks at the next input byte. Returns the next input byte without
  // removing it or returns -1 when there is no more input.
  int Peek();

  // Returns true when all input has been read.
  bool done() { return empty() && !Fill(); }

  // Returns the input stream.
  InputStream *stream() { return stream_; }

 private:
  // Returns true if input buffer is empty.
  bool empty() const { return current_ == limit_; }

  // Reads more data from input. Returns false if the end of the input has
  // been reached.
  bool Fill();

  // Current position in input buffer.
  const char *current_;

  // End of input buffer.
  const char *limit_;

  // Underlying input stream where data is read from.
  InputStream *stream_;

  // This flag is set when all input has been read from the input.
  bool done_;

  DISALLOW_IMPLICIT_CONSTRUCTORS(Input);
};

}  // namespace harvest

#endif  // HARVEST_STREAM_INPUT_H_
