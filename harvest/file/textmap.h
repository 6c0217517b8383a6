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

#ifndef HARVEST_FILE_TEXTMAP_H_
#define HARVEST_FILE_TEXTMAP_H_

#include <string>

#include "harvest/base/macros.h"
#include "harvest/base/slice.h"
#include "harvest/base/status.h"
#include "harvest/base/types.h"
#include "harvest/file/file.h"

namespace harvest {

// A text map file is a text file with one entry per line. The key and value
// are separated by a tab character. Tabs, newlines and backslashes in keys
// and values are escaped with a backslash.
class TextMapInput {
 public:
  explicit TextMapInput(int buffer_size = 1 << 16);
  ~TextMapInput();

  // Open text map file for reading.
  Status Open(const string &filename);

  // Read next entry from file. Returns false if there are no more entries or
  // if a read error occurred, in which case status() holds the error.
  bool Next();

  // Return current entry number. The first entry is zero.
  int64 id() const { return id_; }

  // Return current key and value.
  const string &key() const { return key_; }
  const string &value() const { return value_; }

  // Status of the last read.
  const Status &status() const { return status_; }

  // Close input file.
  Status Close();

 private:
  // Get next character from input. Returns -1 on end of file.
  int NextChar() {
    if (next_ < end_) return static_cast<uchar>(*next_++);
    return Fill();
  }

  // Fill buffer and return first character or -1 on end of file.
  int Fill();

  // Read key or value field. Returns the terminating character.
  int ReadField(string *field);

  File *file_ = nullptr;
  Status status_;

  // Input buffer.
  int buffer_size_;
  char *buffer_;
  char *next_;
  char *end_;

  // Current entry.
  int64 id_ = -1;
  string key_;
  string value_;

  DISALLOW_COPY_AND_ASSIGN(TextMapInput);
};

// Write text map to output file.
class TextMapOutput {
 public:
  explicit TextMapOutput(int buffer_size = 1 << 16);
  ~TextMapOutput();

  // Open text map file for writing.
  Status Open(const string &filename);

  // Flush and close text map.
  Status Close();

  // Write entry to text map. Write errors are reported by Close().
  void Write(Slice key, Slice value);
  void Write(Slice key, int64 value);

 private:
  // Output escaped field.
  void OutputEscaped(Slice field);

  // Output buffered data to file.
  void Output(const char *data, size_t size);

  // Flush output buffer.
  void Flush();

  File *file_ = nullptr;
  Status status_;

  // Output buffer.
  char *buffer_;
  char *next_;
  char *end_;

  DISALLOW_COPY_AND_ASSIGN(TextMapOutput);
};

}  // namespace harvest

#endif  // HARVEST_FILE_TEXTMAP_H_
