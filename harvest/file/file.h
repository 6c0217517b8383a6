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

#ifndef HARVEST_FILE_FILE_H_
#define HARVEST_FILE_FILE_H_

#include <time.h>
#include <string>
#include <vector>

#include "harvest/base/macros.h"
#include "harvest/base/slice.h"
#include "harvest/base/status.h"
#include "harvest/base/types.h"

namespace harvest {

// File information.
struct FileStat {
  uint64 size;
  time_t mtime;
  bool is_file;
  bool is_directory;
};

// Abstract file interface.
class File {
 protected:
  // Use Close() to close and delete the file object.
  virtual ~File() = default;

 public:
  // Read up to "size" bytes from the file at position.
  virtual Status PRead(uint64 pos, void *buffer, size_t size,
                       uint64 *read) = 0;

  // Read up to "size" bytes from the file at the current position.
  virtual Status Read(void *buffer, size_t size, uint64 *read) = 0;

  // Reads "size" bytes to buffer from file. Returns errors if less than
  // "size" bytes read.
  Status Read(void *buffer, size_t size);

  // Reads the whole file to a string.
  Status ReadToString(string *contents);

  // Write data to the file at the current position.
  virtual Status Write(const void *buffer, size_t size) = 0;

  // Write string to file.
  Status WriteString(Slice str) { return Write(str.data(), str.size()); }

  // Write string to file and append a newline.
  Status WriteLine(Slice line);

  // Map file region into memory. Returns null on error.
  virtual void *MapMemory(uint64 pos, size_t size, bool writable) = 0;

  // Set the current file position.
  virtual Status Seek(uint64 pos) = 0;

  // Get file size.
  virtual Status GetSize(uint64 *size) = 0;

  // Close the file and delete the file object.
  virtual Status Close() = 0;

  // Return the file name.
  virtual const string &filename() const = 0;

  // Open file. Modes are "r", "r+", "w", "w+", "a", and "a+".
  static Status Open(const string &name, const char *mode, File **f);

  // Open file. Return null if the file cannot be opened.
  static File *Open(const string &name, const char *mode);

  // Tests if a file or directory exists.
  static bool Exists(const string &name);

  // Get file information.
  static Status Stat(const string &name, FileStat *stat);

  // Create directory.
  static Status Mkdir(const string &dir);

  // Create directory and all missing parent directories.
  static Status MakeDirs(const string &dir);

  // Create temporary directory.
  static Status CreateTempDir(string *dir);

  // Find file names matching pattern. No matches is not an error.
  static Status Match(const string &pattern, std::vector<string> *filenames);

  // Read contents of file.
  static Status ReadContents(const string &filename, string *data);

  // Write contents of file.
  static Status WriteContents(const string &filename, Slice data);

  // Release memory mapping.
  static Status FreeMappedMemory(void *data, size_t size);
};

// Read-only memory mapping of a whole file. The mapped bytes are immutable and
// can be read concurrently from any number of threads.
class MappedFile {
 public:
  MappedFile() {}
  ~MappedFile();

  // Map file into memory.
  Status Open(const string &filename);

  // Unmap file.
  Status Close();

  // Mapped file contents.
  Slice data() const { return Slice(data_, size_); }
  size_t size() const { return size_; }

 private:
  char *data_ = nullptr;
  size_t size_ = 0;

  DISALLOW_COPY_AND_ASSIGN(MappedFile);
};

// Returns status for a failed system call on a named file.
Status IOError(const string &context, int error);

}  // namespace harvest

#endif  // HARVEST_FILE_FILE_H_
