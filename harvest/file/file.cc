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

#include "harvest/file/file.h"

#include <errno.h>
#include <string.h>
#include <string>

#include "harvest/base/logging.h"

namespace harvest {

Status IOError(const string &context, int error) {
  return Status(error, context.c_str(), strerror(error));
}

Status File::Read(void *buffer, size_t size) {
  uint64 read;
  Status st = Read(buffer, size, &read);
  if (!st.ok()) return st;
  if (read != size) return IOError(filename(), EIO);
  return Status::OK;
}

Status File::ReadToString(string *contents) {
  uint64 size;
  Status st = GetSize(&size);
  if (!st.ok()) return st;
  contents->resize(size);
  if (size == 0) return Status::OK;
  return Read(&(*contents)[0], size);
}

Status File::WriteLine(Slice line) {
  Status st = Write(line.data(), line.size());
  if (!st.ok()) return st;
  return Write("\n", 1);
}

File *File::Open(const string &name, const char *mode) {
  File *f;
  if (!Open(name, mode, &f).ok()) return nullptr;
  return f;
}

Status File::MakeDirs(const string &dir) {
  if (dir.empty() || Exists(dir)) return Status::OK;
  size_t slash = dir.rfind('/');
  if (slash != string::npos && slash > 0) {
    Status st = MakeDirs(dir.substr(0, slash));
    if (!st.ok()) return st;
  }
  Status st = Mkdir(dir);
  if (!st.ok() && st.code() == EEXIST) return Status::OK;
  return st;
}

Status File::ReadContents(const string &filename, string *data) {
  File *file;
  Status st = Open(filename, "r", &file);
  if (!st.ok()) return st;
  st = file->ReadToString(data);
  Status cst = file->Close();
  return st.ok() ? cst : st;
}

Status File::WriteContents(const string &filename, Slice data) {
  File *file;
  Status st = Open(filename, "w", &file);
  if (!st.ok()) return st;
  st = file->Write(data.data(), data.size());
  Status cst = file->Close();
  return st.ok() ? cst : st;
}

MappedFile::~MappedFile() {
  Status st = Close();
  if (!st.ok()) LOG(ERROR) << "Error unmapping file: " << st;
}

Status MappedFile::Open(const string &filename) {
  CHECK(data_ == nullptr) << "File already mapped";
  File *file;
  Status st = File::Open(filename, "r", &file);
  if (!st.ok()) return st;
  uint64 size;
  st = file->GetSize(&size);
  if (st.ok() && size > 0) {
    void *mapping = file->MapMemory(0, size, false);
    if (mapping == nullptr) {
      st = IOError(filename, errno);
    } else {
      data_ = static_cast<char *>(mapping);
      size_ = size;
    }
  }

  // The mapping stays valid after the descriptor is closed.
  Status cst = file->Close();
  return st.ok() ? cst : st;
}

Status MappedFile::Close() {
  if (data_ == nullptr) return Status::OK;
  Status st = File::FreeMappedMemory(data_, size_);
  data_ = nullptr;
  size_ = 0;
  return st;
}

}  // namespace harvest
