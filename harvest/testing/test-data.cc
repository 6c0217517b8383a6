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

#include "harvest/testing/test-data.h"

#include <bzlib.h>
#include <errno.h>
#include <zlib.h>
#include <string>

#include "harvest/base/logging.h"
#include "harvest/file/file.h"

namespace harvest {
namespace testing {

string CompressBZip2(Slice data) {
  // The compressed size is at most 1% larger than the input plus 600 bytes.
  unsigned int size = data.size() + data.size() / 100 + 600;
  string compressed(size, 0);
  int rc = BZ2_bzBuffToBuffCompress(&compressed[0], &size,
                                    const_cast<char *>(data.data()),
                                    data.size(), 9, 0, 0);
  CHECK_EQ(rc, BZ_OK) << "bzip2 compression failed";
  compressed.resize(size);
  return compressed;
}

Status WriteGZipFile(const string &filename, Slice data) {
  gzFile gz = gzopen(filename.c_str(), "wb");
  if (gz == nullptr) return IOError(filename, errno);
  int written = gzwrite(gz, data.data(), data.size());
  int rc = gzclose(gz);
  if (written != static_cast<int>(data.size()) || rc != Z_OK) {
    return Status(EIO, "gzip write failed", filename);
  }
  return Status::OK;
}

string TestDir() {
  string dir;
  CHECK(File::CreateTempDir(&dir));
  return dir;
}

}  // namespace testing
}  // namespace harvest
