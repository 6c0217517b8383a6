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

#include <string>

#include "harvest/base/init.h"
#include "harvest/base/logging.h"
#include "harvest/file/file.h"
#include "harvest/testing/test-data.h"
#include "harvest/wiki/errors.h"
#include "harvest/wiki/offset-index.h"

using namespace harvest;
using namespace harvest::wiki;

void TestReadIndex(const string &dir) {
  string index = dir + "/index.txt.bz2";
  string lines =
      "600:10:AccessibleComputing\n"
      "600:12:Anarchism\n"
      "600:13:AfghanistanHistory\n"
      "1535:290:A\n"
      "1535:303:Alabama\n"
      "\n"
      "2900:307:Abraham Lincoln: A Biography\n";
  CHECK(File::WriteContents(index, testing::CompressBZip2(lines)));

  // The first load reads the index and writes the cache.
  string cache = dir + "/offsets.txt";
  OffsetIndex offsets;
  CHECK(offsets.Load(index, cache));
  CHECK_EQ(offsets.size(), 3);
  CHECK_EQ(offsets[0], 600);
  CHECK_EQ(offsets[1], 1535);
  CHECK_EQ(offsets[2], 2900);
  CHECK(File::Exists(cache));
  string contents;
  CHECK(File::ReadContents(cache, &contents));
  CHECK_EQ(contents, "600\n1535\n2900\n");

  // The second load uses the cache even if the index is gone.
  CHECK(File::WriteContents(index, "garbage"));
  OffsetIndex cached;
  CHECK(cached.Load(index, cache));
  CHECK(cached.offsets() == offsets.offsets());
}

void TestMalformed(const string &dir) {
  string index = dir + "/bad-index.txt.bz2";
  CHECK(File::WriteContents(
      index, testing::CompressBZip2("600:10:A\nsix hundred:11:B\n")));
  OffsetIndex offsets;
  Status st = offsets.ReadIndex(index);
  CHECK_EQ(st.code(), MALFORMED_OFFSET);
  CHECK_NE(string(st.message()).find(":2:"), string::npos) << st;

  // Index lines need a separator after the offset.
  CHECK(File::WriteContents(
      index, testing::CompressBZip2("600:10:A\n1535:11:B\n2000\n")));
  st = offsets.ReadIndex(index);
  CHECK_EQ(st.code(), MALFORMED_OFFSET);
  CHECK_NE(string(st.message()).find(":3:"), string::npos) << st;

  string cache = dir + "/bad-offsets.txt";
  CHECK(File::WriteContents(cache, "600\n1535\n1000\n"));
  CHECK_EQ(offsets.ReadCache(cache).code(), MALFORMED_OFFSET);
  CHECK(File::WriteContents(cache, "600\n15x35\n"));
  CHECK_EQ(offsets.ReadCache(cache).code(), MALFORMED_OFFSET);

  // Missing files are I/O errors.
  CHECK(!offsets.Load(dir + "/missing.bz2", dir + "/missing.txt").ok());
  CHECK(!File::Exists(dir + "/missing.txt"));
}

void TestCorruptIndex(const string &dir) {
  string compressed = testing::CompressBZip2("600:10:A\n1535:11:B\n");
  compressed.resize(compressed.size() / 2);
  string index = dir + "/truncated-index.txt.bz2";
  CHECK(File::WriteContents(index, compressed));
  OffsetIndex offsets;
  CHECK(!offsets.ReadIndex(index).ok());
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  string dir = testing::TestDir();
  TestReadIndex(dir);
  TestMalformed(dir);
  TestCorruptIndex(dir);

  LOG(INFO) << "PASS";
  return 0;
}
