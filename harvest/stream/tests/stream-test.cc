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
#include <vector>

#include "harvest/base/init.h"
#include "harvest/base/logging.h"
#include "harvest/file/file.h"
#include "harvest/stream/bzip2.h"
#include "harvest/stream/file-input.h"
#include "harvest/stream/input.h"
#include "harvest/stream/memory.h"
#include "harvest/testing/test-data.h"

using namespace harvest;

// Read all remaining data from a stream.
string ReadAll(InputStream *stream) {
  string data;
  Input input(stream);
  char ch;
  while (input.Next(&ch)) data.push_back(ch);
  return data;
}

// Generate some compressible text with the given number of lines.
string Lines(const string &prefix, int n) {
  string text;
  for (int i = 0; i < n; ++i) {
    text.append(prefix + " line " + std::to_string(i) + "\n");
  }
  return text;
}

void TestArrayInput() {
  string data = Lines("array", 100);
  StringInputStream stream(data, 64);
  Input input(&stream);
  string line;
  CHECK(input.ReadLine(&line));
  CHECK_EQ(line, "array line 0");
  CHECK_EQ(input.Peek(), 'a');
  int lines = 1;
  string last;
  while (input.ReadLine(&line)) {
    lines++;
    last = line;
  }
  CHECK_EQ(lines, 100);
  CHECK_EQ(last, "array line 99");
  CHECK(line.empty());

  // A final line without newline is returned too.
  string unterminated = "first\nsecond";
  StringInputStream stream2(unterminated, 3);
  Input input2(&stream2);
  CHECK(input2.ReadLine(&line));
  CHECK_EQ(line, "first");
  CHECK(input2.ReadLine(&line));
  CHECK_EQ(line, "second");
  CHECK(!input2.ReadLine(&line));
  CHECK(input.done());
  CHECK(stream.status().ok());
}

void TestBZip2Streams() {
  string first = Lines("first", 1000);
  string second = Lines("second", 2000);
  string dump = testing::CompressBZip2(first);
  size_t offset = dump.size();
  dump.append(testing::CompressBZip2(second));

  // Multi-stream decompression returns both streams.
  {
    StringInputStream compressed(dump, 100);
    BZip2Decompressor decompressor(&compressed, true, 256);
    CHECK_EQ(ReadAll(&decompressor), first + second);
    CHECK(decompressor.status().ok());
    CHECK_EQ(decompressor.ByteCount(), first.size() + second.size());
  }

  // Single-stream decompression stops at the end of the first stream.
  {
    StringInputStream compressed(dump, 100);
    BZip2Decompressor decompressor(&compressed, false, 256);
    CHECK_EQ(ReadAll(&decompressor), first);
    CHECK(decompressor.status().ok());
  }

  // Decompression can start at any stream boundary.
  {
    ArrayInputStream compressed(Slice(dump).substr(offset));
    BZip2Decompressor decompressor(&compressed, false);
    CHECK_EQ(ReadAll(&decompressor), second);
    CHECK(decompressor.status().ok());
  }
}

void TestBZip2Errors() {
  string compressed = testing::CompressBZip2(Lines("truncated", 1000));

  // Truncated stream.
  {
    string truncated = compressed.substr(0, compressed.size() - 10);
    StringInputStream input(truncated);
    BZip2Decompressor decompressor(&input, false);
    ReadAll(&decompressor);
    CHECK(!decompressor.status().ok());
  }

  // Corrupted stream.
  {
    string corrupted = compressed;
    for (size_t i = 20; i < corrupted.size() - 20; i += 7) corrupted[i] ^= 0x55;
    StringInputStream input(corrupted);
    BZip2Decompressor decompressor(&input, false);
    ReadAll(&decompressor);
    CHECK(!decompressor.status().ok());
  }

  // Not compressed at all.
  {
    string text = "this is not bzip2 data";
    StringInputStream input(text);
    BZip2Decompressor decompressor(&input, true);
    CHECK_EQ(ReadAll(&decompressor), "");
    CHECK(!decompressor.status().ok());
  }
}

void TestFileInput() {
  string dir = testing::TestDir();
  string text = Lines("file", 5000);

  std::vector<string> files = {
    dir + "/plain.txt",
    dir + "/compressed.txt.bz2",
    dir + "/compressed.txt.gz",
  };
  CHECK(File::WriteContents(files[0], text));
  CHECK(File::WriteContents(files[1], testing::CompressBZip2(text)));
  CHECK(testing::WriteGZipFile(files[2], text));

  for (const string &filename : files) {
    InputStream *stream;
    CHECK(FileInput::Open(filename, &stream, 1000));
    CHECK_EQ(ReadAll(stream), text) << filename;
    CHECK(stream->status().ok()) << filename;
    delete stream;
  }

  // Truncated gzip file.
  string gz;
  CHECK(File::ReadContents(files[2], &gz));
  CHECK(File::WriteContents(files[2], Slice(gz).substr(0, gz.size() / 2)));
  InputStream *stream;
  CHECK(FileInput::Open(files[2], &stream));
  ReadAll(stream);
  CHECK(!stream->status().ok());
  delete stream;

  // Missing file.
  CHECK(!FileInput::Open(dir + "/missing.gz", &stream).ok());
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestArrayInput();
  TestBZip2Streams();
  TestBZip2Errors();
  TestFileInput();

  LOG(INFO) << "PASS";
  return 0;
}
