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

#include "harvest/wiki/offset-index.h"

#include <memory>
#include <set>
#include <string>

#include "harvest/base/logging.h"
#include "harvest/base/slice.h"
#include "harvest/file/file.h"
#include "harvest/stream/file-input.h"
#include "harvest/stream/input.h"
#include "harvest/string/numbers.h"
#include "harvest/wiki/errors.h"

namespace harvest {
namespace wiki {

static Status MalformedOffset(const string &filename, int64 line,
                              const string &text) {
  return Status(MALFORMED_OFFSET,
                filename + ":" + std::to_string(line) +
                ": invalid offset '" + text + "'");
}

Status OffsetIndex::Load(const string &index_filename,
                         const string &cache_filename) {
  if (File::Exists(cache_filename)) {
    Status st = ReadCache(cache_filename);
    if (st.ok()) {
      LOG(INFO) << "Loaded " << offsets_.size() << " offsets from "
                << cache_filename;
    }
    return st;
  }

  Status st = ReadIndex(index_filename);
  if (!st.ok()) return st;
  LOG(INFO) << "Read " << offsets_.size() << " offsets from "
            << index_filename;
  return WriteCache(cache_filename);
}

Status OffsetIndex::ReadIndex(const string &filename) {
  InputStream *stream;
  Status st = FileInput::Open(filename, &stream);
  if (!st.ok()) return st;
  std::unique_ptr<InputStream> owner(stream);

  std::set<uint64> offsets;
  {
    Input input(stream);
    string line;
    int64 lineno = 0;
    while (input.ReadLine(&line)) {
      lineno++;
      if (line.empty()) continue;
      Slice text(line);
      size_t colon = text.find(':');
      if (colon == Slice::npos) return MalformedOffset(filename, lineno, line);
      Slice field = text.substr(0, colon);
      uint64 offset;
      if (!safe_strtou64(field, &offset)) {
        return MalformedOffset(filename, lineno, field.str());
      }
      offsets.insert(offset);
    }
  }
  st = stream->status();
  if (!st.ok()) return st;

  offsets_.assign(offsets.begin(), offsets.end());
  return Status::OK;
}

Status OffsetIndex::ReadCache(const string &filename) {
  string contents;
  Status st = File::ReadContents(filename, &contents);
  if (!st.ok()) return st;

  offsets_.clear();
  Slice text(contents);
  int64 lineno = 0;
  while (!text.empty()) {
    size_t nl = text.find('\n');
    Slice line = text.substr(0, nl);
    text.remove_prefix(nl == Slice::npos ? text.size() : nl + 1);
    lineno++;
    if (line.empty()) continue;

    uint64 offset;
    if (!safe_strtou64(line, &offset)) {
      return MalformedOffset(filename, lineno, line.str());
    }
    if (!offsets_.empty() && offset <= offsets_.back()) {
      return Status(MALFORMED_OFFSET,
                    filename + ":" + std::to_string(lineno) +
                    ": offsets not in ascending order");
    }
    offsets_.push_back(offset);
  }
  return Status::OK;
}

Status OffsetIndex::WriteCache(const string &filename) const {
  string contents;
  for (uint64 offset : offsets_) {
    contents.append(std::to_string(offset));
    contents.push_back('\n');
  }
  return File::WriteContents(filename, contents);
}

}  // namespace wiki
}  // namespace harvest
