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

#ifndef HARVEST_WIKI_OFFSET_INDEX_H_
#define HARVEST_WIKI_OFFSET_INDEX_H_

#include <string>
#include <vector>

#include "harvest/base/status.h"
#include "harvest/base/types.h"

namespace harvest {
namespace wiki {

// The offset index holds the byte positions of the compressed blocks in a
// multistream dump. Each block can be decompressed on its own, so the offsets
// are entry points for processing the dump in parallel.
//
// The index file of the dump has one line per page in the form
// "offset:page id:title" and is itself compressed. The distinct offsets are
// cached in a plain text file with one offset per line.
class OffsetIndex {
 public:
  // Load offsets from the cache file if it exists. Otherwise the offsets are
  // read from the dump index and written to the cache file.
  Status Load(const string &index_filename, const string &cache_filename);

  // Read offsets from the dump index.
  Status ReadIndex(const string &filename);

  // Read offsets from cache file.
  Status ReadCache(const string &filename);

  // Write offsets to cache file.
  Status WriteCache(const string &filename) const;

  // Offsets in ascending order.
  const std::vector<uint64> &offsets() const { return offsets_; }
  size_t size() const { return offsets_.size(); }
  bool empty() const { return offsets_.empty(); }
  uint64 operator[](size_t index) const { return offsets_[index]; }

 private:
  std::vector<uint64> offsets_;
};

}  // namespace wiki
}  // namespace harvest

#endif  // HARVEST_WIKI_OFFSET_INDEX_H_
