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

#include "harvest/wiki/page-maps.h"

#include <string>

#include "harvest/base/logging.h"
#include "harvest/file/textmap.h"
#include "harvest/string/numbers.h"
#include "harvest/wiki/errors.h"

namespace harvest {
namespace wiki {

namespace {

string Encode(const PageName &page) { return page.ToKey(); }
string Encode(uint64 value) { return std::to_string(value); }
string Encode(int64 value) { return std::to_string(value); }

bool Decode(const string &text, PageName *page) {
  *page = PageName::FromKey(text);
  return true;
}
bool Decode(const string &text, uint64 *value) {
  return safe_strtou64(text, value);
}
bool Decode(const string &text, int64 *value) {
  return safe_strto64(text, value);
}

template <class Map> Status WriteMap(const string &filename, const Map &map) {
  TextMapOutput output;
  Status st = output.Open(filename);
  if (!st.ok()) return st;
  for (const auto &entry : map) {
    output.Write(Encode(entry.first), Encode(entry.second));
  }
  st = output.Close();
  if (st.ok()) VLOG(1) << "Wrote " << map.size() << " entries to " << filename;
  return st;
}

template <class Map> Status ReadMap(const string &filename, Map *map) {
  TextMapInput input;
  Status st = input.Open(filename);
  if (!st.ok()) return st;
  while (input.Next()) {
    typename Map::key_type key;
    typename Map::mapped_type value;
    if (!Decode(input.key(), &key) || !Decode(input.value(), &value)) {
      return Status(MALFORMED_DUMP,
                    "Invalid entry in " + filename + " line " +
                    std::to_string(input.id() + 1));
    }
    (*map)[key] = value;
  }
  if (!input.status().ok()) return input.status();
  return input.Close();
}

}  // namespace

Status WriteRedirects(const string &filename, const RedirectMap &redirects) {
  return WriteMap(filename, redirects);
}

Status ReadRedirects(const string &filename, RedirectMap *redirects) {
  return ReadMap(filename, redirects);
}

Status WritePageIds(const string &filename, const PageIdMap &ids) {
  return WriteMap(filename, ids);
}

Status ReadPageIds(const string &filename, PageIdMap *ids) {
  return ReadMap(filename, ids);
}

Status WriteLinkTargets(const string &filename, const LinkTargetMap &targets) {
  return WriteMap(filename, targets);
}

Status ReadLinkTargets(const string &filename, LinkTargetMap *targets) {
  return ReadMap(filename, targets);
}

Status WriteLinkCounts(const string &filename, const LinkCountMap &counts) {
  return WriteMap(filename, counts);
}

Status ReadLinkCounts(const string &filename, LinkCountMap *counts) {
  return ReadMap(filename, counts);
}

}  // namespace wiki
}  // namespace harvest
