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

#ifndef HARVEST_WIKI_DUMP_META_H_
#define HARVEST_WIKI_DUMP_META_H_

#include <string>

#include "harvest/base/slice.h"
#include "harvest/base/status.h"
#include "harvest/base/types.h"

namespace harvest {
namespace wiki {

// Date of a dump.
struct DumpDate {
  int year = 0;
  int month = 0;
  int day = 0;

  // Date in YYYYMMDD format.
  string ToString() const;

  bool operator==(const DumpDate &other) const {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const DumpDate &other) const { return !(*this == other); }
};

// Dump metadata.
struct DumpMeta {
  // Site domain, e.g. "en.wikipedia.org".
  string domain;

  // Database name, e.g. "enwiki".
  string db_name;

  // Date of the dump.
  DumpDate date;
};

// Parse the dump date from a dump file name. Dump files are named
// <dbname>-<YYYYMMDD>-<kind>, e.g.
// "enwiki-20250123-pages-articles-multistream.xml.bz2".
Status ParseDumpDate(const string &filename, DumpDate *date);

// Scan the compressed header of a multistream dump for the site domain and
// the database name. The header is the region of the dump file before the
// first page block.
Status ScanDumpHeader(Slice header, DumpMeta *meta);

// Read and write dump metadata file.
Status WriteDumpMeta(const string &filename, const DumpMeta &meta);
Status ReadDumpMeta(const string &filename, DumpMeta *meta);

}  // namespace wiki
}  // namespace harvest

#endif  // HARVEST_WIKI_DUMP_META_H_
