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

#include "harvest/wiki/dump-meta.h"

#include <stdio.h>
#include <string.h>
#include <string>

#include "harvest/file/textmap.h"
#include "harvest/stream/bzip2.h"
#include "harvest/stream/input.h"
#include "harvest/stream/memory.h"
#include "harvest/string/ctype.h"
#include "harvest/web/xml-parser.h"
#include "harvest/wiki/errors.h"
#include "harvest/wiki/redirect.h"

namespace harvest {
namespace wiki {

namespace {

// XML parser for the <siteinfo> part of the dump header.
class SiteInfoParser : public XMLParser {
 public:
  SiteInfoParser() { set_fragment(true); }

  Status StartElement(const XMLElement &element) override {
    field_ = nullptr;
    if (strcmp(element.name, "base") == 0) {
      field_ = &base_;
    } else if (strcmp(element.name, "dbname") == 0) {
      field_ = &dbname_;
    }
    return Status::OK;
  }

  Status EndElement(const char *name) override {
    field_ = nullptr;
    return Status::OK;
  }

  Status Text(const char *str, size_t len) override {
    if (field_ != nullptr) field_->append(str, len);
    return Status::OK;
  }

  // URL of the main page, e.g. "https://en.wikipedia.org/wiki/Main_Page".
  const string &base() const { return base_; }

  // Database name.
  const string &dbname() const { return dbname_; }

 private:
  string base_;
  string dbname_;
  string *field_ = nullptr;
};

bool ParseDigits(Slice text, int *value) {
  int result = 0;
  for (char c : text) {
    if (!ascii_isdigit(c)) return false;
    result = result * 10 + (c - '0');
  }
  *value = result;
  return true;
}

}  // namespace

string DumpDate::ToString() const {
  char buf[16];
  snprintf(buf, sizeof(buf), "%04d%02d%02d", year, month, day);
  return buf;
}

Status ParseDumpDate(const string &filename, DumpDate *date) {
  Slice name(filename);
  size_t slash = filename.rfind('/');
  if (slash != string::npos) name.remove_prefix(slash + 1);

  // The date is the second dash-separated component.
  size_t dash = name.find('-');
  if (dash != Slice::npos) {
    Slice digits = name.substr(dash + 1, 8);
    bool terminated = digits.size() == 8 &&
                      (name.size() == dash + 9 || name[dash + 9] == '-' ||
                       name[dash + 9] == '.');
    if (terminated &&
        ParseDigits(digits.substr(0, 4), &date->year) &&
        ParseDigits(digits.substr(4, 2), &date->month) &&
        ParseDigits(digits.substr(6, 2), &date->day) &&
        date->month >= 1 && date->month <= 12 &&
        date->day >= 1 && date->day <= 31) {
      return Status::OK;
    }
  }
  return Status(MALFORMED_DUMP, "No dump date in file name", filename);
}

Status ScanDumpHeader(Slice header, DumpMeta *meta) {
  ArrayInputStream compressed(header);
  BZip2Decompressor decompressor(&compressed, true);
  Input input(&decompressor);
  SiteInfoParser parser;
  Status st = parser.Parse(&input);
  if (!st.ok()) return st;

  Slice domain;
  if (!ExtractDomain(parser.base(), &domain) || domain.empty()) {
    return Status(MALFORMED_DUMP, "No site domain in dump header",
                  parser.base());
  }
  if (parser.dbname().empty()) {
    return Status(MALFORMED_DUMP, "No database name in dump header");
  }
  meta->domain = domain.str();
  meta->db_name = parser.dbname();
  return Status::OK;
}

Status WriteDumpMeta(const string &filename, const DumpMeta &meta) {
  TextMapOutput output;
  Status st = output.Open(filename);
  if (!st.ok()) return st;
  output.Write("domain", meta.domain);
  output.Write("dbname", meta.db_name);
  output.Write("date", meta.date.ToString());
  return output.Close();
}

Status ReadDumpMeta(const string &filename, DumpMeta *meta) {
  TextMapInput input;
  Status st = input.Open(filename);
  if (!st.ok()) return st;
  bool has_date = false;
  while (input.Next()) {
    if (input.key() == "domain") {
      meta->domain = input.value();
    } else if (input.key() == "dbname") {
      meta->db_name = input.value();
    } else if (input.key() == "date") {
      const string &value = input.value();
      has_date = value.size() == 8 &&
                 ParseDigits(Slice(value).substr(0, 4), &meta->date.year) &&
                 ParseDigits(Slice(value).substr(4, 2), &meta->date.month) &&
                 ParseDigits(Slice(value).substr(6, 2), &meta->date.day);
    }
  }
  if (!input.status().ok()) return input.status();
  if (meta->domain.empty() || meta->db_name.empty() || !has_date) {
    return Status(MALFORMED_DUMP, "Incomplete dump metadata", filename);
  }
  return input.Close();
}

}  // namespace wiki
}  // namespace harvest
