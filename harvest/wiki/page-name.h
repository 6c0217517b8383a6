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

#ifndef HARVEST_WIKI_PAGE_NAME_H_
#define HARVEST_WIKI_PAGE_NAME_H_

#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <unordered_map>

#include "harvest/base/slice.h"
#include "harvest/base/types.h"

namespace harvest {
namespace wiki {

// Name of a wiki page with an optional section heading. A page with a heading
// is a topic defined under a section of a larger page. Identity and ordering
// are by name and heading.
struct PageName {
  PageName() {}
  explicit PageName(const string &name) : name(name) {}
  PageName(const string &name, const string &heading)
      : name(name), heading(heading), has_heading(true) {}

  // Text form of the page name, i.e. "name" or "name#heading".
  string ToString() const;

  // Parse page name from text form. The name is split at the first '#'.
  static PageName Parse(Slice text);

  // Key form used in map files. Like ToString() but '#' and backslash in the
  // name are escaped with a backslash, so a name containing '#' is not read
  // back as a page with a heading.
  string ToKey() const;

  // Parse page name from key form.
  static PageName FromKey(Slice key);

  // Encode page name as a file name. Characters that are not allowed or are
  // ambiguous in file names are replaced by similar looking Unicode
  // characters. Literal look-alike characters, '#' and '%' are escaped with
  // '%', and a bare '#' separates name and heading.
  string Sanitize() const;

  // Decode page name from a file name produced by Sanitize(). This is the
  // exact inverse of Sanitize().
  static PageName Unsanitize(Slice filename);

  bool operator==(const PageName &other) const {
    return name == other.name && has_heading == other.has_heading &&
           heading == other.heading;
  }
  bool operator!=(const PageName &other) const { return !(*this == other); }
  bool operator<(const PageName &other) const;

  string name;
  string heading;
  bool has_heading = false;
};

std::ostream &operator<<(std::ostream &os, const PageName &page);

// Tracked pages with the path of the output file for each page.
typedef std::map<PageName, string> TrackedPageMap;

// Redirects from page to target page.
typedef std::map<PageName, PageName> RedirectMap;

// Page names by numeric page id.
typedef std::map<uint64, PageName> PageIdMap;

// Tracked page names by link target id.
typedef std::unordered_map<uint64, PageName> LinkTargetMap;

// Number of inbound links for each tracked page.
typedef std::map<PageName, int64> LinkCountMap;

}  // namespace wiki
}  // namespace harvest

#endif  // HARVEST_WIKI_PAGE_NAME_H_
