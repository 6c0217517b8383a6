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
#include "harvest/testing/test-data.h"
#include "harvest/wiki/page-maps.h"
#include "harvest/wiki/page-name.h"
#include "harvest/wiki/timestamp.h"
#include "harvest/wiki/errors.h"

using namespace harvest;
using namespace harvest::wiki;

void TestParse() {
  PageName page = PageName::Parse("United Kingdom");
  CHECK_EQ(page.name, "United Kingdom");
  CHECK(!page.has_heading);
  CHECK_EQ(page.ToString(), "United Kingdom");

  PageName section = PageName::Parse("UK hard house#Scouse house");
  CHECK_EQ(section.name, "UK hard house");
  CHECK(section.has_heading);
  CHECK_EQ(section.heading, "Scouse house");
  CHECK_EQ(section.ToString(), "UK hard house#Scouse house");

  // A page differs from a section of the same page.
  CHECK(PageName("UK hard house") != section);
  CHECK(PageName("UK hard house") < section);
  CHECK(PageName("UK hard house", "") != PageName("UK hard house"));
}

void TestSanitize() {
  std::vector<PageName> pages = {
    PageName("AC/DC"),
    PageName("Mr. Bungle"),
    PageName("Who's Next?"),
    PageName("Paul \"Pee Wee\" Ellis"),
    PageName("Star*Crossed"),
    PageName("Hip hop", "Origins: 1970s"),
    PageName("<|>\\"),
    PageName("Björk"),
    PageName("Why？"),
    PageName("A⧸B"),
    PageName("C#D"),
    PageName("C", "D"),
    PageName("C#D", "E#F"),
    PageName("100%"),
    PageName("%#", "%"),
    PageName("Is it？?"),
    PageName("Song", ""),
  };
  for (const PageName &page : pages) {
    string filename = page.Sanitize();
    CHECK_EQ(filename.find('/'), string::npos) << filename;
    CHECK_EQ(filename.find(':'), string::npos) << filename;
    CHECK_EQ(filename.find('*'), string::npos) << filename;
    CHECK_EQ(filename.find('?'), string::npos) << filename;
    CHECK(PageName::Unsanitize(filename) == page) << page;
  }
  CHECK_EQ(PageName("AC/DC").Sanitize(), "AC⧸DC");

  // Names that differ only in escaped characters get different file names.
  CHECK_NE(PageName("Why？").Sanitize(), PageName("Why?").Sanitize());
  CHECK_NE(PageName("C#D").Sanitize(), PageName("C", "D").Sanitize());
  CHECK_EQ(PageName("C#D").Sanitize(), "C%#D");
  CHECK_EQ(PageName("C", "D").Sanitize(), "C#D");
  CHECK_EQ(PageName("Why？").Sanitize(), "Why%？");
}

void TestKey() {
  CHECK_EQ(PageName("Foo#Bar").ToKey(), "Foo\\#Bar");
  CHECK_EQ(PageName("Foo", "Bar").ToKey(), "Foo#Bar");
  CHECK_EQ(PageName("Foo", "Bar#Baz").ToKey(), "Foo#Bar#Baz");

  std::vector<PageName> pages = {
    PageName("Foo#Bar"),
    PageName("Foo", "Bar"),
    PageName("Back\\slash#", "x"),
    PageName("Trailing\\"),
    PageName("Foo", ""),
    PageName(""),
  };
  for (const PageName &page : pages) {
    CHECK(PageName::FromKey(page.ToKey()) == page) << page;
  }
}

void TestTimestamp() {
  int64 seconds;
  CHECK(ParseTimestamp("2025-01-23T10:15:30Z", &seconds));
  CHECK_EQ(seconds, 1737627330);
  CHECK_EQ(FormatTimestamp(seconds), "2025-01-23T10:15:30Z");
  CHECK(ParseTimestamp("1970-01-01T00:00:00Z", &seconds));
  CHECK_EQ(seconds, 0);

  CHECK_EQ(ParseTimestamp("2025-01-23 10:15:30", &seconds).code(),
           MALFORMED_TIMESTAMP);
  CHECK_EQ(ParseTimestamp("2025-02-30T10:15:30Z", &seconds).code(),
           MALFORMED_TIMESTAMP);
  CHECK_EQ(ParseTimestamp("", &seconds).code(), MALFORMED_TIMESTAMP);
  CHECK(ParseTimestamp("2016-12-31T23:59:59Z", &seconds));
  CHECK_EQ(FormatTimestamp(seconds), "2016-12-31T23:59:59Z");
  CHECK_EQ(ParseTimestamp("2016-12-31T23:59:60Z", &seconds).code(),
           MALFORMED_TIMESTAMP);
}

void TestPageMaps() {
  string dir = testing::TestDir();

  RedirectMap redirects;
  redirects[PageName("UK")] = PageName("United Kingdom");
  redirects[PageName("Scouse house")] = PageName("UK hard house",
                                                 "Scouse house");
  CHECK(WriteRedirects(dir + "/redirects.txt", redirects));
  RedirectMap redirects2;
  CHECK(ReadRedirects(dir + "/redirects.txt", &redirects2));
  CHECK(redirects2 == redirects);

  // A '#' in the name is not a heading separator.
  RedirectMap hashes;
  hashes[PageName("Src")] = PageName("Foo#Bar");
  hashes[PageName("Src#2")] = PageName("Foo", "Bar");
  CHECK(WriteRedirects(dir + "/hashes.txt", hashes));
  RedirectMap hashes2;
  CHECK(ReadRedirects(dir + "/hashes.txt", &hashes2));
  CHECK(hashes2 == hashes);
  CHECK(!hashes2[PageName("Src")].has_heading);
  CHECK_EQ(hashes2[PageName("Src")].name, "Foo#Bar");

  PageIdMap ids;
  ids[12345] = PageName("AC/DC");
  ids[7] = PageName("Tab\tand\nnewline");
  CHECK(WritePageIds(dir + "/page_ids.txt", ids));
  PageIdMap ids2;
  CHECK(ReadPageIds(dir + "/page_ids.txt", &ids2));
  CHECK(ids2 == ids);

  LinkCountMap counts;
  counts[PageName("AC/DC")] = 42;
  counts[PageName("Mr. Bungle")] = 0;
  CHECK(WriteLinkCounts(dir + "/counts.txt", counts));
  LinkCountMap counts2;
  CHECK(ReadLinkCounts(dir + "/counts.txt", &counts2));
  CHECK(counts2 == counts);

  // Missing files are reported as I/O errors.
  Status st = ReadRedirects(dir + "/missing.txt", &redirects2);
  CHECK(!st.ok());
  CHECK_NE(string(st.message()).find("missing.txt"), string::npos);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestParse();
  TestSanitize();
  TestKey();
  TestTimestamp();
  TestPageMaps();

  LOG(INFO) << "PASS";
  return 0;
}
