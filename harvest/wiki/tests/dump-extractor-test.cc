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
#include "harvest/testing/test-data.h"
#include "harvest/wiki/dump-extractor.h"
#include "harvest/wiki/errors.h"

using namespace harvest;
using namespace harvest::wiki;

static const char kDumpName[] =
    "enwiki-20250123-pages-articles-multistream.xml.bz2";
static const char kIndexName[] =
    "enwiki-20250123-pages-articles-multistream-index.txt.bz2";

static const char kHeader[] =
    "<mediawiki xmlns=\"http://www.mediawiki.org/xml/export-0.11/\" "
    "version=\"0.11\" xml:lang=\"en\">\n"
    "  <siteinfo>\n"
    "    <sitename>Wikipedia</sitename>\n"
    "    <dbname>enwiki</dbname>\n"
    "    <base>https://en.wikipedia.org/wiki/Main_Page</base>\n"
    "    <generator>MediaWiki 1.44.0-wmf.8</generator>\n"
    "    <case>first-letter</case>\n"
    "  </siteinfo>\n";

static const char kArtistText[] =
    "{{Infobox musical artist\n"
    "| name = Mr. Bungle\n"
    "| genre = [[Avant-garde metal]] & [[Funk metal]]\n"
    "}}\n"
    "'''Mr. Bungle''' was an American band.<ref>Source</ref>\n";

static const char kGenreText[] =
    "{{Infobox music genre\n"
    "| name = Avant-garde metal\n"
    "}}\n"
    "Played by bands with an {{Infobox musical artist}}.\n";

// Escape text for XML.
string Escape(const string &text) {
  string escaped;
  for (char c : text) {
    switch (c) {
      case '&': escaped.append("&amp;"); break;
      case '<': escaped.append("&lt;"); break;
      case '>': escaped.append("&gt;"); break;
      case '"': escaped.append("&quot;"); break;
      default: escaped.push_back(c);
    }
  }
  return escaped;
}

// Return XML for a page. The page id is followed by a revision id and a
// contributor id.
string Page(const string &title, int id, const string &timestamp,
            const string &text) {
  string xml;
  xml.append("  <page>\n");
  xml.append("    <title>" + Escape(title) + "</title>\n");
  xml.append("    <ns>0</ns>\n");
  xml.append("    <id>" + std::to_string(id) + "</id>\n");
  if (text.compare(0, 9, "#REDIRECT") == 0) {
    xml.append("    <redirect title=\"Target\" />\n");
  }
  xml.append("    <revision>\n");
  xml.append("      <id>" + std::to_string(id + 1000000) + "</id>\n");
  xml.append("      <timestamp>" + timestamp + "</timestamp>\n");
  xml.append("      <contributor>\n");
  xml.append("        <username>Editor</username>\n");
  xml.append("        <id>" + std::to_string(id + 2000000) + "</id>\n");
  xml.append("      </contributor>\n");
  xml.append("      <!-- revision comment -->\n");
  xml.append("      <text bytes=\"" + std::to_string(text.size()) +
             "\" xml:space=\"preserve\">" + Escape(text) + "</text>\n");
  xml.append("    </revision>\n");
  xml.append("  </page>\n");
  return xml;
}

// Write a multistream dump with the blocks and an index for it.
void WriteDump(const string &dir, const std::vector<string> &blocks,
               const string &dump_name, const string &index_name) {
  string dump = testing::CompressBZip2(kHeader);
  string index;
  for (size_t i = 0; i < blocks.size(); ++i) {
    index.append(std::to_string(dump.size()) + ":" + std::to_string(i + 1) +
                 ":Page " + std::to_string(i + 1) + "\n");
    dump.append(testing::CompressBZip2(blocks[i]));
  }
  CHECK(File::WriteContents(dir + "/" + dump_name, dump));
  CHECK(File::WriteContents(dir + "/" + index_name,
                            testing::CompressBZip2(index)));
}

ExtractorOptions Options(const string &dir, int workers) {
  ExtractorOptions options;
  options.dump = dir + "/" + kDumpName;
  options.index = dir + "/" + kIndexName;
  options.output_dir = dir + "/output";
  options.num_workers = workers;
  return options;
}

void TestTwoBlocks() {
  string dir = testing::TestDir();
  std::vector<string> blocks = {
    Page("Mr. Bungle", 123, "2025-01-20T08:30:00Z", kArtistText),
    Page("Mister Bungle", 124, "2024-12-01T00:00:00Z",
         "#REDIRECT [[Mr. Bungle]]\n\n{{R from alternative name}}") +
        "</mediawiki>\n",
  };
  WriteDump(dir, blocks, kDumpName, kIndexName);

  DumpExtractor extractor(Options(dir, 2));
  CHECK(extractor.Extract());
  CHECK(!extractor.reloaded());
  CHECK_EQ(extractor.dump_dir(), dir + "/output/20250123");

  const DumpMeta &meta = extractor.meta();
  CHECK_EQ(meta.domain, "en.wikipedia.org");
  CHECK_EQ(meta.db_name, "enwiki");
  CHECK_EQ(meta.date.ToString(), "20250123");

  PageName artist("Mr. Bungle");
  CHECK_EQ(extractor.entities().size(), 1);
  CHECK_EQ(extractor.entities().count(artist), 1);
  CHECK_EQ(extractor.topics().size(), 0);
  CHECK_EQ(extractor.redirects().size(), 1);
  CHECK(extractor.redirects().at(PageName("Mister Bungle")) == artist);

  // Only the page id of the tracked page is recorded.
  CHECK_EQ(extractor.page_ids().size(), 1);
  CHECK(extractor.page_ids().at(123) == artist);

  // The page file has a header line followed by the decoded page text.
  string filename = extractor.entities().at(artist);
  CHECK_EQ(filename, extractor.dump_dir() + "/entities/Mr. Bungle.wikitext");
  string contents;
  CHECK(File::ReadContents(filename, &contents));
  CHECK_EQ(contents, string("{\"timestamp\":\"2025-01-20T08:30:00Z\","
                            "\"id\":123}\n") + kArtistText);

  CHECK(File::Exists(extractor.offsets_file()));
  CHECK(File::Exists(extractor.meta_file()));
  CHECK(File::Exists(extractor.redirects_file()));
  CHECK(File::Exists(extractor.page_ids_file()));

  // A second extraction reloads the output files.
  DumpExtractor reloaded(Options(dir, 1));
  CHECK(reloaded.Extract());
  CHECK(reloaded.reloaded());
  CHECK_EQ(reloaded.meta().domain, "en.wikipedia.org");
  CHECK_EQ(reloaded.meta().db_name, "enwiki");
  CHECK(reloaded.entities() == extractor.entities());
  CHECK(reloaded.topics() == extractor.topics());
  CHECK(reloaded.page_ids() == extractor.page_ids());
  CHECK(reloaded.LoadRedirects());
  CHECK(reloaded.redirects() == extractor.redirects());
}

void TestClassification() {
  string dir = testing::TestDir();
  string ts = "2025-01-10T12:00:00Z";
  std::vector<string> blocks = {
    Page("AC/DC", 200, ts, kArtistText) +
        Page("Avant-garde metal", 201, ts, kGenreText) +
        Page("Talk:AC/DC", 202, ts, kArtistText),
    Page("Template:Infobox musical artist", 203, ts, kArtistText) +
        Page("Bungle", 204, ts, "#REDIRECT [[Mr. Bungle#History]]") +
        Page("Talk:Bungle", 205, ts, "#REDIRECT [[Talk:Mr. Bungle]]") +
        Page("Off wiki", 206, ts, "#REDIRECT [http://example.com/ x]"),
    Page("Funk metal", 207, ts, "Funk metal is a subgenre.") +
        Page("Who's Next?", 208, ts, kArtistText) +
        "</mediawiki>\n",
  };
  WriteDump(dir, blocks, kDumpName, kIndexName);

  // More workers than blocks.
  DumpExtractor extractor(Options(dir, 8));
  CHECK(extractor.Extract());

  // Pages with both markers are topics. Pages outside the main namespace are
  // not tracked.
  CHECK_EQ(extractor.topics().size(), 1);
  CHECK_EQ(extractor.topics().count(PageName("Avant-garde metal")), 1);
  CHECK_EQ(extractor.entities().size(), 2);
  CHECK_EQ(extractor.entities().count(PageName("AC/DC")), 1);
  CHECK_EQ(extractor.entities().count(PageName("Who's Next?")), 1);
  CHECK_EQ(extractor.page_ids().size(), 3);
  CHECK(extractor.page_ids().at(208) == PageName("Who's Next?"));

  // Redirects are collected from all namespaces and invalid redirects are
  // skipped.
  const RedirectMap &redirects = extractor.redirects();
  CHECK_EQ(redirects.size(), 2);
  CHECK(redirects.at(PageName("Bungle")) ==
        PageName("Mr. Bungle", "History"));
  CHECK(redirects.at(PageName("Talk:Bungle")) == PageName("Talk:Mr. Bungle"));

  // Page names are reconstructed from the file names on reload.
  DumpExtractor reloaded(Options(dir, 0));
  CHECK(reloaded.Extract());
  CHECK(reloaded.reloaded());
  CHECK(reloaded.entities() == extractor.entities());
  CHECK(reloaded.topics() == extractor.topics());
}

void TestErrors() {
  string dir = testing::TestDir();
  std::vector<string> blocks = {
    Page("Mr. Bungle", 123, "20 January 2025", kArtistText),
  };
  WriteDump(dir, blocks, kDumpName, kIndexName);
  DumpExtractor extractor(Options(dir, 2));
  Status st = extractor.Extract();
  CHECK_EQ(st.code(), MALFORMED_TIMESTAMP) << st;
  CHECK(!File::Exists(extractor.meta_file()));

  // Index from another dump.
  string other = testing::TestDir();
  WriteDump(other, blocks, kDumpName,
            "enwiki-20250201-pages-articles-multistream-index.txt.bz2");
  ExtractorOptions options = Options(other, 2);
  options.index =
      other + "/enwiki-20250201-pages-articles-multistream-index.txt.bz2";
  DumpExtractor mismatch(options);
  CHECK_EQ(mismatch.Extract().code(), DUMP_DATE_MISMATCH);

  // Dump file without date.
  options.dump = other + "/dump.xml.bz2";
  DumpExtractor undated(options);
  CHECK_EQ(undated.Extract().code(), MALFORMED_DUMP);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestTwoBlocks();
  TestClassification();
  TestErrors();

  LOG(INFO) << "PASS";
  return 0;
}
