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
#include "harvest/wiki/link-counts.h"
#include "harvest/wiki/page-maps.h"

using namespace harvest;
using namespace harvest::wiki;

static const char kLinkTargetDump[] =
    "-- MySQL dump 10.19  Distrib 10.3.38-MariaDB\n"
    "DROP TABLE IF EXISTS `linktarget`;\n"
    "CREATE TABLE `linktarget` (\n"
    "  `lt_id` bigint(20) unsigned NOT NULL AUTO_INCREMENT,\n"
    "  `lt_namespace` int(11) NOT NULL,\n"
    "  `lt_title` varbinary(255) NOT NULL,\n"
    "  PRIMARY KEY (`lt_id`)\n"
    ") ENGINE=InnoDB DEFAULT CHARSET=binary;\n"
    "/*!40000 ALTER TABLE `linktarget` DISABLE KEYS */;\n"
    "INSERT INTO `linktarget` VALUES (1,0,'Mr._Bungle'),(2,1,'Mr._Bungle'),"
    "(3,0,'AC/DC'),(4,0,'Faith_No_More');\n"
    "INSERT INTO `linktarget` VALUES (5,-1,'AC/DC'),(6,0,'Who\\'s_Next');\n"
    "/*!40000 ALTER TABLE `linktarget` ENABLE KEYS */;\n"
    "UNLOCK TABLES;\n";

static const char kPageLinkDump[] =
    "-- MySQL dump 10.19  Distrib 10.3.38-MariaDB\n"
    "CREATE TABLE `pagelinks` (\n"
    "  `pl_from` int(8) unsigned NOT NULL DEFAULT 0,\n"
    "  `pl_from_namespace` int(11) NOT NULL DEFAULT 0,\n"
    "  `pl_target_id` bigint(20) unsigned NOT NULL\n"
    ") ENGINE=InnoDB DEFAULT CHARSET=binary;\n"
    "INSERT INTO `pagelinks` VALUES (10,0,1),(11,0,1),(12,0,3),(13,0,2),"
    "(14,0,4),(15,0,99);\n"
    "INSERT INTO `pagelinks` VALUES (16,4,1),(17,0,6);\n"
    "UNLOCK TABLES;\n";

TrackedPageMap Entities() {
  TrackedPageMap pages;
  pages[PageName("Mr. Bungle")] = "entities/Mr. Bungle.wikitext";
  pages[PageName("AC/DC")] = "entities/AC⧸DC.wikitext";
  pages[PageName("Who's Next")] = "entities/Who's Next.wikitext";
  pages[PageName("Fantômas")] = "entities/Fantômas.wikitext";
  return pages;
}

void TestCounts() {
  string dir = testing::TestDir();
  LinkCountOptions options;
  options.linktargets_dump = dir + "/enwiki-linktarget.sql.gz";
  options.pagelinks_dump = dir + "/enwiki-pagelinks.sql.gz";
  options.output_dir = dir + "/output";
  CHECK(testing::WriteGZipFile(options.linktargets_dump, kLinkTargetDump));
  CHECK(testing::WriteGZipFile(options.pagelinks_dump, kPageLinkDump));

  TrackedPageMap pages = Entities();
  InboundLinkAggregator aggregator(options);
  LinkCountMap counts;
  CHECK(aggregator.CountInboundLinks(pages, &counts));

  // All tracked pages have a count.
  CHECK_EQ(counts.size(), 4);
  CHECK_EQ(counts[PageName("Mr. Bungle")], 3);
  CHECK_EQ(counts[PageName("AC/DC")], 1);
  CHECK_EQ(counts[PageName("Who's Next")], 1);
  CHECK_EQ(counts[PageName("Fantômas")], 0);

  // Link targets for tracked pages in the main namespace are cached.
  CHECK(File::Exists(aggregator.linktargets_file()));
  CHECK(File::Exists(aggregator.counts_file()));
  LinkTargetMap targets;
  CHECK(ReadLinkTargets(aggregator.linktargets_file(), &targets));
  CHECK_EQ(targets.size(), 3);
  CHECK(targets[1] == PageName("Mr. Bungle"));
  CHECK(targets[3] == PageName("AC/DC"));
  CHECK(targets[6] == PageName("Who's Next"));

  // The cached counts are used when the dumps are gone.
  LinkCountOptions cached_options = options;
  cached_options.linktargets_dump = dir + "/missing-linktarget.sql.gz";
  cached_options.pagelinks_dump = dir + "/missing-pagelinks.sql.gz";
  InboundLinkAggregator cached(cached_options);
  LinkCountMap cached_counts;
  CHECK(cached.CountInboundLinks(pages, &cached_counts));
  CHECK(cached_counts == counts);
  LinkTargetMap cached_targets;
  CHECK(cached.BuildLinkTargets(pages, &cached_targets));
  CHECK(cached_targets == targets);
}

void TestErrors() {
  string dir = testing::TestDir();
  TrackedPageMap pages = Entities();

  // SQL dump without INSERT statements for the table.
  LinkCountOptions options;
  options.linktargets_dump = dir + "/linktarget.sql.gz";
  options.pagelinks_dump = dir + "/pagelinks.sql.gz";
  options.output_dir = dir + "/output";
  CHECK(testing::WriteGZipFile(options.linktargets_dump, kPageLinkDump));
  InboundLinkAggregator aggregator(options);
  LinkTargetMap targets;
  CHECK_EQ(aggregator.BuildLinkTargets(pages, &targets).code(),
           MISSING_PREAMBLE);
  CHECK(!File::Exists(aggregator.linktargets_file()));

  // Tuples that do not match the schema.
  CHECK(testing::WriteGZipFile(options.linktargets_dump, kLinkTargetDump));
  CHECK(testing::WriteGZipFile(
      options.pagelinks_dump,
      "INSERT INTO `pagelinks` VALUES (1,0,1),(2,0,'Mr._Bungle');\n"));
  LinkCountMap counts;
  CHECK_EQ(aggregator.CountInboundLinks(pages, &counts).code(),
           UNEXPECTED_TUPLE_BYTE);
  CHECK(!File::Exists(aggregator.counts_file()));

  // Missing dump file.
  options.output_dir = dir + "/other";
  options.linktargets_dump = dir + "/missing.sql.gz";
  InboundLinkAggregator missing(options);
  CHECK(!missing.BuildLinkTargets(pages, &targets).ok());
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestCounts();
  TestErrors();

  LOG(INFO) << "PASS";
  return 0;
}
