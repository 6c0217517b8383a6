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

// Extracts topic and entity pages, redirects, and inbound link counts from
// Wikipedia dumps.

#include <string>

#include "harvest/base/clock.h"
#include "harvest/base/flags.h"
#include "harvest/base/init.h"
#include "harvest/base/logging.h"
#include "harvest/base/types.h"
#include "harvest/wiki/dump-extractor.h"
#include "harvest/wiki/link-counts.h"

harvest::wiki::ExtractorOptions options;

DEFINE_string(dump, "",
              "Multistream bz2 dump with pages and articles");
DEFINE_string(index, "",
              "Compressed index for multistream dump");
DEFINE_string(linktargets, "",
              "Compressed SQL dump of linktarget table");
DEFINE_string(pagelinks, "",
              "Compressed SQL dump of pagelinks table");
DEFINE_string(output, "output",
              "Output directory for extracted data");
DEFINE_int32(threads, options.num_workers,
             "Number of worker threads (0 for one per processor)");
DEFINE_string(topic_marker, options.topic_marker.c_str(),
              "Text marker for topic pages");
DEFINE_string(entity_marker, options.entity_marker.c_str(),
              "Text marker for entity pages");
DEFINE_bool(redirects, true, "Load redirects from previous extraction");

using namespace harvest;
using namespace harvest::wiki;

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);
  if (FLAGS_dump.empty() || FLAGS_index.empty()) {
    LOG(FATAL) << "--dump and --index must be specified";
  }
  Clock clock;
  clock.start();

  // Extract pages from dump.
  options.dump = FLAGS_dump;
  options.index = FLAGS_index;
  options.output_dir = FLAGS_output;
  options.num_workers = FLAGS_threads;
  options.topic_marker = FLAGS_topic_marker;
  options.entity_marker = FLAGS_entity_marker;
  DumpExtractor extractor(options);
  CHECK(extractor.Extract());
  if (FLAGS_redirects) CHECK(extractor.LoadRedirects());

  // Count inbound links for entity pages.
  LinkCountMap counts;
  if (!FLAGS_linktargets.empty() && !FLAGS_pagelinks.empty()) {
    LinkCountOptions link_options;
    link_options.linktargets_dump = FLAGS_linktargets;
    link_options.pagelinks_dump = FLAGS_pagelinks;
    link_options.output_dir = extractor.dump_dir();
    InboundLinkAggregator aggregator(link_options);
    CHECK(aggregator.CountInboundLinks(extractor.entities(), &counts));
  } else {
    LOG(WARNING) << "No link tables, skipping inbound link counts";
  }
  clock.stop();

  const DumpMeta &meta = extractor.meta();
  LOG(INFO) << "Dump " << meta.db_name << " (" << meta.domain << ") from "
            << meta.date.ToString() << (extractor.reloaded() ? " reloaded" : "")
            << " in " << extractor.dump_dir();
  LOG(INFO) << extractor.topics().size() << " topics";
  LOG(INFO) << extractor.entities().size() << " entities";
  LOG(INFO) << extractor.page_ids().size() << " page ids";
  if (FLAGS_redirects) {
    LOG(INFO) << extractor.redirects().size() << " redirects";
  }
  if (!counts.empty()) {
    int64 linked = 0;
    for (const auto &it : counts) {
      if (it.second > 0) linked++;
    }
    LOG(INFO) << linked << " of " << counts.size()
              << " entities have inbound links";
  }
  LOG(INFO) << "Done in " << clock.secs() << " secs";

  return 0;
}
