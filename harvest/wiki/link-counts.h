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

#ifndef HARVEST_WIKI_LINK_COUNTS_H_
#define HARVEST_WIKI_LINK_COUNTS_H_

#include <string>

#include "harvest/base/clock.h"
#include "harvest/base/status.h"
#include "harvest/base/types.h"
#include "harvest/stream/input.h"
#include "harvest/wiki/page-name.h"
#include "harvest/wiki/tuple-parser.h"

namespace harvest {
namespace wiki {

// INSERT statement preambles in the SQL table dumps.
extern const char kLinkTargetPreamble[];
extern const char kPageLinkPreamble[];

// Parser for rows of the linktarget table, i.e. (lt_id, lt_namespace,
// lt_title). Rows in the main namespace whose title is a tracked page are
// added to the link target map.
class LinkTargetParser : public TupleParser {
 public:
  LinkTargetParser(const TrackedPageMap *pages, LinkTargetMap *targets);

  Status Process(const Tuple &tuple) override;

  // Number of rows added to the link target map.
  int64 num_matches() const { return num_matches_; }

 private:
  const TrackedPageMap *pages_;
  LinkTargetMap *targets_;
  int64 num_matches_ = 0;
  Clock clock_;
};

// Parser for rows of the pagelinks table, i.e. (pl_from, pl_from_namespace,
// pl_target_id). Each row whose target is in the link target map counts as
// one inbound link for the target page.
class PageLinkParser : public TupleParser {
 public:
  PageLinkParser(const LinkTargetMap *targets, LinkCountMap *counts);

  Status Process(const Tuple &tuple) override;

  // Number of rows that were counted.
  int64 num_matches() const { return num_matches_; }

 private:
  const LinkTargetMap *targets_;
  LinkCountMap *counts_;
  int64 num_matches_ = 0;
  Clock clock_;
};

// Options for inbound link counting.
struct LinkCountOptions {
  // Compressed SQL dump of the linktarget table.
  string linktargets_dump;

  // Compressed SQL dump of the pagelinks table.
  string pagelinks_dump;

  // Directory for the link target and link count files.
  string output_dir;
};

// Counts inbound links for tracked pages by joining the pagelinks table with
// the linktarget table. Both tables are read as single sequential streams.
// The link target map and the link counts are cached in the output directory
// and reloaded instead of recomputed when the files exist.
class InboundLinkAggregator {
 public:
  explicit InboundLinkAggregator(const LinkCountOptions &options);

  // Build or load the link target map for the tracked pages.
  Status BuildLinkTargets(const TrackedPageMap &pages, LinkTargetMap *targets);

  // Build or load the inbound link counts for the tracked pages. Every
  // tracked page has a count, which is zero if there are no links to it.
  Status CountInboundLinks(const TrackedPageMap &pages, LinkCountMap *counts);

  // Parse link target rows from a SQL dump stream. The stream is skipped up
  // to the first INSERT statement for the table.
  static Status ParseLinkTargets(Input *input, const TrackedPageMap &pages,
                                 LinkTargetMap *targets);

  // Count page link rows from a SQL dump stream. The stream is skipped up to
  // the first INSERT statement for the table.
  static Status ParsePageLinks(Input *input, const LinkTargetMap &targets,
                               LinkCountMap *counts);

  // Output files.
  string linktargets_file() const;
  string counts_file() const;

 private:
  LinkCountOptions options_;
};

}  // namespace wiki
}  // namespace harvest

#endif  // HARVEST_WIKI_LINK_COUNTS_H_
