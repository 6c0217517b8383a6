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

#include "harvest/wiki/link-counts.h"

#include <memory>
#include <string>

#include "harvest/base/logging.h"
#include "harvest/file/file.h"
#include "harvest/stream/file-input.h"
#include "harvest/wiki/page-maps.h"

namespace harvest {
namespace wiki {

const char kLinkTargetPreamble[] = "INSERT INTO `linktarget` VALUES ";
const char kPageLinkPreamble[] = "INSERT INTO `pagelinks` VALUES ";

namespace {

// Progress reporting intervals.
const int64 kLinkTargetReportInterval = 10000000;
const int64 kPageLinkReportInterval = 100000000;

// Schemas for the link tables.
const TupleSchema kLinkTargetSchema{UNSIGNED_FIELD, SIGNED_FIELD, TITLE_FIELD};
const TupleSchema kPageLinkSchema{UNSIGNED_FIELD, UNSIGNED_FIELD,
                                  UNSIGNED_FIELD};

}  // namespace

LinkTargetParser::LinkTargetParser(const TrackedPageMap *pages,
                                   LinkTargetMap *targets)
    : TupleParser(kLinkTargetSchema), pages_(pages), targets_(targets) {
  clock_.start();
}

Status LinkTargetParser::Process(const Tuple &tuple) {
  if (num_tuples() % kLinkTargetReportInterval == 0) {
    LOG(INFO) << num_tuples() << " link targets, " << num_matches_
              << " matches, " << clock_.elapsed_secs() << " secs";
  }

  // Only links to pages in the main namespace are tracked.
  if (tuple.signed_value(1) != 0) return Status::OK;

  PageName page(tuple.string_value(2));
  if (pages_->count(page) == 0) return Status::OK;
  (*targets_)[tuple.unsigned_value(0)] = page;
  num_matches_++;
  return Status::OK;
}

PageLinkParser::PageLinkParser(const LinkTargetMap *targets,
                               LinkCountMap *counts)
    : TupleParser(kPageLinkSchema), targets_(targets), counts_(counts) {
  clock_.start();
}

Status PageLinkParser::Process(const Tuple &tuple) {
  if (num_tuples() % kPageLinkReportInterval == 0) {
    LOG(INFO) << num_tuples() << " page links, " << num_matches_
              << " matches, " << clock_.elapsed_secs() << " secs";
  }

  auto f = targets_->find(tuple.unsigned_value(2));
  if (f == targets_->end()) return Status::OK;
  (*counts_)[f->second]++;
  num_matches_++;
  return Status::OK;
}

InboundLinkAggregator::InboundLinkAggregator(const LinkCountOptions &options)
    : options_(options) {}

string InboundLinkAggregator::linktargets_file() const {
  return options_.output_dir + "/linktargets.txt";
}

string InboundLinkAggregator::counts_file() const {
  return options_.output_dir + "/inbound_link_counts.txt";
}

Status InboundLinkAggregator::ParseLinkTargets(Input *input,
                                               const TrackedPageMap &pages,
                                               LinkTargetMap *targets) {
  Status st = SkipUntilPrefix(input, kLinkTargetPreamble);
  if (!st.ok()) return st;
  LinkTargetParser parser(&pages, targets);
  st = parser.Parse(input);
  if (!st.ok()) return st;
  LOG(INFO) << parser.num_tuples() << " link target rows, "
            << parser.num_matches() << " link targets for tracked pages";
  return Status::OK;
}

Status InboundLinkAggregator::ParsePageLinks(Input *input,
                                             const LinkTargetMap &targets,
                                             LinkCountMap *counts) {
  Status st = SkipUntilPrefix(input, kPageLinkPreamble);
  if (!st.ok()) return st;
  PageLinkParser parser(&targets, counts);
  st = parser.Parse(input);
  if (!st.ok()) return st;
  LOG(INFO) << parser.num_tuples() << " page link rows, "
            << parser.num_matches() << " links to tracked pages";
  return Status::OK;
}

Status InboundLinkAggregator::BuildLinkTargets(const TrackedPageMap &pages,
                                               LinkTargetMap *targets) {
  targets->clear();
  string cache = linktargets_file();
  if (File::Exists(cache)) {
    LOG(INFO) << "Loading link targets from " << cache;
    return ReadLinkTargets(cache, targets);
  }

  LOG(INFO) << "Reading link targets from " << options_.linktargets_dump;
  InputStream *stream;
  Status st = FileInput::Open(options_.linktargets_dump, &stream);
  if (!st.ok()) return st;
  std::unique_ptr<InputStream> owner(stream);
  Input input(stream);
  st = ParseLinkTargets(&input, pages, targets);
  if (!st.ok()) return st;

  st = File::MakeDirs(options_.output_dir);
  if (!st.ok()) return st;
  return WriteLinkTargets(cache, *targets);
}

Status InboundLinkAggregator::CountInboundLinks(const TrackedPageMap &pages,
                                                LinkCountMap *counts) {
  counts->clear();
  string cache = counts_file();
  if (File::Exists(cache)) {
    LOG(INFO) << "Loading inbound link counts from " << cache;
    return ReadLinkCounts(cache, counts);
  }

  LinkTargetMap targets;
  Status st = BuildLinkTargets(pages, &targets);
  if (!st.ok()) return st;

  // Every tracked page has a count, even without any inbound links.
  for (const auto &it : pages) (*counts)[it.first] = 0;

  LOG(INFO) << "Counting page links from " << options_.pagelinks_dump;
  InputStream *stream;
  st = FileInput::Open(options_.pagelinks_dump, &stream);
  if (!st.ok()) return st;
  std::unique_ptr<InputStream> owner(stream);
  Input input(stream);
  st = ParsePageLinks(&input, targets, counts);
  if (!st.ok()) return st;

  return WriteLinkCounts(cache, *counts);
}

}  // namespace wiki
}  // namespace harvest
