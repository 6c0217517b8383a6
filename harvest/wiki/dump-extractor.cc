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

#include "harvest/wiki/dump-extractor.h"

#include <string.h>
#include <string>
#include <vector>

#include "harvest/base/clock.h"
#include "harvest/base/logging.h"
#include "harvest/file/file.h"
#include "harvest/stream/bzip2.h"
#include "harvest/stream/input.h"
#include "harvest/stream/memory.h"
#include "harvest/string/numbers.h"
#include "harvest/util/thread.h"
#include "harvest/web/xml-parser.h"
#include "harvest/wiki/errors.h"
#include "harvest/wiki/offset-index.h"
#include "harvest/wiki/page-maps.h"
#include "harvest/wiki/redirect.h"
#include "harvest/wiki/timestamp.h"

namespace harvest {
namespace wiki {

const char DumpExtractor::kPageFileExtension[] = ".wikitext";

// Entity progress is reported every time this many entities have been found.
static const int64 kEntityReportInterval = 5000;

// Maximum number of bytes of page text shown in warnings.
static const size_t kMaxExcerpt = 200;

// XML parser for the pages in a dump block. The title, text, timestamp, and
// id of each page are collected and the complete page is passed to the
// extractor at the end of the page. A page has several <id> elements and only
// the first one, which is the page id, is used. The revision and contributor
// ids come after it.
class PageScanner : public XMLParser {
 public:
  PageScanner(DumpExtractor *extractor, ExtractedPages *pages)
      : extractor_(extractor), pages_(pages) {
    set_fragment(true);
  }

  Status StartElement(const XMLElement &element) override {
    field_ = nullptr;
    const char *name = element.name;
    if (strcmp(name, "page") == 0) {
      in_page_ = true;
      has_id_ = false;
      title_.clear();
      text_.clear();
      timestamp_.clear();
      id_.clear();
    } else if (!in_page_) {
      return Status::OK;
    } else if (strcmp(name, "title") == 0) {
      field_ = &title_;
    } else if (strcmp(name, "text") == 0) {
      field_ = &text_;
    } else if (strcmp(name, "timestamp") == 0) {
      field_ = &timestamp_;
    } else if (strcmp(name, "id") == 0 && !has_id_) {
      has_id_ = true;
      field_ = &id_;
    }
    return Status::OK;
  }

  Status EndElement(const char *name) override {
    field_ = nullptr;
    if (in_page_ && strcmp(name, "page") == 0) {
      in_page_ = false;
      pages_->num_pages++;
      return extractor_->ProcessPage(title_, text_, timestamp_, id_, pages_);
    }
    return Status::OK;
  }

  Status Text(const char *str, size_t len) override {
    if (field_ != nullptr) field_->append(str, len);
    return Status::OK;
  }

 private:
  DumpExtractor *extractor_;
  ExtractedPages *pages_;

  // Page fields.
  string title_;
  string text_;
  string timestamp_;
  string id_;

  // Field receiving the current text, or null if the text is ignored.
  string *field_ = nullptr;

  bool in_page_ = false;
  bool has_id_ = false;
};

void ExtractedPages::Merge(const ExtractedPages &other) {
  for (const auto &it : other.topics) topics[it.first] = it.second;
  for (const auto &it : other.entities) entities[it.first] = it.second;
  for (const auto &it : other.redirects) redirects[it.first] = it.second;
  for (const auto &it : other.page_ids) page_ids[it.first] = it.second;
  num_pages += other.num_pages;
  num_blocks += other.num_blocks;
  num_bad_redirects += other.num_bad_redirects;
}

DumpExtractor::DumpExtractor(const ExtractorOptions &options)
    : options_(options) {}

Status DumpExtractor::Extract() {
  // The index must belong to the same dump.
  DumpDate date;
  Status st = ParseDumpDate(options_.dump, &date);
  if (!st.ok()) return st;
  DumpDate index_date;
  st = ParseDumpDate(options_.index, &index_date);
  if (!st.ok()) return st;
  if (date != index_date) {
    return Status(DUMP_DATE_MISMATCH,
                  "Dump is from " + date.ToString() + " but index is from " +
                  index_date.ToString());
  }
  meta_.date = date;
  dump_dir_ = options_.output_dir + "/" + date.ToString();

  if (Cached()) return Reload();
  return Scan();
}

bool DumpExtractor::Cached() const {
  return File::Exists(topics_dir()) &&
         File::Exists(entities_dir()) &&
         File::Exists(redirects_file()) &&
         File::Exists(page_ids_file()) &&
         File::Exists(meta_file());
}

// Build tracked page map from the page files in a directory.
static Status LoadPageFiles(const string &dir, TrackedPageMap *pages) {
  std::vector<string> files;
  Status st = File::Match(dir + "/*" + DumpExtractor::kPageFileExtension,
                          &files);
  if (!st.ok()) return st;
  size_t suffix = strlen(DumpExtractor::kPageFileExtension);
  for (const string &filename : files) {
    Slice stem(filename);
    stem.remove_prefix(dir.size() + 1);
    stem.remove_suffix(suffix);
    (*pages)[PageName::Unsanitize(stem)] = filename;
  }
  return Status::OK;
}

Status DumpExtractor::Reload() {
  Clock clock;
  clock.start();
  DumpDate date = meta_.date;
  Status st = ReadDumpMeta(meta_file(), &meta_);
  if (!st.ok()) return st;
  if (meta_.date != date) {
    return Status(DUMP_DATE_MISMATCH, "Dump date does not match metadata in",
                  meta_file());
  }

  pages_ = ExtractedPages();
  st = LoadPageFiles(topics_dir(), &pages_.topics);
  if (!st.ok()) return st;
  st = LoadPageFiles(entities_dir(), &pages_.entities);
  if (!st.ok()) return st;
  st = ReadPageIds(page_ids_file(), &pages_.page_ids);
  if (!st.ok()) return st;
  redirects_loaded_ = false;
  reloaded_ = true;
  clock.stop();

  LOG(INFO) << "Loaded " << pages_.topics.size() << " topics and "
            << pages_.entities.size() << " entities from " << dump_dir_
            << " in " << clock.secs() << " secs";
  return Status::OK;
}

Status DumpExtractor::LoadRedirects() {
  if (redirects_loaded_) return Status::OK;
  Clock clock;
  clock.start();
  pages_.redirects.clear();
  Status st = ReadRedirects(redirects_file(), &pages_.redirects);
  if (!st.ok()) return st;
  redirects_loaded_ = true;
  clock.stop();
  LOG(INFO) << "Loaded " << pages_.redirects.size() << " redirects in "
            << clock.secs() << " secs";
  return Status::OK;
}

Status DumpExtractor::Scan() {
  Clock clock;
  clock.start();
  Status st = File::MakeDirs(topics_dir());
  if (!st.ok()) return st;
  st = File::MakeDirs(entities_dir());
  if (!st.ok()) return st;

  // Get the offsets of the compressed blocks.
  OffsetIndex index;
  st = index.Load(options_.index, offsets_file());
  if (!st.ok()) return st;
  if (index.empty()) {
    return Status(MALFORMED_DUMP, "No offsets in index", options_.index);
  }

  // Map the whole dump into memory. All workers read from the same mapping.
  MappedFile dump;
  st = dump.Open(options_.dump);
  if (!st.ok()) return st;
  if (index.offsets().back() >= dump.size()) {
    return Status(MALFORMED_OFFSET,
                  "Offset " + std::to_string(index.offsets().back()) +
                  " is beyond the end of " + options_.dump);
  }
  LOG(INFO) << "Mapped " << dump.size() << " bytes from " << options_.dump;

  // The header before the first block holds the site information.
  st = ScanDumpHeader(dump.data().substr(0, index[0]), &meta_);
  if (!st.ok()) return st;
  LOG(INFO) << "Dump " << meta_.db_name << " for " << meta_.domain
            << " from " << meta_.date.ToString();

  // Process the blocks in parallel with a private page collection for each
  // worker.
  int num_workers = options_.num_workers;
  if (num_workers <= 0) num_workers = WorkerPool::NumProcessors();
  if (num_workers > static_cast<int>(index.size())) {
    num_workers = index.size();
  }
  std::vector<ExtractedPages> partials(num_workers);
  std::vector<Status> statuses(num_workers);
  next_block_ = 0;
  failed_ = false;
  num_entities_ = 0;

  LOG(INFO) << "Scanning " << index.size() << " blocks with " << num_workers
            << " workers";
  Slice data = dump.data();
  const std::vector<uint64> *offsets = &index.offsets();
  WorkerPool pool;
  pool.Start(num_workers, [&](int i) {
    Worker(data, offsets, &partials[i], &statuses[i]);
  });
  pool.Join();

  for (const Status &status : statuses) {
    if (!status.ok()) return status;
  }
  st = dump.Close();
  if (!st.ok()) return st;

  // Merge the pages from all the workers.
  pages_ = ExtractedPages();
  for (const ExtractedPages &partial : partials) pages_.Merge(partial);
  redirects_loaded_ = true;
  reloaded_ = false;
  clock.stop();

  LOG(INFO) << pages_.num_pages << " pages in " << pages_.num_blocks
            << " blocks scanned in " << clock.secs() << " secs";
  LOG(INFO) << pages_.topics.size() << " topics, "
            << pages_.entities.size() << " entities, "
            << pages_.redirects.size() << " redirects, "
            << pages_.num_bad_redirects << " invalid redirects";

  // Write page maps. The metadata file is written last since it marks the
  // extraction as complete.
  st = WriteRedirects(redirects_file(), pages_.redirects);
  if (!st.ok()) return st;
  st = WritePageIds(page_ids_file(), pages_.page_ids);
  if (!st.ok()) return st;
  return WriteDumpMeta(meta_file(), meta_);
}

void DumpExtractor::Worker(Slice dump, const std::vector<uint64> *offsets,
                           ExtractedPages *pages, Status *status) {
  while (!failed_) {
    size_t block = next_block_++;
    if (block >= offsets->size()) break;
    uint64 offset = (*offsets)[block];
    Status st = ProcessBlock(dump, offset, pages);
    if (!st.ok()) {
      *status = Status(st.code(), "Block at offset " + std::to_string(offset) +
                                  ": " + st.message());
      failed_ = true;
      break;
    }
    pages->num_blocks++;
  }
}

Status DumpExtractor::ProcessBlock(Slice dump, uint64 offset,
                                   ExtractedPages *pages) {
  // The block is decompressed from the offset to the end of the file, but the
  // decompressor stops at the end of the first compressed stream.
  ArrayInputStream compressed(dump.substr(offset));
  BZip2Decompressor decompressor(&compressed, false);
  Input input(&decompressor);
  PageScanner scanner(this, pages);
  return scanner.Parse(&input);
}

Status DumpExtractor::ProcessPage(const string &title, const string &text,
                                  const string &timestamp, const string &id,
                                  ExtractedPages *pages) {
  PageName page(title);

  // Redirects are collected for all pages.
  if (IsRedirect(text)) {
    PageName target;
    Status st = ParseRedirect(text, meta_.domain, &target);
    if (st.ok()) {
      pages->redirects[page] = target;
    } else {
      LOG(WARNING) << "Skipping redirect from " << page << ": "
                   << st.message() << ": " << text.substr(0, kMaxExcerpt);
      pages->num_bad_redirects++;
    }
    return Status::OK;
  }

  // Pages with both markers are topics.
  bool topic = text.find(options_.topic_marker) != string::npos;
  bool entity = !topic && text.find(options_.entity_marker) != string::npos;
  if (!topic && !entity) return Status::OK;

  // Only pages in the main namespace are tracked.
  if (title.find(':') != string::npos) return Status::OK;

  int64 seconds;
  Status st = ParseTimestamp(timestamp, &seconds);
  if (!st.ok()) {
    return Status(st.code(), "Page " + title + ": " + st.message());
  }
  uint64 page_id;
  if (!safe_strtou64(id, &page_id)) {
    return Status(MALFORMED_DUMP, "Page " + title + ": invalid page id '" +
                                  id + "'");
  }

  string dir = topic ? topics_dir() : entities_dir();
  string filename = dir + "/" + page.Sanitize() + kPageFileExtension;
  st = WritePage(filename, seconds, page_id, text);
  if (!st.ok()) return st;

  pages->page_ids[page_id] = page;
  if (topic) {
    pages->topics[page] = filename;
    LOG(INFO) << "Topic: " << page;
  } else {
    pages->entities[page] = filename;
    int64 n = num_entities_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (n % kEntityReportInterval == 0) LOG(INFO) << n << " entities";
  }
  return Status::OK;
}

Status DumpExtractor::WritePage(const string &filename, int64 timestamp,
                                uint64 id, const string &text) {
  string contents = "{\"timestamp\":\"" + FormatTimestamp(timestamp) +
                    "\",\"id\":" + std::to_string(id) + "}\n";
  contents.append(text);
  return File::WriteContents(filename, contents);
}

}  // namespace wiki
}  // namespace harvest
