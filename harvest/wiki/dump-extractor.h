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

#ifndef HARVEST_WIKI_DUMP_EXTRACTOR_H_
#define HARVEST_WIKI_DUMP_EXTRACTOR_H_

#include <atomic>
#include <string>
#include <vector>

#include "harvest/base/logging.h"
#include "harvest/base/macros.h"
#include "harvest/base/slice.h"
#include "harvest/base/status.h"
#include "harvest/base/types.h"
#include "harvest/wiki/dump-meta.h"
#include "harvest/wiki/page-name.h"

namespace harvest {
namespace wiki {

// Options for extracting pages from a multistream dump.
struct ExtractorOptions {
  // Multistream bz2 dump. The dump date is taken from the file name, e.g.
  // "enwiki-20250123-pages-articles-multistream.xml.bz2".
  string dump;

  // Compressed index for the dump with one "offset:id:title" line per page.
  string index;

  // Output directory. Extracted data is stored in a sub-directory named
  // after the dump date.
  string output_dir;

  // Text markers for topic and entity pages.
  string topic_marker = "nfobox music genre";
  string entity_marker = "nfobox musical artist";

  // Number of worker threads. Zero means one per processor.
  int num_workers = 0;
};

class PageScanner;

// Page data accumulated by one worker.
struct ExtractedPages {
  // Merge pages from another worker. Existing entries are overwritten.
  void Merge(const ExtractedPages &other);

  TrackedPageMap topics;
  TrackedPageMap entities;
  RedirectMap redirects;
  PageIdMap page_ids;

  // Statistics.
  int64 num_pages = 0;
  int64 num_blocks = 0;
  int64 num_bad_redirects = 0;
};

// Extracts topic and entity pages and redirects from a multistream dump. The
// compressed blocks of the dump are decompressed and scanned in parallel by a
// pool of workers. Each worker writes the tracked pages it finds to files in
// the output directory and collects page maps that are merged when all blocks
// have been processed.
//
// The extracted data is cached in the output directory, and if all the
// output files exist, these are loaded instead of scanning the dump again.
class DumpExtractor {
 public:
  explicit DumpExtractor(const ExtractorOptions &options);

  // Extract pages from the dump or load them from the output directory.
  Status Extract();

  // Load redirect map. The redirects are only loaded on demand when the
  // extraction is reloaded from the output directory.
  Status LoadRedirects();

  // Metadata for the dump.
  const DumpMeta &meta() const { return meta_; }

  // Tracked pages mapped to the files with the page text.
  const TrackedPageMap &topics() const { return pages_.topics; }
  const TrackedPageMap &entities() const { return pages_.entities; }

  // Page ids for tracked pages.
  const PageIdMap &page_ids() const { return pages_.page_ids; }

  // Redirects for all pages in the dump. LoadRedirects() must have been
  // called if the extraction was reloaded.
  const RedirectMap &redirects() const {
    CHECK(redirects_loaded_) << "Redirects not loaded";
    return pages_.redirects;
  }

  // Check if the extracted data was loaded from the output directory.
  bool reloaded() const { return reloaded_; }

  // Directory for the extracted data, i.e. <output>/<YYYYMMDD>.
  const string &dump_dir() const { return dump_dir_; }

  // Output files and directories.
  string offsets_file() const { return dump_dir_ + "/offsets.txt"; }
  string meta_file() const { return dump_dir_ + "/meta.txt"; }
  string topics_dir() const { return dump_dir_ + "/topics"; }
  string entities_dir() const { return dump_dir_ + "/entities"; }
  string redirects_file() const { return dump_dir_ + "/redirects.txt"; }
  string page_ids_file() const { return dump_dir_ + "/page_ids.txt"; }

  // File extension for page text files.
  static const char kPageFileExtension[];

 private:
  // Check if all output files from a previous extraction exist.
  bool Cached() const;

  // Load extracted data from the output directory.
  Status Reload();

  // Scan the dump in parallel.
  Status Scan();

  // Worker loop for processing blocks until all blocks have been claimed.
  void Worker(Slice dump, const std::vector<uint64> *offsets,
              ExtractedPages *pages, Status *status);

  // Decompress and scan a block starting at the offset.
  Status ProcessBlock(Slice dump, uint64 offset, ExtractedPages *pages);

  // Process a complete page from the dump.
  Status ProcessPage(const string &title, const string &text,
                     const string &timestamp, const string &id,
                     ExtractedPages *pages);

  // Write page text with header to a file.
  Status WritePage(const string &filename, int64 timestamp, uint64 id,
                   const string &text);

  // Extractor options.
  ExtractorOptions options_;

  // Output directory for the dump.
  string dump_dir_;

  // Dump metadata.
  DumpMeta meta_;

  // Extracted pages.
  ExtractedPages pages_;
  bool redirects_loaded_ = false;
  bool reloaded_ = false;

  // Next block to be claimed by a worker.
  std::atomic<size_t> next_block_{0};

  // Set when a worker has failed. The other workers stop claiming blocks.
  std::atomic<bool> failed_{false};

  // Number of entity pages found so far. Only used for progress reporting.
  std::atomic<int64> num_entities_{0};

  friend class PageScanner;

  DISALLOW_COPY_AND_ASSIGN(DumpExtractor);
};

}  // namespace wiki
}  // namespace harvest

#endif  // HARVEST_WIKI_DUMP_EXTRACTOR_H_
