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

#ifndef HARVEST_WIKI_PAGE_MAPS_H_
#define HARVEST_WIKI_PAGE_MAPS_H_

#include <string>

#include "harvest/base/status.h"
#include "harvest/wiki/page-name.h"

namespace harvest {
namespace wiki {

// Page maps are stored as text map files with one entry per line. Page names
// are written in their text form and ids and counts as decimal numbers.

Status WriteRedirects(const string &filename, const RedirectMap &redirects);
Status ReadRedirects(const string &filename, RedirectMap *redirects);

Status WritePageIds(const string &filename, const PageIdMap &ids);
Status ReadPageIds(const string &filename, PageIdMap *ids);

Status WriteLinkTargets(const string &filename, const LinkTargetMap &targets);
Status ReadLinkTargets(const string &filename, LinkTargetMap *targets);

Status WriteLinkCounts(const string &filename, const LinkCountMap &counts);
Status ReadLinkCounts(const string &filename, LinkCountMap *counts);

}  // namespace wiki
}  // namespace harvest

#endif  // HARVEST_WIKI_PAGE_MAPS_H_
