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

#ifndef HARVEST_WIKI_REDIRECT_H_
#define HARVEST_WIKI_REDIRECT_H_

#include "harvest/base/slice.h"
#include "harvest/base/status.h"
#include "harvest/wiki/page-name.h"

namespace harvest {
namespace wiki {

// Directive at the start of the text of redirect pages.
extern const char kRedirectMarker[];

// Check if page text is a redirect.
inline bool IsRedirect(Slice text) {
  return text.starts_with(kRedirectMarker);
}

// Extract the host name from a URL, i.e. the text between "://" and the next
// '/'. Returns false if the URL has no host part.
bool ExtractDomain(Slice url, Slice *domain);

// Parse the target of a redirect page. The target is the first internal link
// ([[name]] or [[name#heading]]) or the first external link
// ([http://domain/...?title=name&... label]) in the text, whichever comes
// first. An internal link that follows an external link is not considered,
// even if the external link is rejected. External links must point to a page
// on the wiki with the given domain. Returns INVALID_REDIRECT or
// EXTERNAL_LINK_NOT_ON_THIS_WIKI if no target can be found.
Status ParseRedirect(Slice text, Slice domain, PageName *target);

}  // namespace wiki
}  // namespace harvest

#endif  // HARVEST_WIKI_REDIRECT_H_
