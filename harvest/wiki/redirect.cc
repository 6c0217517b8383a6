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

#include "harvest/wiki/redirect.h"

#include <string>

#include "harvest/wiki/errors.h"

namespace harvest {
namespace wiki {

const char kRedirectMarker[] = "#REDIRECT";

namespace {

Status InvalidRedirect(const char *reason) {
  return Status(INVALID_REDIRECT, "Invalid redirect", reason);
}

Status OffWiki(Slice url) {
  return Status(EXTERNAL_LINK_NOT_ON_THIS_WIKI,
                "External link not on this wiki", url.str());
}

// Parse internal link target after "[[".
Status ParseInternalLink(Slice link, PageName *target) {
  size_t end = link.find("]]");
  if (end == Slice::npos) return InvalidRedirect("link not terminated");
  Slice name = link.substr(0, end);
  if (name.empty()) return InvalidRedirect("empty link target");
  *target = PageName::Parse(name);
  return Status::OK;
}

// Parse external link after "[".
Status ParseExternalLink(Slice link, Slice domain, PageName *target) {
  size_t end = link.find(']');
  if (end == Slice::npos) {
    return InvalidRedirect("external link not terminated");
  }
  link = link.substr(0, end);

  // The URL is followed by a space and the link label.
  size_t space = link.find(' ');
  if (space == Slice::npos) {
    return InvalidRedirect("external link has no label");
  }
  Slice url = link.substr(0, space);

  Slice host;
  if (!ExtractDomain(url, &host) || host != domain) return OffWiki(url);

  // Page name is in the title query parameter.
  static const char kTitleParam[] = "title=";
  size_t start = url.find(kTitleParam);
  if (start == Slice::npos) return OffWiki(url);
  start += sizeof(kTitleParam) - 1;
  size_t amp = url.find('&', start);
  if (amp == Slice::npos) return OffWiki(url);
  *target = PageName(url.substr(start, amp - start).str());
  return Status::OK;
}

}  // namespace

bool ExtractDomain(Slice url, Slice *domain) {
  size_t scheme = url.find("://");
  if (scheme == Slice::npos) return false;
  size_t start = scheme + 3;
  size_t end = url.find('/', start);
  if (end == Slice::npos) return false;
  *domain = url.substr(start, end - start);
  return true;
}

Status ParseRedirect(Slice text, Slice domain, PageName *target) {
  size_t internal = text.find("[[");
  size_t external = text.find("[http");
  if (internal == Slice::npos && external == Slice::npos) {
    return InvalidRedirect("no link in redirect");
  }
  if (internal != Slice::npos &&
      (external == Slice::npos || internal < external)) {
    return ParseInternalLink(text.substr(internal + 2), target);
  } else {
    return ParseExternalLink(text.substr(external + 1), domain, target);
  }
}

}  // namespace wiki
}  // namespace harvest
