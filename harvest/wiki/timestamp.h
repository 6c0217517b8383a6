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

#ifndef HARVEST_WIKI_TIMESTAMP_H_
#define HARVEST_WIKI_TIMESTAMP_H_

#include <string>

#include "harvest/base/slice.h"
#include "harvest/base/status.h"
#include "harvest/base/types.h"

namespace harvest {
namespace wiki {

// Parse revision timestamp in ISO 8601 format, e.g. "2025-01-23T12:34:56Z",
// into seconds since the epoch. Returns MALFORMED_TIMESTAMP on errors.
Status ParseTimestamp(Slice text, int64 *seconds);

// Format seconds since the epoch as ISO 8601 timestamp in UTC.
string FormatTimestamp(int64 seconds);

}  // namespace wiki
}  // namespace harvest

#endif  // HARVEST_WIKI_TIMESTAMP_H_
