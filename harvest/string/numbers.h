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

#ifndef HARVEST_STRING_NUMBERS_H_
#define HARVEST_STRING_NUMBERS_H_

#include "harvest/base/slice.h"
#include "harvest/base/types.h"

namespace harvest {

// Convert decimal strings to integers. The whole string must be a number
// without surrounding whitespace. Returns false on invalid input or
// overflow.
bool safe_strtou64(Slice str, uint64 *value);
bool safe_strto64(Slice str, int64 *value);
bool safe_strto32(Slice str, int32 *value);

}  // namespace harvest

#endif  // HARVEST_STRING_NUMBERS_H_
