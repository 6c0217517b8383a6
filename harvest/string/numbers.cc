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

#include "harvest/string/numbers.h"

#include <limits>

#include "harvest/string/ctype.h"

namespace harvest {

bool safe_strtou64(Slice str, uint64 *value) {
  if (str.empty()) return false;
  const uint64 max = std::numeric_limits<uint64>::max();
  uint64 result = 0;
  for (char c : str) {
    if (!ascii_isdigit(c)) return false;
    int digit = c - '0';
    if (result > (max - digit) / 10) return false;
    result = result * 10 + digit;
  }
  *value = result;
  return true;
}

bool safe_strto64(Slice str, int64 *value) {
  bool negative = false;
  if (!str.empty() && (str[0] == '-' || str[0] == '+')) {
    negative = str[0] == '-';
    str.remove_prefix(1);
  }
  uint64 magnitude;
  if (!safe_strtou64(str, &magnitude)) return false;
  const uint64 limit = static_cast<uint64>(std::numeric_limits<int64>::max());
  if (negative) {
    if (magnitude > limit + 1) return false;
    *value = magnitude == limit + 1 ? std::numeric_limits<int64>::min()
                                    : -static_cast<int64>(magnitude);
  } else {
    if (magnitude > limit) return false;
    *value = magnitude;
  }
  return true;
}

bool safe_strto32(Slice str, int32 *value) {
  int64 result;
  if (!safe_strto64(str, &result)) return false;
  if (result < std::numeric_limits<int32>::min() ||
      result > std::numeric_limits<int32>::max()) {
    return false;
  }
  *value = result;
  return true;
}

}  // namespace harvest
