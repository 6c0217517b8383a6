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

#ifndef HARVEST_UTIL_UNICODE_H_
#define HARVEST_UTIL_UNICODE_H_

#include <string>

#include "harvest/base/types.h"

namespace harvest {

// UTF-8 encoding.
class UTF8 {
 public:
  // Maximum length of UTF-8 encoded code point.
  static const int MAXLEN = 4;

  // Encode code point as UTF-8 into buffer. Returns number of bytes.
  static int Encode(int code, char *s);

  // Append UTF-8 encoding of code point to string. Returns number of bytes.
  static int Encode(int code, string *str);
};

}  // namespace harvest

#endif  // HARVEST_UTIL_UNICODE_H_
