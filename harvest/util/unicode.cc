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

#include "harvest/util/unicode.h"

namespace harvest {

int UTF8::Encode(int code, char *s) {
  uint32 c = code;

  if (c <= 0x7f) {
    s[0] = c;
    return 1;
  }

  if (c <= 0x7ff) {
    s[0] = 0xc0 | (c >> 6);
    s[1] = 0x80 | (c & 0x3f);
    return 2;
  }

  if (c <= 0xffff) {
    s[0] = 0xe0 | (c >> 12);
    s[1] = 0x80 | ((c >> 6) & 0x3f);
    s[2] = 0x80 | (c & 0x3f);
    return 3;
  }

  s[0] = 0xf0 | (c >> 18);
  s[1] = 0x80 | ((c >> 12) & 0x3f);
  s[2] = 0x80 | ((c >> 6) & 0x3f);
  s[3] = 0x80 | (c & 0x3f);
  return 4;
}

int UTF8::Encode(int code, string *str) {
  char buf[MAXLEN];
  int len = Encode(code, buf);
  str->append(buf, len);
  return len;
}

}  // namespace harvest
