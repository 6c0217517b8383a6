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

#include "harvest/web/entity-ref.h"

#include "harvest/string/ctype.h"

namespace harvest {

namespace {

// Predefined XML entities.
struct NamedEntity {
  const char *name;
  int code;
};

const NamedEntity kXMLEntities[] = {
  {"amp", '&'},
  {"lt", '<'},
  {"gt", '>'},
  {"quot", '"'},
  {"apos", '\''},
  {"nbsp", 0xa0},
};

}  // namespace

int ParseEntityRef(Slice ref) {
  if (ref.size() < 3 || ref[0] != '&' || ref[ref.size() - 1] != ';') {
    return -1;
  }
  Slice body = ref.substr(1, ref.size() - 2);

  if (body[0] == '#') {
    // Numeric character reference.
    int code = 0;
    if (body.size() > 2 && (body[1] == 'x' || body[1] == 'X')) {
      for (size_t i = 2; i < body.size(); ++i) {
        char c = body[i];
        if (!ascii_isxdigit(c)) return -1;
        int digit;
        if (c <= '9') {
          digit = c - '0';
        } else if (c >= 'a') {
          digit = c - 'a' + 10;
        } else {
          digit = c - 'A' + 10;
        }
        code = code * 16 + digit;
        if (code > 0x10ffff) return -1;
      }
    } else if (body.size() > 1) {
      for (size_t i = 1; i < body.size(); ++i) {
        if (!ascii_isdigit(body[i])) return -1;
        code = code * 10 + (body[i] - '0');
        if (code > 0x10ffff) return -1;
      }
    } else {
      return -1;
    }
    return code;
  }

  for (const NamedEntity &entity : kXMLEntities) {
    if (body == entity.name) return entity.code;
  }
  return -1;
}

}  // namespace harvest
