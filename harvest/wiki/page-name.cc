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

#include "harvest/wiki/page-name.h"

#include <string.h>
#include <ostream>
#include <string>

namespace harvest {
namespace wiki {

namespace {

// File name substitutions. Each character is replaced by a look-alike
// character outside the ASCII range.
struct Substitution {
  char ch;
  const char *replacement;
};

const Substitution kSubstitutions[] = {
  {'/', "⧸"},   // big solidus
  {'\\', "⧵"},  // reverse solidus operator
  {':', "∶"},   // ratio
  {'*', "✱"},   // heavy asterisk
  {'?', "？"},   // fullwidth question mark
  {'"', "❞"},   // heavy double comma quotation mark
  {'<', "❮"},   // heavy left-pointing angle quotation mark
  {'>', "❯"},   // heavy right-pointing angle quotation mark
  {'|', "❘"},   // light vertical bar
};

// Escape character for file names. It escapes itself, '#' inside the name or
// heading, and literal occurrences of the look-alike characters.
const char kFileEscape = '%';

// Returns the substitution whose replacement starts at the beginning of text.
const Substitution *MatchReplacement(Slice text) {
  if (text.empty() || static_cast<uint8>(text[0]) < 0x80) return nullptr;
  for (const Substitution &s : kSubstitutions) {
    if (text.starts_with(s.replacement)) return &s;
  }
  return nullptr;
}

const Substitution *MatchCharacter(char c) {
  for (const Substitution &s : kSubstitutions) {
    if (s.ch == c) return &s;
  }
  return nullptr;
}

void AppendSanitized(const string &text, string *result) {
  Slice rest(text);
  while (!rest.empty()) {
    char c = rest[0];
    const Substitution *literal = MatchReplacement(rest);
    if (literal != nullptr) {
      size_t len = strlen(literal->replacement);
      result->push_back(kFileEscape);
      result->append(rest.data(), len);
      rest.remove_prefix(len);
      continue;
    }
    const Substitution *sub = MatchCharacter(c);
    if (sub != nullptr) {
      result->append(sub->replacement);
    } else if (c == kFileEscape || c == '#') {
      result->push_back(kFileEscape);
      result->push_back(c);
    } else {
      result->push_back(c);
    }
    rest.remove_prefix(1);
  }
}

// Appends escaped name to key. Only the name needs escaping since the key is
// split at the first unescaped '#'.
void AppendKeyName(const string &name, string *key) {
  for (char c : name) {
    if (c == '\\' || c == '#') key->push_back('\\');
    key->push_back(c);
  }
}

}  // namespace

string PageName::ToString() const {
  if (!has_heading) return name;
  string str;
  str.reserve(name.size() + heading.size() + 1);
  str.append(name);
  str.push_back('#');
  str.append(heading);
  return str;
}

PageName PageName::Parse(Slice text) {
  size_t hash = text.find('#');
  if (hash == Slice::npos) return PageName(text.str());
  return PageName(text.substr(0, hash).str(), text.substr(hash + 1).str());
}

string PageName::ToKey() const {
  string key;
  key.reserve(name.size() + heading.size() + 1);
  AppendKeyName(name, &key);
  if (has_heading) {
    key.push_back('#');
    key.append(heading);
  }
  return key;
}

PageName PageName::FromKey(Slice key) {
  PageName page;
  size_t i = 0;
  while (i < key.size()) {
    char c = key[i++];
    if (c == '\\' && i < key.size()) {
      page.name.push_back(key[i++]);
    } else if (c == '#') {
      page.has_heading = true;
      page.heading = key.substr(i).str();
      break;
    } else {
      page.name.push_back(c);
    }
  }
  return page;
}

bool PageName::operator<(const PageName &other) const {
  int cmp = name.compare(other.name);
  if (cmp != 0) return cmp < 0;
  if (has_heading != other.has_heading) return !has_heading;
  return heading < other.heading;
}

string PageName::Sanitize() const {
  string result;
  result.reserve(name.size() + heading.size() + 1);
  AppendSanitized(name, &result);
  if (has_heading) {
    result.push_back('#');
    AppendSanitized(heading, &result);
  }
  return result;
}

PageName PageName::Unsanitize(Slice filename) {
  PageName page;
  string *text = &page.name;
  Slice rest = filename;
  while (!rest.empty()) {
    char c = rest[0];
    if (c == kFileEscape && rest.size() > 1) {
      Slice escaped = rest.substr(1);
      const Substitution *literal = MatchReplacement(escaped);
      if (literal != nullptr) {
        size_t len = strlen(literal->replacement);
        text->append(escaped.data(), len);
        rest.remove_prefix(len + 1);
        continue;
      }
      if (escaped[0] == kFileEscape || escaped[0] == '#') {
        text->push_back(escaped[0]);
        rest.remove_prefix(2);
        continue;
      }
    }
    if (c == '#' && !page.has_heading) {
      page.has_heading = true;
      text = &page.heading;
      rest.remove_prefix(1);
      continue;
    }
    const Substitution *sub = MatchReplacement(rest);
    if (sub != nullptr) {
      text->push_back(sub->ch);
      rest.remove_prefix(strlen(sub->replacement));
    } else {
      text->push_back(c);
      rest.remove_prefix(1);
    }
  }
  return page;
}

std::ostream &operator<<(std::ostream &os, const PageName &page) {
  return os << page.ToString();
}

}  // namespace wiki
}  // namespace harvest
