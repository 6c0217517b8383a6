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

#include "harvest/web/xml-parser.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <string>

#include "harvest/base/logging.h"
#include "harvest/string/ctype.h"
#include "harvest/util/unicode.h"
#include "harvest/web/entity-ref.h"

namespace harvest {

// Entity references longer than this are passed through as text.
static const int kMaxEntityRefLength = 32;

const char *XMLElement::Get(const char *name) const {
  for (const XMLAttribute &attr : attrs) {
    if (strcmp(attr.name, name) == 0) return attr.value;
  }
  return nullptr;
}

XMLParser::XMLParser() {
  buffer_ = bufptr_ = static_cast<char *>(malloc(4096));
  bufend_ = buffer_ + 4096;
}

XMLParser::~XMLParser() {
  free(buffer_);
}

void XMLParser::Add(char ch) {
  if (bufptr_ < bufend_) {
    *bufptr_++ = ch;
    return;
  }

  // No more room in buffer, expand it.
  size_t buflen = bufend_ - buffer_;
  size_t newlen = buflen * 2;
  char *newbuf = static_cast<char *>(realloc(buffer_, newlen));
  CHECK(newbuf != nullptr);

  // If the buffer has been moved to a new location, adjust pointers.
  if (newbuf != buffer_) {
    ptrdiff_t offset = newbuf - buffer_;
    bufptr_ += offset;
    if (txtptr_) txtptr_ += offset;
    if (element_.name) element_.name += offset;
    for (XMLAttribute &attr : element_.attrs) {
      if (attr.name) attr.name += offset;
      if (attr.value) attr.value += offset;
    }
    for (char *&t : stack_) t += offset;
    buffer_ = newbuf;
  }
  bufend_ = buffer_ + newlen;

  *bufptr_++ = ch;
}

void XMLParser::AddText(char ch) {
  if (!txtptr_) txtptr_ = bufptr_;
  Add(ch);
}

void XMLParser::AddString(const char *text, int len) {
  for (int i = 0; i < len; ++i) Add(text[i]);
}

bool XMLParser::IsNameChar(int ch) {
  if (ch < 0) return false;
  return ascii_isalnum(ch) || ch == ':' || ch == '-' || ch == '_' ||
         ch == '.';
}

int XMLParser::SkipWhitespace(int ch) {
  while (ch >= 0 && ascii_isspace(ch)) ch = ReadChar();
  return ch;
}

Status XMLParser::Error(const char *message) {
  return Status(EBADMSG, "XML parse error line " + std::to_string(line_) +
                ": " + message);
}

int XMLParser::ReadEntityRef(bool text, int terminator) {
  entref_.assign(1, '&');
  int ch = ReadChar();
  while (ch >= 0 && ch != ';' && ch != '<' && ch != '&' && ch != terminator &&
         static_cast<int>(entref_.size()) < kMaxEntityRefLength) {
    entref_.push_back(ch);
    ch = ReadChar();
  }

  int code = -1;
  if (ch == ';') {
    entref_.push_back(';');
    code = ParseEntityRef(entref_);
    ch = ReadChar();
  }

  if (code >= 0) {
    char utf[UTF8::MAXLEN];
    int len = UTF8::Encode(code, utf);
    for (int i = 0; i < len; ++i) text ? AddText(utf[i]) : Add(utf[i]);
  } else {
    // Pass invalid entity reference through unchanged.
    for (char c : entref_) text ? AddText(c) : Add(c);
  }
  return ch;
}

Status XMLParser::FlushText() {
  if (txtptr_ == nullptr) return Status::OK;
  size_t len = bufptr_ - txtptr_;
  Add(0);
  Status st = Text(txtptr_, len);
  bufptr_ = txtptr_;
  txtptr_ = nullptr;
  return st;
}

Status XMLParser::SkipComment() {
  int dashes = 0;
  for (;;) {
    int ch = ReadChar();
    if (ch < 0) return Error("comment not terminated");
    if (ch == '-') {
      dashes++;
    } else if (ch == '>' && dashes >= 2) {
      return Status::OK;
    } else {
      dashes = 0;
    }
  }
}

Status XMLParser::ParseTag(int *next) {
  int ch = ReadChar();

  // Comments and other markup declarations.
  if (ch == '!') {
    ch = ReadChar();
    if (ch == '-') {
      ch = ReadChar();
      if (ch == '-') {
        Status st = SkipComment();
        if (!st.ok()) return st;
        *next = ReadChar();
        return Status::OK;
      }
      AddText('<');
      AddText('!');
      AddText('-');
    } else {
      AddText('<');
      AddText('!');
    }
    *next = ch;
    return Status::OK;
  }

  bool pi = false;
  bool endtag = false;
  bool single = false;
  if (ch == '/') {
    endtag = true;
    ch = ReadChar();
  } else if (ch == '?') {
    pi = true;
    ch = ReadChar();
  }

  // Read tag name.
  ch = SkipWhitespace(ch);
  element_.name = bufptr_;
  while (IsNameChar(ch)) {
    Add(ch);
    ch = ReadChar();
  }
  Add(0);
  if (!*element_.name) return Error("element name missing");
  ch = SkipWhitespace(ch);

  // Read attributes.
  while (IsNameChar(ch)) {
    int n = element_.attrs.size();
    element_.attrs.emplace_back(bufptr_, nullptr);
    while (IsNameChar(ch)) {
      Add(ch);
      ch = ReadChar();
    }
    Add(0);

    ch = SkipWhitespace(ch);
    if (ch != '=') return Error("'=' expected after attribute name");
    ch = SkipWhitespace(ReadChar());
    if (ch != '"' && ch != '\'') {
      return Error("quote expected before attribute value");
    }
    int quote = ch;
    ch = ReadChar();

    element_.attrs[n].value = bufptr_;
    while (ch != quote) {
      if (ch < 0) return Error("attribute value not terminated");
      if (ch == '&') {
        ch = ReadEntityRef(false, quote);
      } else {
        Add(ch);
        ch = ReadChar();
      }
    }
    Add(0);
    ch = SkipWhitespace(ReadChar());
  }

  // Process end of tag after attributes.
  if (pi) {
    if (ch != '?') {
      return Error("'?' expected to terminate processing instruction");
    }
    ch = ReadChar();
  } else if (ch == '/') {
    single = true;
    ch = ReadChar();
  }
  ch = SkipWhitespace(ch);
  if (ch != '>') return Error("'>' expected to terminate element");
  *next = ReadChar();

  Status st;
  if (pi) {
    // Processing instructions are ignored.
    bufptr_ = element_.name;
  } else if (endtag) {
    if (!element_.attrs.empty()) {
      return Error("attributes not allowed in end tag");
    }
    if (stack_.empty()) {
      if (!fragment_) return Error("unmatched end tag");
      bufptr_ = element_.name;
    } else {
      char *starttag = stack_.back();
      if (strcmp(element_.name, starttag) != 0) {
        return Error("end tag name does not match start tag");
      }
      stack_.pop_back();
      st = EndElement(element_.name);
      bufptr_ = starttag;
    }
  } else if (single) {
    st = StartElement(element_);
    if (st.ok()) st = EndElement(element_.name);
    bufptr_ = element_.name;
  } else {
    stack_.push_back(element_.name);
    st = StartElement(element_);

    // Keep element name used by stack, but release attributes.
    if (!element_.attrs.empty()) bufptr_ = element_.attrs[0].name;
  }
  element_.Clear();
  return st;
}

Status XMLParser::Parse(Input *input) {
  input_ = input;
  bufptr_ = buffer_;
  txtptr_ = nullptr;
  line_ = 1;
  element_.Clear();
  stack_.clear();

  int ch = ReadChar();
  while (ch >= 0) {
    if (ch == '&') {
      ch = ReadEntityRef(true, -1);
    } else if (ch != '<') {
      AddText(ch);
      ch = ReadChar();
    } else {
      Status st = FlushText();
      if (!st.ok()) return st;
      st = ParseTag(&ch);
      if (!st.ok()) return st;
    }
  }

  Status st = FlushText();
  if (!st.ok()) return st;

  // Check for unmatched tags.
  if (!stack_.empty() && !fragment_) return Error("end tag missing");

  return input_->stream()->status();
}

Status XMLParser::StartElement(const XMLElement &element) {
  return Status::OK;
}

Status XMLParser::EndElement(const char *name) {
  return Status::OK;
}

Status XMLParser::Text(const char *str, size_t len) {
  return Status::OK;
}

}  // namespace harvest
