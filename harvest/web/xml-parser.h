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

#ifndef HARVEST_WEB_XML_PARSER_H_
#define HARVEST_WEB_XML_PARSER_H_

#include <string>
#include <vector>

#include "harvest/base/status.h"
#include "harvest/base/types.h"
#include "harvest/stream/input.h"

namespace harvest {

// XML attribute with name and value.
struct XMLAttribute {
  XMLAttribute(char *n, char *v) : name(n), value(v) {}
  char *name;
  char *value;
};

// XML element with name and attribute list.
struct XMLElement {
  char *name = nullptr;
  std::vector<XMLAttribute> attrs;

  // Return attribute value or null if the attribute is missing.
  const char *Get(const char *name) const;

  void Clear() {
    name = nullptr;
    attrs.clear();
  }
};

// XML event-driven parser. The XML input is parsed and the callbacks are
// called incrementally as each constituent of the XML input is parsed.
// Subclasses override the callbacks to process the events. A callback that
// returns an error stops the parser and the error is returned from Parse().
//
// In fragment mode the input can be a slice of a larger document, so end tags
// without a matching start tag are skipped and elements left open at the end
// of the input are not an error.
class XMLParser {
 public:
  XMLParser();
  virtual ~XMLParser();

  // Parse XML from input and call callbacks.
  Status Parse(Input *input);

  // Callbacks.
  virtual Status StartElement(const XMLElement &element);
  virtual Status EndElement(const char *name);
  virtual Status Text(const char *str, size_t len);

  // Fragment mode.
  bool fragment() const { return fragment_; }
  void set_fragment(bool fragment) { fragment_ = fragment; }

  // Nesting depth of the current element.
  int depth() const { return stack_.size(); }

 private:
  // Add data to buffer.
  void Add(char ch);
  void AddText(char ch);
  void AddString(const char *text, int len);

  // Read next character from input. Return -1 on end of input.
  int ReadChar() {
    char ch;
    if (!input_->Next(&ch)) return -1;
    if (ch == '\n') line_++;
    return static_cast<uint8>(ch);
  }

  // Skip whitespace.
  int SkipWhitespace(int ch);

  // Read entity reference after '&' and add the decoded character. Returns
  // the next input character.
  int ReadEntityRef(bool text, int terminator);

  // Skip comment after "<!--".
  Status SkipComment();

  // Flush pending text to the Text() callback.
  Status FlushText();

  // Parse tag after '<'.
  Status ParseTag(int *next);

  // Return parse error.
  Status Error(const char *message);

  // Check if character is an XML name character.
  static bool IsNameChar(int ch);

  // Input with XML text.
  Input *input_ = nullptr;

  // Buffer for elements, attributes, and text.
  char *buffer_;
  char *bufptr_;
  char *bufend_;

  // Pointer to current text string.
  char *txtptr_ = nullptr;

  // Line number.
  int line_ = 1;

  // Fragment mode.
  bool fragment_ = false;

  // Current XML element.
  XMLElement element_;

  // Element name stack.
  std::vector<char *> stack_;

  // Entity reference buffer.
  string entref_;
};

}  // namespace harvest

#endif  // HARVEST_WEB_XML_PARSER_H_
