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

#ifndef HARVEST_WIKI_TUPLE_PARSER_H_
#define HARVEST_WIKI_TUPLE_PARSER_H_

#include <initializer_list>
#include <string>
#include <vector>

#include "harvest/base/macros.h"
#include "harvest/base/slice.h"
#include "harvest/base/status.h"
#include "harvest/base/types.h"
#include "harvest/stream/input.h"

namespace harvest {
namespace wiki {

// Kinds of fields in SQL tuples.
enum FieldKind {
  UNSIGNED_FIELD,  // decimal digits
  SIGNED_FIELD,    // decimal digits with optional leading '-'
  STRING_FIELD,    // single-quoted string with backslash escapes
  TITLE_FIELD,     // string field where unescaped '_' is decoded as space
};

// Field layout of the tuples in a table.
class TupleSchema {
 public:
  TupleSchema(std::initializer_list<FieldKind> fields) : fields_(fields) {}

  int size() const { return fields_.size(); }
  FieldKind field(int index) const { return fields_[index]; }

  // Check if the field holds a number.
  bool numeric(int index) const {
    return fields_[index] == UNSIGNED_FIELD || fields_[index] == SIGNED_FIELD;
  }

 private:
  std::vector<FieldKind> fields_;
};

// Field values of a parsed tuple.
class Tuple {
 public:
  explicit Tuple(int size) : fields_(size) {}

  // Numeric field values.
  uint64 unsigned_value(int index) const { return fields_[index].magnitude; }
  int64 signed_value(int index) const {
    const Field &f = fields_[index];
    int64 value = f.magnitude;
    return f.negative ? -value : value;
  }

  // Decoded string field value.
  const string &string_value(int index) const { return fields_[index].text; }

 private:
  struct Field {
    uint64 magnitude = 0;
    bool negative = false;
    bool has_digits = false;
    string text;
  };

  std::vector<Field> fields_;

  friend class TupleParser;
};

// Parser for the tuples in the VALUES part of SQL INSERT statements, e.g.
//
//   (1,0,'Foo_bar'),(2,0,'Don\'t_panic');
//
// The input is parsed byte by byte by a state machine that is driven by the
// schema. Bytes outside tuples are skipped, so consecutive INSERT statements
// for the same table can be parsed as one stream. A byte that does not fit
// the schema stops the parser with an UNEXPECTED_TUPLE_BYTE error. Subclasses
// receive each complete tuple through Process().
class TupleParser {
 public:
  explicit TupleParser(const TupleSchema &schema);
  virtual ~TupleParser() = default;

  // Parse tuples until the end of the input.
  Status Parse(Input *input);

  // Called for each complete tuple. An error stops the parser.
  virtual Status Process(const Tuple &tuple) = 0;

  // Number of tuples parsed so far.
  int64 num_tuples() const { return num_tuples_; }

 private:
  // Parser states.
  enum State {
    SEARCHING_FOR_TUPLE_START,  // skipping bytes until '('
    NUMBER,                     // inside numeric field
    STRING_START,               // expecting quote that opens string field
    STRING,                     // inside string field
    STRING_ESCAPE,              // after backslash in string field
    FIELD_END,                  // after quote that closes string field
  };

  // Advance the state machine by one input byte.
  Status Transition(char ch);

  // Start parsing field.
  void StartField(int index);

  // Handle field separator or tuple end after a complete field.
  Status EndField(char ch);

  // Return error for unexpected byte.
  Status Unexpected(char ch) const;

  const TupleSchema &schema_;
  State state_ = SEARCHING_FOR_TUPLE_START;
  int field_ = 0;
  Tuple tuple_;
  int64 num_tuples_ = 0;
  int64 position_ = 0;

  DISALLOW_COPY_AND_ASSIGN(TupleParser);
};

// Skip input until just after the first occurrence of prefix. Returns
// MISSING_PREAMBLE if the input ends before the prefix is found.
Status SkipUntilPrefix(Input *input, Slice prefix);

}  // namespace wiki
}  // namespace harvest

#endif  // HARVEST_WIKI_TUPLE_PARSER_H_
