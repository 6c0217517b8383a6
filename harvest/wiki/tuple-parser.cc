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

#include "harvest/wiki/tuple-parser.h"

#include <stdio.h>
#include <string>
#include <vector>

#include "harvest/base/logging.h"
#include "harvest/string/ctype.h"
#include "harvest/wiki/errors.h"

namespace harvest {
namespace wiki {

TupleParser::TupleParser(const TupleSchema &schema)
    : schema_(schema), tuple_(schema.size()) {
  CHECK_GT(schema.size(), 0);
}

void TupleParser::StartField(int index) {
  field_ = index;
  Tuple::Field &f = tuple_.fields_[index];
  f.magnitude = 0;
  f.negative = false;
  f.has_digits = false;
  f.text.clear();
  state_ = schema_.numeric(index) ? NUMBER : STRING_START;
}

Status TupleParser::Unexpected(char ch) const {
  char byte[16];
  if (ch >= 32 && ch < 127) {
    snprintf(byte, sizeof(byte), "'%c'", ch);
  } else {
    snprintf(byte, sizeof(byte), "0x%02x", static_cast<uint8>(ch));
  }
  return Status(UNEXPECTED_TUPLE_BYTE,
                "Unexpected byte " + string(byte) + " in field " +
                std::to_string(field_) + " of tuple " +
                std::to_string(num_tuples_ + 1) + " at position " +
                std::to_string(position_));
}

Status TupleParser::EndField(char ch) {
  bool last = field_ == schema_.size() - 1;
  if (ch == ',' && !last) {
    StartField(field_ + 1);
    return Status::OK;
  }
  if (ch == ')' && last) {
    state_ = SEARCHING_FOR_TUPLE_START;
    num_tuples_++;
    return Process(tuple_);
  }
  return Unexpected(ch);
}

Status TupleParser::Transition(char ch) {
  switch (state_) {
    case SEARCHING_FOR_TUPLE_START:
      if (ch == '(') StartField(0);
      return Status::OK;

    case NUMBER: {
      Tuple::Field &f = tuple_.fields_[field_];
      if (ascii_isdigit(ch)) {
        f.magnitude = f.magnitude * 10 + (ch - '0');
        f.has_digits = true;
        return Status::OK;
      }
      if (ch == '-' && schema_.field(field_) == SIGNED_FIELD &&
          !f.negative && !f.has_digits) {
        f.negative = true;
        return Status::OK;
      }
      if (!f.has_digits) return Unexpected(ch);
      return EndField(ch);
    }

    case STRING_START:
      if (ch != '\'') return Unexpected(ch);
      state_ = STRING;
      return Status::OK;

    case STRING: {
      string &text = tuple_.fields_[field_].text;
      if (ch == '\\') {
        state_ = STRING_ESCAPE;
      } else if (ch == '\'') {
        state_ = FIELD_END;
      } else if (ch == '_' && schema_.field(field_) == TITLE_FIELD) {
        text.push_back(' ');
      } else {
        text.push_back(ch);
      }
      return Status::OK;
    }

    case STRING_ESCAPE:
      tuple_.fields_[field_].text.push_back(ch);
      state_ = STRING;
      return Status::OK;

    case FIELD_END:
      return EndField(ch);
  }
  return Unexpected(ch);
}

Status TupleParser::Parse(Input *input) {
  char ch;
  while (input->Next(&ch)) {
    Status st = Transition(ch);
    if (!st.ok()) return st;
    position_++;
  }

  Status st = input->stream()->status();
  if (!st.ok()) return st;
  if (state_ != SEARCHING_FOR_TUPLE_START) {
    return Status(TRUNCATED_TUPLE,
                  "Input ends inside tuple " +
                  std::to_string(num_tuples_ + 1));
  }
  return Status::OK;
}

Status SkipUntilPrefix(Input *input, Slice prefix) {
  // The last bytes read are kept in a circular buffer with the same size as
  // the prefix. The oldest byte is at position head.
  int size = prefix.size();
  if (size == 0) return Status::OK;
  std::vector<char> window(size);
  int filled = 0;
  int head = 0;
  int64 skipped = 0;
  char ch;
  while (input->Next(&ch)) {
    skipped++;
    if (filled < size) {
      window[filled++] = ch;
    } else {
      window[head] = ch;
      head = (head + 1) % size;
    }
    if (filled == size) {
      bool match = true;
      for (int i = 0; i < size; ++i) {
        if (window[(head + i) % size] != prefix[i]) {
          match = false;
          break;
        }
      }
      if (match) {
        VLOG(1) << "Found " << prefix << " after " << skipped << " bytes";
        return Status::OK;
      }
    }
  }

  Status st = input->stream()->status();
  if (!st.ok()) return st;
  return Status(MISSING_PREAMBLE, "Prefix not found in input", prefix.str());
}

}  // namespace wiki
}  // namespace harvest
