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

#include "harvest/file/textmap.h"

#include <stdlib.h>
#include <string.h>
#include <string>

#include "harvest/base/logging.h"

namespace harvest {

TextMapInput::TextMapInput(int buffer_size) : buffer_size_(buffer_size) {
  buffer_ = static_cast<char *>(malloc(buffer_size));
  next_ = end_ = buffer_;
}

TextMapInput::~TextMapInput() {
  Status st = Close();
  if (!st.ok()) LOG(ERROR) << "Error closing text map: " << st;
  free(buffer_);
}

Status TextMapInput::Open(const string &filename) {
  CHECK(file_ == nullptr) << "Text map already open";
  next_ = end_ = buffer_;
  id_ = -1;
  status_ = Status::OK;
  return File::Open(filename, "r", &file_);
}

Status TextMapInput::Close() {
  if (file_ == nullptr) return Status::OK;
  Status st = file_->Close();
  file_ = nullptr;
  return st;
}

int TextMapInput::Fill() {
  DCHECK(next_ == end_);
  if (file_ == nullptr || !status_.ok()) return -1;
  uint64 bytes;
  status_ = file_->Read(buffer_, buffer_size_, &bytes);
  if (!status_.ok() || bytes == 0) return -1;
  next_ = buffer_;
  end_ = buffer_ + bytes;
  return static_cast<uchar>(*next_++);
}

int TextMapInput::ReadField(string *field) {
  field->clear();
  int c;
  while ((c = NextChar()) != -1) {
    if (c == '\t' || c == '\n') break;
    if (c == '\\') {
      c = NextChar();
      if (c == -1) break;
      if (c == 't') c = '\t';
      if (c == 'n') c = '\n';
    }
    field->push_back(c);
  }
  return c;
}

bool TextMapInput::Next() {
  int c = ReadField(&key_);
  value_.clear();
  if (c == '\t') c = ReadField(&value_);
  if (c == -1 && key_.empty() && value_.empty()) return false;
  id_++;
  return true;
}

TextMapOutput::TextMapOutput(int buffer_size) {
  buffer_ = static_cast<char *>(malloc(buffer_size));
  next_ = buffer_;
  end_ = buffer_ + buffer_size;
}

TextMapOutput::~TextMapOutput() {
  Status st = Close();
  if (!st.ok()) LOG(ERROR) << "Error closing text map: " << st;
  free(buffer_);
}

Status TextMapOutput::Open(const string &filename) {
  CHECK(file_ == nullptr) << "Text map already open";
  status_ = Status::OK;
  next_ = buffer_;
  return File::Open(filename, "w", &file_);
}

Status TextMapOutput::Close() {
  if (file_ == nullptr) return Status::OK;
  Flush();
  Status st = file_->Close();
  file_ = nullptr;
  return status_.ok() ? st : status_;
}

void TextMapOutput::Flush() {
  if (next_ != buffer_ && status_.ok()) {
    status_ = file_->Write(buffer_, next_ - buffer_);
  }
  next_ = buffer_;
}

void TextMapOutput::Output(const char *data, size_t size) {
  if (size > static_cast<size_t>(end_ - next_)) Flush();
  if (size <= static_cast<size_t>(end_ - next_)) {
    memcpy(next_, data, size);
    next_ += size;
  } else if (status_.ok()) {
    status_ = file_->Write(data, size);
  }
}

void TextMapOutput::OutputEscaped(Slice field) {
  const char *start = field.data();
  const char *end = field.data() + field.size();
  for (const char *p = start; p < end; ++p) {
    const char *escape = nullptr;
    switch (*p) {
      case '\t': escape = "\\t"; break;
      case '\n': escape = "\\n"; break;
      case '\\': escape = "\\\\"; break;
      default: continue;
    }
    Output(start, p - start);
    Output(escape, 2);
    start = p + 1;
  }
  Output(start, end - start);
}

void TextMapOutput::Write(Slice key, Slice value) {
  DCHECK(file_ != nullptr);
  OutputEscaped(key);
  Output("\t", 1);
  OutputEscaped(value);
  Output("\n", 1);
}

void TextMapOutput::Write(Slice key, int64 value) {
  Write(key, std::to_string(value));
}

}  // namespace harvest
