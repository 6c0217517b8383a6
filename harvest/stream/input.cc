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

#include "harvest/stream/input.h"

#include <string.h>

#include "harvest/base/logging.h"

namespace harvest {

Input::Input(InputStream *stream)
    : current_(nullptr), limit_(nullptr), stream_(stream), done_(false) {}

Input::~Input() {
  // Return unread data to underlying stream.
  if (!done_ && limit_ != current_) stream_->BackUp(limit_ - current_);
}

bool Input::Fill() {
  if (done_) return false;
  const void *data;
  int size;
  do {
    if (!stream_->Next(&data, &size)) {
      done_ = true;
      current_ = limit_ = nullptr;
      return false;
    }
  } while (size == 0);
  current_ = static_cast<const char *>(data);
  limit_ = current_ + size;
  return true;
}

bool Input::Read(char *data, int size) {
  while (size > 0) {
    if (empty() && !Fill()) return false;
    int bytes = limit_ - current_;
    if (bytes > size) bytes = size;
    memcpy(data, current_, bytes);
    current_ += bytes;
    data += bytes;
    size -= bytes;
  }
  return true;
}

bool Input::ReadLine(string *output) {
  output->clear();
  bool found = false;
  for (;;) {
    if (empty() && !Fill()) return found;
    found = true;
    const char *p = current_;
    while (p < limit_) {
      if (*p == '\n') {
        output->append(current_, p - current_);
        current_ = p + 1;
        return true;
      }
      ++p;
    }
    output->append(current_, limit_ - current_);
    current_ = limit_;
  }
}

int Input::Peek() {
  if (empty() && !Fill()) return -1;
  return static_cast<uchar>(*current_);
}

}  // namespace harvest
