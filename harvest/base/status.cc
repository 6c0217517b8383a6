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

#include "harvest/base/status.h"

#include <stdlib.h>
#include <string.h>
#include <string>

namespace harvest {

const Status &Status::OK = Status();

Status::State *Status::CopyState(const State *s) {
  if (s == nullptr) return nullptr;
  size_t size = sizeof(State) + s->length + 1;
  State *result = static_cast<State *>(malloc(size));
  CHECK(result != nullptr);
  memcpy(result, s, size);
  return result;
}

void Status::Allocate(int code, int length) {
  DCHECK_NE(code, 0);
  state_ = static_cast<State *>(malloc(sizeof(State) + length + 1));
  CHECK(state_ != nullptr);
  state_->length = length;
  state_->code = code;
}

Status::Status(int code, const char *msg) {
  int length = strlen(msg);
  Allocate(code, length);
  memcpy(state_->message(), msg, length + 1);
}

Status::Status(int code, const string &msg) {
  Allocate(code, msg.size());
  memcpy(state_->message(), msg.c_str(), msg.size() + 1);
}

Status::Status(int code, const char *msg1, const char *msg2) {
  int length1 = strlen(msg1);
  int length2 = strlen(msg2);
  Allocate(code, length1 + length2 + 2);
  char *msg = state_->message();
  memcpy(msg, msg1, length1);
  msg[length1] = ':';
  msg[length1 + 1] = ' ';
  memcpy(msg + length1 + 2, msg2, length2 + 1);
}

Status::Status(int code, const char *msg1, const string &msg2)
    : Status(code, msg1, msg2.c_str()) {}

string Status::ToString() const {
  if (state_ == nullptr) return "OK";
  return "ERROR " + std::to_string(state_->code) + " : " + state_->message();
}

}  // namespace harvest
