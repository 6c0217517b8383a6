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

#ifndef HARVEST_BASE_STATUS_H_
#define HARVEST_BASE_STATUS_H_

#include <stdlib.h>
#include <ostream>
#include <string>

#include "harvest/base/logging.h"
#include "harvest/base/types.h"

namespace harvest {

// A Status encapsulates the result of an operation. It may indicate success,
// or it may indicate an error with an error code and an error message.
class Status {
 public:
  // Create a success status.
  Status() : state_(nullptr) {}
  ~Status() { free(state_); }

  // Create an error status.
  Status(int code, const char *msg);
  Status(int code, const string &msg);
  Status(int code, const char *msg1, const char *msg2);
  Status(int code, const char *msg1, const string &msg2);

  Status(const Status &s) : state_(CopyState(s.state_)) {}
  Status(Status &&s) : state_(s.state_) { s.state_ = nullptr; }

  Status &operator=(const Status &s) {
    if (state_ != s.state_) {
      free(state_);
      state_ = CopyState(s.state_);
    }
    return *this;
  }
  Status &operator=(Status &&s) {
    if (this != &s) {
      free(state_);
      state_ = s.state_;
      s.state_ = nullptr;
    }
    return *this;
  }

  // Statuses compare by error code.
  bool operator==(const Status &s) const { return s.code() == code(); }
  bool operator!=(const Status &s) const { return s.code() != code(); }

  // Returns true iff the status indicates success.
  bool ok() const { return state_ == nullptr; }

  // Returns true if status is ok. Otherwise the error is logged, so a status
  // can be checked with CHECK(status).
  operator bool() const {
    if (!ok()) LOG(ERROR) << ToString();
    return ok();
  }

  // Returns "OK" for success or the error code and message.
  string ToString() const;

  // Returns the error code or zero for success.
  int code() const { return state_ == nullptr ? 0 : state_->code; }

  // Returns error message or empty string for success.
  const char *message() const {
    return state_ == nullptr ? "" : state_->message();
  }

  // Success status.
  static const Status &OK;

 private:
  // Error state. The null-terminated message follows the header.
  struct State {
    int length;
    int code;
    char *message() { return reinterpret_cast<char *>(this + 1); }
  };

  // Allocate state for error message of the given length.
  void Allocate(int code, int length);

  static State *CopyState(const State *s);

  // Null for success.
  State *state_;
};

inline std::ostream &operator<<(std::ostream &out, const Status &status) {
  out << status.ToString();
  return out;
}

}  // namespace harvest

#endif  // HARVEST_BASE_STATUS_H_
