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

#ifndef HARVEST_BASE_CLOCK_H_
#define HARVEST_BASE_CLOCK_H_

#include "harvest/base/types.h"

namespace harvest {

// Monotonic wall clock for timing pipeline stages.
class Clock {
 public:
  // Nanoseconds since an arbitrary fixed point.
  typedef int64 Timestamp;

  // Return current timestamp.
  static Timestamp now();

  // Start clock.
  void start() { start_ = now(); }

  // Stop clock.
  void stop() { end_ = now(); }

  // Return nanoseconds elapsed since start.
  Timestamp elapsed() const { return now() - start_; }

  // Return time between start and stop in seconds.
  double secs() const { return (end_ - start_) * 1e-9; }

  // Return time between start and stop in milliseconds.
  double ms() const { return (end_ - start_) * 1e-6; }

  // Return time since start in seconds without stopping the clock.
  double elapsed_secs() const { return elapsed() * 1e-9; }

 private:
  Timestamp start_ = 0;
  Timestamp end_ = 0;
};

}  // namespace harvest

#endif  // HARVEST_BASE_CLOCK_H_
