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

#ifndef HARVEST_TESTING_TEST_DATA_H_
#define HARVEST_TESTING_TEST_DATA_H_

#include <string>

#include "harvest/base/slice.h"
#include "harvest/base/status.h"
#include "harvest/base/types.h"

namespace harvest {
namespace testing {

// Compress data into a single bzip2 stream.
string CompressBZip2(Slice data);

// Write data to a gzip-compressed file.
Status WriteGZipFile(const string &filename, Slice data);

// Create a new empty temporary directory for test output.
string TestDir();

}  // namespace testing
}  // namespace harvest

#endif  // HARVEST_TESTING_TEST_DATA_H_
