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

#ifndef HARVEST_WIKI_ERRORS_H_
#define HARVEST_WIKI_ERRORS_H_

namespace harvest {
namespace wiki {

// Error codes for Status values returned by the dump extraction stages. I/O
// errors use the errno value as error code.
enum ErrorCode {
  // Redirect page without a parsable link target. Recoverable per page.
  INVALID_REDIRECT = 1000,

  // Redirect to an external link outside this wiki. Recoverable per page.
  EXTERNAL_LINK_NOT_ON_THIS_WIKI = 1001,

  // INSERT statement preamble not found in SQL dump.
  MISSING_PREAMBLE = 1002,

  // Page revision timestamp cannot be parsed.
  MALFORMED_TIMESTAMP = 1003,

  // Byte in SQL tuple that does not match the table schema.
  UNEXPECTED_TUPLE_BYTE = 1004,

  // SQL dump ends in the middle of a tuple.
  TRUNCATED_TUPLE = 1005,

  // Offset index or offset cache line cannot be parsed.
  MALFORMED_OFFSET = 1006,

  // Dump header or output artifact is missing required information.
  MALFORMED_DUMP = 1007,

  // Dump file and index file are from different dump dates.
  DUMP_DATE_MISMATCH = 1008,
};

}  // namespace wiki
}  // namespace harvest

#endif  // HARVEST_WIKI_ERRORS_H_
