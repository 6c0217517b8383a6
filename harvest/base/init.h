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

#ifndef HARVEST_BASE_INIT_H_
#define HARVEST_BASE_INIT_H_

namespace harvest {

// Initialize program. Command line flags are parsed and removed from the
// argument list. The program exits if the flags are invalid.
void InitProgram(int *argc, char **argv[]);

}  // namespace harvest

#endif  // HARVEST_BASE_INIT_H_
