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

#include "harvest/base/init.h"

#include <stdlib.h>
#include <string>

#include "harvest/base/flags.h"
#include "harvest/base/logging.h"
#include "harvest/base/types.h"

namespace harvest {

void InitProgram(int *argc, char ***argv) {
  if (*argc > 0) {
    string usage;
    usage.append((*argv)[0]);
    usage.append(" [OPTIONS]\n");
    Flag::SetUsageMessage(usage);
    if (Flag::ParseCommandLineFlags(argc, *argv) != 0) exit(1);
  }
  VLOG(2) << "Program " << (*argv)[0] << " initialized";
}

}  // namespace harvest
