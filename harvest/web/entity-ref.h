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

#ifndef HARVEST_WEB_ENTITY_REF_H_
#define HARVEST_WEB_ENTITY_REF_H_

#include "harvest/base/slice.h"

namespace harvest {

// Parse XML entity reference, e.g. "&amp;", "&#39;", or "&#x2F;". Returns the
// Unicode code point or -1 if the reference is not a valid entity reference.
int ParseEntityRef(Slice ref);

}  // namespace harvest

#endif  // HARVEST_WEB_ENTITY_REF_H_
