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

#include "harvest/base/flags.h"

#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <iostream>

DEFINE_bool(help, false, "Print help message");

namespace harvest {

Flag *Flag::head = nullptr;
Flag *Flag::tail = nullptr;

static string usage_message;

static const char *flagtype[] = {"bool", "int32", "int64", "string"};

Flag::Flag(const char *name, Type type, const char *help,
           const char *filename, void *storage)
    : name(name), type(type), help(help), filename(filename),
      storage(storage), next(nullptr) {
  if (head == nullptr) {
    head = tail = this;
  } else {
    tail->next = this;
    tail = this;
  }
}

Flag *Flag::Find(const char *name) {
  for (Flag *f = head; f != nullptr; f = f->next) {
    if (strcmp(name, f->name) == 0) return f;
  }
  return nullptr;
}

void Flag::SetUsageMessage(const string &usage) {
  usage_message = usage;
}

bool Flag::Set(const char *text, bool negated) {
  char *end = nullptr;
  switch (type) {
    case BOOL:
      if (text == nullptr) {
        value<bool>() = !negated;
      } else if (strcasecmp(text, "true") == 0 || strcmp(text, "1") == 0 ||
                 strcasecmp(text, "yes") == 0) {
        value<bool>() = true;
      } else if (strcasecmp(text, "false") == 0 || strcmp(text, "0") == 0 ||
                 strcasecmp(text, "no") == 0) {
        value<bool>() = false;
      } else {
        return false;
      }
      return true;
    case INT32:
      value<int32_t>() = strtol(text, &end, 10);
      break;
    case INT64:
      value<int64_t>() = strtoll(text, &end, 10);
      break;
    case STRING:
      value<string>() = text;
      return true;
  }
  return end != text && *end == '\0';
}

string Flag::ValueAsString() const {
  switch (type) {
    case BOOL: return value<bool>() ? "true" : "false";
    case INT32: return std::to_string(value<int32_t>());
    case INT64: return std::to_string(value<int64_t>());
    case STRING: return "\"" + value<string>() + "\"";
  }
  return "";
}

// Splits argument into flag name and value. The value is null if the argument
// has no '=' part. Returns false if the argument is not a flag.
static bool SplitArgument(char *arg, const char **name, const char **value) {
  *name = nullptr;
  *value = nullptr;
  if (arg == nullptr || arg[0] != '-') return false;
  arg++;
  if (*arg == '-') {
    arg++;
    if (*arg == '\0') return true;
  }
  *name = arg;
  while (*arg != '\0' && *arg != '=') arg++;
  if (*arg == '=') {
    *arg = '\0';
    *value = arg + 1;
  }
  return true;
}

int Flag::ParseCommandLineFlags(int *argc, char **argv) {
  int rc = 0;
  for (int i = 1; i < *argc;) {
    int j = i;
    char *arg = argv[i++];
    const char *name;
    const char *value;
    if (!SplitArgument(arg, &name, &value)) continue;

    // Stop parsing at "--".
    if (name == nullptr) {
      argv[j] = nullptr;
      break;
    }

    // Boolean flags can be negated with a "no" prefix.
    bool negated = false;
    Flag *flag = Find(name);
    if (flag == nullptr && strncmp(name, "no", 2) == 0) {
      flag = Find(name + 2);
      negated = flag != nullptr && flag->type == BOOL;
      if (!negated) flag = nullptr;
    }
    if (flag == nullptr) {
      std::cerr << "Error: unrecognized flag " << arg << "\n"
                << "Try --help for options\n";
      rc = j;
      break;
    }

    if (value == nullptr && flag->type != BOOL) {
      if (i == *argc) {
        std::cerr << "Error: missing value for flag " << arg << " of type "
                  << flagtype[flag->type] << "\n";
        rc = j;
        break;
      }
      value = argv[i++];
    }

    if (!flag->Set(value, negated)) {
      std::cerr << "Error: illegal value for flag " << arg << " of type "
                << flagtype[flag->type] << "\nTry --help for options\n";
      rc = j;
      break;
    }

    // Remove the flag and its value from the argument list.
    while (j < i) argv[j++] = nullptr;
  }

  int j = 1;
  for (int i = 1; i < *argc; i++) {
    if (argv[i] != nullptr) argv[j++] = argv[i];
  }
  *argc = j;

  if (FLAGS_help) {
    PrintHelp();
    exit(0);
  }

  return rc;
}

void Flag::PrintHelp() {
  if (!usage_message.empty()) std::cout << usage_message << "\n";
  if (head == nullptr) return;
  std::cout << "Options:\n";
  for (Flag *f = head; f != nullptr; f = f->next) {
    std::cout << "  --" << f->name << " (" << f->help << ")\n"
              << "        type: " << flagtype[f->type]
              << "  default: " << f->ValueAsString() << "\n";
  }
}

}  // namespace harvest
