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

#include "harvest/wiki/timestamp.h"

#include <time.h>
#include <string>

#include "harvest/string/ctype.h"
#include "harvest/wiki/errors.h"

namespace harvest {
namespace wiki {

namespace {

// Parse fixed-width decimal field.
bool ParseField(Slice text, int pos, int width, int *value) {
  int result = 0;
  for (int i = pos; i < pos + width; ++i) {
    if (!ascii_isdigit(text[i])) return false;
    result = result * 10 + (text[i] - '0');
  }
  *value = result;
  return true;
}

int DaysInMonth(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  return month == 2 && leap ? 29 : days[month - 1];
}

}  // namespace

Status ParseTimestamp(Slice text, int64 *seconds) {
  // YYYY-MM-DDTHH:MM:SSZ
  int year, month, day, hour, min, sec;
  bool valid = text.size() == 20 &&
               text[4] == '-' && text[7] == '-' && text[10] == 'T' &&
               text[13] == ':' && text[16] == ':' && text[19] == 'Z' &&
               ParseField(text, 0, 4, &year) &&
               ParseField(text, 5, 2, &month) &&
               ParseField(text, 8, 2, &day) &&
               ParseField(text, 11, 2, &hour) &&
               ParseField(text, 14, 2, &min) &&
               ParseField(text, 17, 2, &sec);
  valid = valid && month >= 1 && month <= 12 &&
          day >= 1 && day <= DaysInMonth(year, month) &&
          hour <= 23 && min <= 59 && sec <= 59;
  if (!valid) {
    return Status(MALFORMED_TIMESTAMP, "Malformed timestamp", text.str());
  }

  struct tm tm = {};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = min;
  tm.tm_sec = sec;
  *seconds = timegm(&tm);
  return Status::OK;
}

string FormatTimestamp(int64 seconds) {
  time_t t = seconds;
  struct tm tm;
  gmtime_r(&t, &tm);
  char buf[32];
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

}  // namespace wiki
}  // namespace harvest
