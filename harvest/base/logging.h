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

#ifndef HARVEST_BASE_LOGGING_H_
#define HARVEST_BASE_LOGGING_H_

#include <sstream>
#include <limits>

#include "harvest/base/macros.h"
#include "harvest/base/types.h"

namespace harvest {

const int INFO = 0;
const int WARNING = 1;
const int ERROR = 2;
const int FATAL = 3;
const int NUM_SEVERITIES = 4;

// A log message is collected in a string stream and written as one line to
// stderr when the message goes out of scope.
class LogMessage : public std::basic_ostringstream<char> {
 public:
  LogMessage(const char *fname, int line, int severity);
  ~LogMessage();

  // Minimum severity for LOG statements.
  static int log_level();

  // Minimum log level for VLOG statements.
  static int vlog_level();

 protected:
  void GenerateLogMessage();

 private:
  const char *fname_;
  int line_;
  int severity_;
};

// Fatal log messages terminate the program after the message is written.
class LogMessageFatal : public LogMessage {
 public:
  LogMessageFatal(const char *file, int line) HARVEST_ATTRIBUTE_COLD;
  HARVEST_ATTRIBUTE_NORETURN ~LogMessageFatal();
};

#define _LOG_INFO ::harvest::LogMessage(__FILE__, __LINE__, ::harvest::INFO)
#define _LOG_WARNING \
  ::harvest::LogMessage(__FILE__, __LINE__, ::harvest::WARNING)
#define _LOG_ERROR ::harvest::LogMessage(__FILE__, __LINE__, ::harvest::ERROR)
#define _LOG_FATAL ::harvest::LogMessageFatal(__FILE__, __LINE__)

#define LOG(severity) _LOG_##severity

#define VLOG_IS_ON(level) ((level) <= ::harvest::LogMessage::vlog_level())

#define VLOG(level)                     \
  if (PREDICT_FALSE(VLOG_IS_ON(level))) \
    ::harvest::LogMessage(__FILE__, __LINE__, ::harvest::INFO)

#define CHECK(condition)           \
  if (PREDICT_FALSE(!(condition))) \
  LOG(FATAL) << "Check failed: " #condition " "

// Builds the message for a failed CHECK_XX comparison.
class CheckOpMessageBuilder {
 public:
  explicit CheckOpMessageBuilder(const char *exprtext);
  ~CheckOpMessageBuilder();

  std::ostream *ForVar1() { return stream_; }
  std::ostream *ForVar2();

  // Returns the message with the closing ")" appended.
  string *NewString();

 private:
  std::ostringstream *stream_;
};

template <typename T>
inline void MakeCheckOpValueString(std::ostream *os, const T &v) {
  (*os) << v;
}

template <>
void MakeCheckOpValueString(std::ostream *os, const char &v);
template <>
void MakeCheckOpValueString(std::ostream *os, const unsigned char &v);
template <>
void MakeCheckOpValueString(std::ostream *os, const std::nullptr_t &p);

template <typename T1, typename T2>
string *MakeCheckOpString(const T1 &v1, const T2 &v2,
                          const char *exprtext) HARVEST_ATTRIBUTE_NOINLINE;

template <typename T1, typename T2>
string *MakeCheckOpString(const T1 &v1, const T2 &v2, const char *exprtext) {
  CheckOpMessageBuilder builder(exprtext);
  MakeCheckOpValueString(builder.ForVar1(), v1);
  MakeCheckOpValueString(builder.ForVar2(), v2);
  return builder.NewString();
}

// Holds the message of a failed comparison, or null if the check passed.
struct CheckOpString {
  CheckOpString(string *str) : str_(str) {}
  operator bool() const { return PREDICT_FALSE(str_ != nullptr); }
  string *str_;
};

#define DEFINE_CHECK_OP_IMPL(name, op)                                 \
  template <typename T1, typename T2>                                  \
  inline string *name##Impl(const T1 &v1, const T2 &v2,                \
                            const char *exprtext) {                    \
    if (PREDICT_TRUE(v1 op v2)) return nullptr;                        \
    return ::harvest::MakeCheckOpString(v1, v2, exprtext);             \
  }                                                                    \
  inline string *name##Impl(int v1, int v2, const char *exprtext) {    \
    return name##Impl<int, int>(v1, v2, exprtext);                     \
  }

DEFINE_CHECK_OP_IMPL(EQ, ==)
DEFINE_CHECK_OP_IMPL(NE, !=)
DEFINE_CHECK_OP_IMPL(LE, <=)
DEFINE_CHECK_OP_IMPL(LT, <)
DEFINE_CHECK_OP_IMPL(GE, >=)
DEFINE_CHECK_OP_IMPL(GT, >)
#undef DEFINE_CHECK_OP_IMPL

#define CHECK_OP(name, op, val1, val2)                              \
  while (::harvest::CheckOpString _result =                         \
             ::harvest::name##Impl(val1, val2,                      \
                                   #val1 " " #op " " #val2))        \
    ::harvest::LogMessageFatal(__FILE__, __LINE__) << *(_result.str_)

#define CHECK_EQ(val1, val2) CHECK_OP(EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(NE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(LE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(LT, <, val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(GE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(GT, >, val1, val2)

#ifndef NDEBUG
#define DCHECK(condition) CHECK(condition)
#define DCHECK_EQ(val1, val2) CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) CHECK_GT(val1, val2)
#else
#define DCHECK(condition) while (false && (condition)) LOG(FATAL)
#define _DCHECK_NOP(x, y) \
  while (false && ((void) (x), (void) (y), 0)) LOG(FATAL)
#define DCHECK_EQ(x, y) _DCHECK_NOP(x, y)
#define DCHECK_NE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_LE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_LT(x, y) _DCHECK_NOP(x, y)
#define DCHECK_GE(x, y) _DCHECK_NOP(x, y)
#define DCHECK_GT(x, y) _DCHECK_NOP(x, y)
#endif

}  // namespace harvest

#endif  // HARVEST_BASE_LOGGING_H_
