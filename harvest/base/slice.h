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

#ifndef HARVEST_BASE_SLICE_H_
#define HARVEST_BASE_SLICE_H_

#include <stddef.h>
#include <string.h>
#include <iosfwd>
#include <string>

#include "harvest/base/logging.h"
#include "harvest/base/types.h"

namespace harvest {

// Slice is a simple structure pointing to a region of memory. The user of a
// Slice must ensure that the slice is not used after the memory has been
// deallocated.
class Slice {
 public:
  static const size_t npos = static_cast<size_t>(-1);

  // Create an empty slice.
  Slice() : data_(nullptr), size_(0) {}

  // Create a slice that refers to d[0,n-1].
  Slice(const char *d, size_t n) : data_(d), size_(n) {}
  Slice(const void *d, size_t n)
      : data_(static_cast<const char *>(d)), size_(n) {}

  // Create a slice that refers to the contents of "s".
  Slice(const string &s) : data_(s.data()), size_(s.size()) {}

  // Create a slice that refers to s[0,strlen(s)-1].
  Slice(const char *s) : data_(s), size_(strlen(s)) {}

  // Create a slice that refers to [begin,end-1].
  Slice(const char *begin, const char *end)
      : data_(begin), size_(end - begin) {}

  const char *data() const { return data_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  const char *begin() const { return data_; }
  const char *end() const { return data_ + size_; }

  char operator [](size_t i) const {
    DCHECK_LT(i, size_);
    return data_[i];
  }

  // Drop the first "n" bytes from this slice.
  void remove_prefix(size_t n) {
    DCHECK_LE(n, size_);
    data_ += n;
    size_ -= n;
  }

  // Drop the last "n" bytes from this slice.
  void remove_suffix(size_t n) {
    DCHECK_LE(n, size_);
    size_ -= n;
  }

  // Return sub-slice starting at pos with at most n bytes.
  Slice substr(size_t pos, size_t n = npos) const {
    if (pos > size_) pos = size_;
    if (n > size_ - pos) n = size_ - pos;
    return Slice(data_ + pos, n);
  }

  // Return position of the first occurrence of a character or substring at
  // or after pos, or npos if there is none.
  size_t find(char ch, size_t pos = 0) const {
    if (pos >= size_) return npos;
    const void *p = memchr(data_ + pos, ch, size_ - pos);
    return p == nullptr ? npos : static_cast<const char *>(p) - data_;
  }
  size_t find(const Slice &s, size_t pos = 0) const {
    if (s.size_ > size_) return npos;
    for (size_t i = pos; i + s.size_ <= size_; ++i) {
      if (memcmp(data_ + i, s.data_, s.size_) == 0) return i;
    }
    return npos;
  }

  bool contains(const Slice &s) const { return find(s) != npos; }
  bool contains(char ch) const { return find(ch) != npos; }

  bool starts_with(const Slice &x) const {
    return size_ >= x.size_ && memcmp(data_, x.data_, x.size_) == 0;
  }

  bool ends_with(const Slice &x) const {
    return size_ >= x.size_ &&
           memcmp(data_ + (size_ - x.size_), x.data_, x.size_) == 0;
  }

  // Return a string that contains a copy of the referenced data.
  string str() const { return string(data_, size_); }

 private:
  const char *data_;
  size_t size_;
};

inline bool operator ==(const Slice &x, const Slice &y) {
  return x.size() == y.size() && memcmp(x.data(), y.data(), x.size()) == 0;
}

inline bool operator !=(const Slice &x, const Slice &y) {
  return !(x == y);
}

inline bool operator <(const Slice &x, const Slice &y) {
  const size_t smallest = x.size() < y.size() ? x.size() : y.size();
  const int r = memcmp(x.data(), y.data(), smallest);
  return r < 0 || (r == 0 && x.size() < y.size());
}

inline std::ostream &operator <<(std::ostream &o, Slice s) {
  o.write(s.data(), s.size());
  return o;
}

}  // namespace harvest

#endif  // HARVEST_BASE_SLICE_H_
