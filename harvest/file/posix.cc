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

#include <errno.h>
#include <fcntl.h>
#include <glob.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>

#include "harvest/file/file.h"

namespace harvest {

namespace {

int OpenFlags(const char *mode) {
  int flags = 0;
  switch (*mode++) {
    case 'r': flags = O_RDONLY; break;
    case 'w': flags = O_WRONLY | O_CREAT | O_TRUNC; break;
    case 'a': flags = O_WRONLY | O_CREAT | O_APPEND; break;
  }
  if (*mode == '+') {
    flags &= ~(O_RDONLY | O_WRONLY);
    flags |= O_RDWR;
  }
  return flags;
}

const char *GetTempDir() {
  const char *tmpdir = getenv("TMPDIR");
  if (tmpdir == nullptr) tmpdir = getenv("TMP");
  if (tmpdir == nullptr) tmpdir = "/tmp";
  return tmpdir;
}

void FillStat(const struct stat &st, FileStat *stat) {
  stat->size = st.st_size;
  stat->mtime = st.st_mtime;
  stat->is_file = S_ISREG(st.st_mode);
  stat->is_directory = S_ISDIR(st.st_mode);
}

}  // namespace

// POSIX file interface.
class PosixFile : public File {
 public:
  PosixFile(int fd, const string &filename)
      : fd_(fd), filename_(filename) {}

  ~PosixFile() override {
    if (fd_ != -1) close(fd_);
  }

  Status PRead(uint64 pos, void *buffer, size_t size, uint64 *read) override {
    ssize_t rc = pread(fd_, buffer, size, pos);
    if (rc < 0) return IOError(filename_, errno);
    if (read) *read = rc;
    return Status::OK;
  }

  Status Read(void *buffer, size_t size, uint64 *read) override {
    char *ptr = static_cast<char *>(buffer);
    uint64 total = 0;
    while (total < size) {
      ssize_t rc = ::read(fd_, ptr + total, size - total);
      if (rc < 0) {
        if (errno == EINTR) continue;
        return IOError(filename_, errno);
      }
      if (rc == 0) break;
      total += rc;
    }
    if (read) *read = total;
    return Status::OK;
  }

  Status Write(const void *buffer, size_t size) override {
    const char *ptr = static_cast<const char *>(buffer);
    while (size > 0) {
      ssize_t rc = write(fd_, ptr, size);
      if (rc < 0) {
        if (errno == EINTR) continue;
        return IOError(filename_, errno);
      }
      ptr += rc;
      size -= rc;
    }
    return Status::OK;
  }

  void *MapMemory(uint64 pos, size_t size, bool writable) override {
    int prot = writable ? PROT_READ | PROT_WRITE : PROT_READ;
    void *mapping = mmap(nullptr, size, prot, MAP_SHARED, fd_, pos);
    return mapping == MAP_FAILED ? nullptr : mapping;
  }

  Status Seek(uint64 pos) override {
    if (lseek(fd_, pos, SEEK_SET) == -1) return IOError(filename_, errno);
    return Status::OK;
  }

  Status GetSize(uint64 *size) override {
    struct stat st;
    if (fstat(fd_, &st) != 0) return IOError(filename_, errno);
    *size = st.st_size;
    return Status::OK;
  }

  Status Close() override {
    Status st;
    if (fd_ != -1) {
      if (close(fd_) != 0) st = IOError(filename_, errno);
      fd_ = -1;
    }
    delete this;
    return st;
  }

  const string &filename() const override { return filename_; }

 private:
  // File descriptor.
  int fd_;

  // File name.
  string filename_;
};

Status File::Open(const string &name, const char *mode, File **f) {
  int fd = open(name.c_str(), OpenFlags(mode), 0644);
  if (fd == -1) return IOError(name, errno);
  *f = new PosixFile(fd, name);
  return Status::OK;
}

bool File::Exists(const string &name) {
  return access(name.c_str(), F_OK) == 0;
}

Status File::Stat(const string &name, FileStat *stat) {
  struct stat st;
  if (::stat(name.c_str(), &st) != 0) return IOError(name, errno);
  FillStat(st, stat);
  return Status::OK;
}

Status File::Mkdir(const string &dir) {
  if (mkdir(dir.c_str(), 0755) != 0) return IOError(dir, errno);
  return Status::OK;
}

Status File::CreateTempDir(string *dir) {
  char tmpname[PATH_MAX];
  snprintf(tmpname, sizeof(tmpname), "%s/harvest.XXXXXX", GetTempDir());
  if (mkdtemp(tmpname) == nullptr) return IOError(tmpname, errno);
  *dir = tmpname;
  return Status::OK;
}

Status File::Match(const string &pattern, std::vector<string> *filenames) {
  glob_t globbuf;
  int rc = glob(pattern.c_str(), GLOB_PERIOD, nullptr, &globbuf);
  if (rc == GLOB_NOMATCH) return Status::OK;
  if (rc != 0) return IOError(pattern, rc == GLOB_NOSPACE ? ENOMEM : EIO);
  for (size_t i = 0; i < globbuf.gl_pathc; ++i) {
    filenames->push_back(globbuf.gl_pathv[i]);
  }
  globfree(&globbuf);
  return Status::OK;
}

Status File::FreeMappedMemory(void *data, size_t size) {
  if (munmap(data, size) != 0) return IOError("munmap", errno);
  return Status::OK;
}

}  // namespace harvest
