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

#include "harvest/stream/file-input.h"

#include <string>
#include <vector>

#include "harvest/file/file.h"
#include "harvest/stream/bzip2.h"
#include "harvest/stream/file.h"
#include "harvest/stream/gzip.h"

namespace harvest {

InputPipeline::~InputPipeline() {
  for (int i = streams_.size() - 1; i >= 0; --i) {
    delete streams_[i];
  }
}

void InputPipeline::Add(InputStream *stream) {
  streams_.push_back(stream);
  last_ = stream;
}

bool InputPipeline::Next(const void **data, int *size) {
  return last_->Next(data, size);
}

void InputPipeline::BackUp(int count) {
  last_->BackUp(count);
}

bool InputPipeline::Skip(int count) {
  return last_->Skip(count);
}

int64 InputPipeline::ByteCount() const {
  return last_->ByteCount();
}

Status InputPipeline::status() const {
  for (InputStream *stream : streams_) {
    Status st = stream->status();
    if (!st.ok()) return st;
  }
  return Status::OK;
}

Status FileInput::Open(const string &filename, InputStream **stream,
                       int block_size) {
  File *file;
  Status st = File::Open(filename, "r", &file);
  if (!st.ok()) return st;
  InputStream *input = new FileInputStream(file, block_size);

  InputStream *decompressor = nullptr;
  size_t dot = filename.find_last_of('.');
  if (dot != string::npos) {
    string ext = filename.substr(dot);
    if (ext == ".gz") {
      decompressor = new GZipDecompressor(input, block_size);
    } else if (ext == ".bz2") {
      decompressor = new BZip2Decompressor(input, true, block_size);
    }
  }

  if (decompressor != nullptr) {
    InputPipeline *pipeline = new InputPipeline();
    pipeline->Add(input);
    pipeline->Add(decompressor);
    input = pipeline;
  }
  *stream = input;
  return Status::OK;
}

}  // namespace harvest
