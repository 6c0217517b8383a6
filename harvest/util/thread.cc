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

#include "harvest/util/thread.h"

#include <string.h>
#include <sys/sysinfo.h>

#include "harvest/base/logging.h"

namespace harvest {

void *Thread::ThreadMain(void *arg) {
  Thread *thread = static_cast<Thread *>(arg);
  thread->Run();
  return nullptr;
}

Thread::Thread() : running_(false) {}

Thread::~Thread() {}

void Thread::Start() {
  CHECK(!running_);
  int rc = pthread_create(&thread_, nullptr, &ThreadMain, this);
  CHECK_EQ(rc, 0) << "Cannot create thread: " << strerror(rc);
  running_ = true;
  if (!joinable_) pthread_detach(thread_);
}

void Thread::Join() {
  if (!running_) return;
  CHECK(joinable_);
  void *unused;
  pthread_join(thread_, &unused);
  running_ = false;
}

void Thread::SetJoinable(bool joinable) {
  CHECK(!running_) << "Can't SetJoinable() on a running thread";
  joinable_ = joinable;
}

void ClosureThread::Run() {
  closure_();
}

WorkerPool::~WorkerPool() {
  Join();
  for (ClosureThread *worker : workers_) delete worker;
}

void WorkerPool::Start(int num_workers, const Worker &worker) {
  for (int i = 0; i < num_workers; ++i) {
    ClosureThread *thread = new ClosureThread([worker, i]() { worker(i); });
    thread->SetJoinable(true);
    thread->Start();
    workers_.push_back(thread);
  }
}

void WorkerPool::Join() {
  for (ClosureThread *worker : workers_) worker->Join();
}

int WorkerPool::NumProcessors() {
  int processors = get_nprocs();
  return processors > 0 ? processors : 1;
}

}  // namespace harvest
