// Copyright 2023 JT
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
#pragma once

#include <cstdint>
#include <utility>

namespace cballot {

// Status reports a precondition violation. A null state means success, any
// other state owns a formatted, nul-terminated message.
class Status {
 public:
  Status() : state_(nullptr) {}
  ~Status() { delete[] state_; }

  Status(const Status& rhs);
  Status& operator=(const Status& rhs);

  Status(Status&& rhs) noexcept : state_(rhs.state_) { rhs.state_ = nullptr; }
  Status& operator=(Status&& rhs) noexcept;

  // Create a success status.
  static Status OK() { return Status{}; }

  // Error formats a printf-style message. By convention the message starts
  // with one of the kErr* constants so callers can tell errors apart.
  static Status Error(const char* format, ...);

  // Returns true if the status indicates success.
  bool IsOK() const { return state_ == nullptr; }

  // Is reports whether the message contains err.
  bool Is(const char* err) const;

  const char* Str() const { return state_ == nullptr ? "OK" : state_; }

 private:
  explicit Status(char* state) : state_(state) {}
  static char* CopyState(const char* src);

 private:
  char* state_;
  static const int32_t kStateMaxSize = 1024;
};

inline Status::Status(const Status& rhs)
    : state_(rhs.state_ == nullptr ? nullptr : CopyState(rhs.state_)) {}

inline Status& Status::operator=(const Status& rhs) {
  if (state_ != rhs.state_) {
    delete[] state_;
    state_ = (rhs.state_ == nullptr) ? nullptr : CopyState(rhs.state_);
  }
  return *this;
}

inline Status& Status::operator=(Status&& rhs) noexcept {
  std::swap(state_, rhs.state_);
  return *this;
}

}  // namespace cballot
