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

namespace cballot {

// Inheriting this class makes a type impossible to copy or move. Used for
// single-use resources such as ballot streams, where a copy would let two
// owners read the same source.
class noncopyable {
 public:
  noncopyable(const noncopyable&) = delete;
  noncopyable(noncopyable&&) = delete;
  void operator=(const noncopyable&) = delete;
  void operator=(noncopyable&&) = delete;

 protected:
  noncopyable() = default;
  ~noncopyable() = default;
};

}  // namespace cballot
