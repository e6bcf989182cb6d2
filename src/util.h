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

#include <random>
#include <string>
#include <tuple>
#include <vector>

#include "cballot/status.h"

namespace cballot {

class Util {
 public:
  // Median sorts values and returns the middle element, or the mean of the
  // two middle elements for an even count.
  static std::tuple<double, Status> Median(std::vector<double> values);

  // Join concatenates items separated by sep.
  template <typename Container>
  static std::string Join(const Container& items, const char* sep) {
    std::string out;
    for (auto& item : items) {
      if (!out.empty()) {
        out += sep;
      }
      out += item;
    }
    return out;
  }

  // [lower_bound, upper_bound]
  static int Random(int lower_bound, int upper_bound);

 private:
  static thread_local std::mt19937 gen_;
};

}  // namespace cballot
