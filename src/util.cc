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
#include "src/util.h"

#include <algorithm>

#include "src/outcome.h"

namespace cballot {

thread_local std::mt19937 Util::gen_(std::random_device{}());

std::tuple<double, Status> Util::Median(std::vector<double> values) {
  if (values.empty()) {
    return std::make_tuple(0.0,
                           Status::Error("%s: median of no scores", kErrEmptyInput));
  }

  std::sort(values.begin(), values.end());
  size_t n = values.size();
  size_t i = n / 2;
  if (n % 2 == 1) {
    return std::make_tuple(values[i], Status::OK());
  }
  return std::make_tuple((values[i - 1] + values[i]) / 2, Status::OK());
}

int Util::Random(int lower_bound, int upper_bound) {
  std::uniform_int_distribution<int> dist(lower_bound, upper_bound);
  return dist(gen_);
}

}  // namespace cballot
