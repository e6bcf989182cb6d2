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
#include "src/outcome.h"

#include <sstream>

namespace cballot {

static const Candidate kNoCandidate;

const char* OutcomeTypeName(OutcomeType t) {
  switch (t) {
    case kNoWinner:
      return "NoWinner";
    case kWinner:
      return "Winner";
    case kTie:
      return "Tie";
    default:
      return "Unknown";
  }
}

const Candidate& Outcome::Winner() const {
  if (winners_.size() != 1) {
    return kNoCandidate;
  }
  return *winners_.begin();
}

std::string Outcome::String() const {
  std::stringstream ss;
  ss << OutcomeTypeName(Type());
  if (winners_.empty()) {
    return ss.str();
  }
  ss << "(";
  bool first = true;
  for (auto& c : winners_) {
    if (!first) {
      ss << " ";
    }
    ss << c;
    first = false;
  }
  ss << ")";
  return ss.str();
}

}  // namespace cballot
