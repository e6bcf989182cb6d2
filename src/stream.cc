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
#include "src/stream.h"

namespace cballot {

std::tuple<BallotPtr, bool> GeneratorBallotStream::Next() {
  if (done_ || !producer_) {
    return std::make_tuple(nullptr, false);
  }
  auto [ballot, ok] = producer_();
  if (!ok) {
    // Never call the producer again once it has run dry.
    done_ = true;
    return std::make_tuple(nullptr, false);
  }
  return std::make_tuple(std::move(ballot), true);
}

BallotPtrs Materialize(BallotStream& stream) {
  BallotPtrs ballots;
  while (true) {
    auto [ballot, ok] = stream.Next();
    if (!ok) {
      break;
    }
    ballots.push_back(std::move(ballot));
  }
  return ballots;
}

}  // namespace cballot
