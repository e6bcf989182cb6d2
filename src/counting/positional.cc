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
#include <functional>

#include "src/counting/counting.h"

namespace cballot {

using PointsFunc = std::function<double(int n, int i)>;

// countPositional credits each candidate of every ranked ballot with
// points(n, i), where n is the ballot length and i the 0-based rank.
static CountResult countPositional(BallotStream& ballots, const char* counter,
                                   const PointsFunc& points) {
  Tally tally;
  while (true) {
    auto [ballot, ok] = ballots.Next();
    if (!ok) {
      break;
    }
    auto s = CheckBallotType(ballot, ballotpb::Ballot::kRanked, counter);
    if (!s.IsOK()) {
      return std::make_tuple(Outcome(), std::move(s));
    }
    auto& choices = ballot->ranked().choices();
    int n = choices.size();
    for (int i = 0; i < n; i++) {
      tally.Add(choices.Get(i), points(n, i));
    }
  }
  return LeadersOutcome(tally);
}

double BordaPoints(int n, int i, int starting_at) {
  return static_cast<double>(n - i - 1 + starting_at);
}

double DowdallPoints(int i) { return 1.0 / (i + 1); }

CountResult Borda(BallotStream& ballots, int starting_at) {
  if (starting_at != 0 && starting_at != 1) {
    return std::make_tuple(
        Outcome(), Status::Error("%s: starting_at must be 0 or 1, got %d",
                                 kErrInvalidArgument, starting_at));
  }
  return countPositional(ballots, "borda", [starting_at](int n, int i) {
    return BordaPoints(n, i, starting_at);
  });
}

CountResult Borda(const BallotPtrs& ballots, int starting_at) {
  SliceBallotStream stream(ballots);
  return Borda(stream, starting_at);
}

CountResult Dowdall(BallotStream& ballots) {
  return countPositional(ballots, "dowdall",
                         [](int, int i) { return DowdallPoints(i); });
}

CountResult Dowdall(const BallotPtrs& ballots) {
  SliceBallotStream stream(ballots);
  return Dowdall(stream);
}

}  // namespace cballot
