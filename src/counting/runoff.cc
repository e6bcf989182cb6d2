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
#include "src/counting/counting.h"

namespace cballot {

// runoffPool returns everyone tied for first place plus everyone tied for
// second place. If every candidate is tied for first there is no second
// tier and the pool is the first tier alone.
static CandidateSet runoffPool(const Tally& first) {
  CandidateSet pool = std::get<0>(first.Leaders());
  CandidateSet second;
  double second_votes = 0;
  for (auto& p : first.Totals()) {
    if (p.second == first.Max()) {
      continue;
    }
    if (second.empty() || p.second > second_votes) {
      second_votes = p.second;
      second.clear();
      second.insert(p.first);
    } else if (p.second == second_votes) {
      second.insert(p.first);
    }
  }
  pool.insert(second.begin(), second.end());
  return pool;
}

CountResult PluralityWithRunoff(const BallotPtrs& ballots) {
  Tally first;
  for (auto& ballot : ballots) {
    auto s = CheckBallotType(ballot, ballotpb::Ballot::kRanked,
                             "plurality with runoff");
    if (!s.IsOK()) {
      return std::make_tuple(Outcome(), std::move(s));
    }
    if (ballot->ranked().choices_size() > 0) {
      first.Add(ballot->ranked().choices(0), 1);
    }
  }

  if (first.Empty()) {
    return std::make_tuple(Outcome(), Status::OK());
  }

  // An empty ballot names no first choice but still counts as cast.
  if (first.Max() / static_cast<double>(ballots.size()) > 0.5) {
    return LeadersOutcome(first);
  }

  auto pool = runoffPool(first);

  Tally runoff;
  for (auto& ballot : ballots) {
    for (auto& choice : ballot->ranked().choices()) {
      if (pool.count(choice) != 0) {
        runoff.Add(choice, 1);
        break;
      }
    }
  }

  if (!runoff.Empty() && runoff.Max() / runoff.Total() > 0.5) {
    return LeadersOutcome(runoff);
  }
  return std::make_tuple(Outcome(), Status::OK());
}

CountResult PluralityWithRunoff(BallotStream& ballots) {
  return PluralityWithRunoff(Materialize(ballots));
}

}  // namespace cballot
