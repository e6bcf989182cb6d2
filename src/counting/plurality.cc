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
#include "src/ballot.h"
#include "src/counting/counting.h"

namespace cballot {

Status CheckBallotType(const BallotPtr& ballot, VoteCase want,
                       const char* counter) {
  if (!ballot) {
    return Status::Error("%s: %s counter got a null ballot", kErrBallotType,
                         counter);
  }
  if (ballot->vote_case() != want) {
    return Status::Error("%s: %s counter cannot count %s ballot %s",
                         kErrBallotType, counter,
                         BallotTypeName(ballot->vote_case()),
                         ballot->id().c_str());
  }
  return Status::OK();
}

CountResult LeadersOutcome(const Tally& tally) {
  auto [leaders, s] = tally.Leaders();
  if (!s.IsOK()) {
    return std::make_tuple(Outcome(), std::move(s));
  }
  return std::make_tuple(Outcome(std::move(leaders)), Status::OK());
}

CountResult Plurality(BallotStream& ballots) {
  Tally tally;
  while (true) {
    auto [ballot, ok] = ballots.Next();
    if (!ok) {
      break;
    }
    auto s = CheckBallotType(ballot, ballotpb::Ballot::kPlurality, "plurality");
    if (!s.IsOK()) {
      return std::make_tuple(Outcome(), std::move(s));
    }
    tally.Add(ballot->plurality().choice(), 1);
  }
  return LeadersOutcome(tally);
}

CountResult Plurality(const BallotPtrs& ballots) {
  SliceBallotStream stream(ballots);
  return Plurality(stream);
}

CountResult Quota(BallotStream& ballots, double q) {
  if (!(q > 0 && q <= 100)) {
    return std::make_tuple(
        Outcome(),
        Status::Error("%s: quota must be within (0, 100], got %g",
                      kErrInvalidArgument, q));
  }
  double quota_fraction = q > 1 ? q / 100 : q;

  Tally tally;
  uint64_t count = 0;
  while (true) {
    auto [ballot, ok] = ballots.Next();
    if (!ok) {
      break;
    }
    auto s = CheckBallotType(ballot, ballotpb::Ballot::kPlurality, "quota");
    if (!s.IsOK()) {
      return std::make_tuple(Outcome(), std::move(s));
    }
    tally.Add(ballot->plurality().choice(), 1);
    count++;
  }

  if (count == 0) {
    return std::make_tuple(
        Outcome(), Status::Error("%s: quota needs at least one ballot",
                                 kErrEmptyInput));
  }

  CandidateSet winners;
  for (auto& p : tally.Totals()) {
    if (p.second / static_cast<double>(count) >= quota_fraction) {
      winners.insert(p.first);
    }
  }
  return std::make_tuple(Outcome(std::move(winners)), Status::OK());
}

CountResult Quota(const BallotPtrs& ballots, double q) {
  SliceBallotStream stream(ballots);
  return Quota(stream, q);
}

}  // namespace cballot
