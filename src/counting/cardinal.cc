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
#include <cmath>
#include <map>
#include <set>
#include <vector>

#include "src/counting/counting.h"
#include "src/util.h"

namespace cballot {

CountResult Approval(BallotStream& ballots) {
  Tally tally;
  while (true) {
    auto [ballot, ok] = ballots.Next();
    if (!ok) {
      break;
    }
    auto s = CheckBallotType(ballot, ballotpb::Ballot::kApproval, "approval");
    if (!s.IsOK()) {
      return std::make_tuple(Outcome(), std::move(s));
    }
    // A ballot approves of a candidate at most once.
    std::set<Candidate> approved;
    for (auto& c : ballot->approval().choices()) {
      if (approved.insert(c).second) {
        tally.Add(c, 1);
      }
    }
  }
  return LeadersOutcome(tally);
}

CountResult Approval(const BallotPtrs& ballots) {
  SliceBallotStream stream(ballots);
  return Approval(stream);
}

// checkScores rejects NaN and infinite scores.
static Status checkScores(const ballotpb::Ballot& ballot, const char* counter) {
  for (auto& p : ballot.score().scores()) {
    if (!std::isfinite(p.second)) {
      return Status::Error("%s: %s counter got score %g for %s on ballot %s",
                           kErrInvalidArgument, counter, p.second,
                           p.first.c_str(), ballot.id().c_str());
    }
  }
  return Status::OK();
}

CountResult Score(BallotStream& ballots) {
  Tally tally;
  while (true) {
    auto [ballot, ok] = ballots.Next();
    if (!ok) {
      break;
    }
    auto s = CheckBallotType(ballot, ballotpb::Ballot::kScore, "score");
    if (s.IsOK()) {
      s = checkScores(*ballot, "score");
    }
    if (!s.IsOK()) {
      return std::make_tuple(Outcome(), std::move(s));
    }
    for (auto& p : ballot->score().scores()) {
      tally.Add(p.first, p.second);
    }
  }
  return LeadersOutcome(tally);
}

CountResult Score(const BallotPtrs& ballots) {
  SliceBallotStream stream(ballots);
  return Score(stream);
}

CountResult MajorityJudgement(BallotStream& ballots) {
  std::map<Candidate, std::vector<double>> scores;
  while (true) {
    auto [ballot, ok] = ballots.Next();
    if (!ok) {
      break;
    }
    auto s = CheckBallotType(ballot, ballotpb::Ballot::kScore,
                             "majority judgement");
    if (s.IsOK()) {
      s = checkScores(*ballot, "majority judgement");
    }
    if (!s.IsOK()) {
      return std::make_tuple(Outcome(), std::move(s));
    }
    for (auto& p : ballot->score().scores()) {
      scores[p.first].push_back(p.second);
    }
  }

  if (scores.empty()) {
    return std::make_tuple(
        Outcome(), Status::Error("%s: no scores to judge", kErrEmptyInput));
  }

  CandidateSet winners;
  double top = 0;
  for (auto& p : scores) {
    auto [median, s] = Util::Median(std::move(p.second));
    if (!s.IsOK()) {
      return std::make_tuple(Outcome(), std::move(s));
    }
    if (winners.empty() || median > top) {
      top = median;
      winners.clear();
      winners.insert(p.first);
    } else if (median == top) {
      winners.insert(p.first);
    }
  }
  return std::make_tuple(Outcome(std::move(winners)), Status::OK());
}

CountResult MajorityJudgement(const BallotPtrs& ballots) {
  SliceBallotStream stream(ballots);
  return MajorityJudgement(stream);
}

}  // namespace cballot
