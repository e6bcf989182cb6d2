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
#include "src/election.h"

#include "src/ballot.h"

namespace cballot {

const char* CastErrorName(CastError e) {
  switch (e) {
    case kCastOK:
      return "OK";
    case kWrongVoteType:
      return "WrongVoteType";
    case kDuplicateVote:
      return "DuplicateVote";
    case kCandidateNotInElection:
      return "CandidateNotInElection";
    default:
      return "Unknown";
  }
}

VoteCase Election::BallotType() const {
  if (ballots_.empty()) {
    return ballotpb::Ballot::VOTE_NOT_SET;
  }
  // The oldest ballot sits at the back.
  return ballots_.back()->vote_case();
}

std::tuple<Election, CastError> Election::Cast(const BallotPtr& ballot) const {
  if (!ballot || ballot->vote_case() == ballotpb::Ballot::VOTE_NOT_SET) {
    return std::make_tuple(*this, kWrongVoteType);
  }

  if (!ballots_.empty() && ballot->vote_case() != BallotType()) {
    return std::make_tuple(*this, kWrongVoteType);
  }

  if (HasBallot(ballot->id())) {
    return std::make_tuple(*this, kDuplicateVote);
  }

  for (auto& c : BallotCandidates(*ballot)) {
    if (candidates_->count(c) == 0) {
      return std::make_tuple(*this, kCandidateNotInElection);
    }
  }

  Election next(*this);
  next.ballots_.push_front(ballot);
  next.ids_.insert(ballot->id());
  return std::make_tuple(std::move(next), kCastOK);
}

}  // namespace cballot
