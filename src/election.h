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

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "src/define.h"

namespace cballot {

enum CastError : uint8_t {
  kCastOK,
  // kWrongVoteType means the ballot's variant differs from the variant of
  // the ballots already cast, or the ballot has no variant at all.
  kWrongVoteType,
  // kDuplicateVote means a ballot with the same id was already cast.
  kDuplicateVote,
  // kCandidateNotInElection means the ballot names an unregistered
  // candidate.
  kCandidateNotInElection,
};

const char* CastErrorName(CastError e);

// Election is an immutable snapshot of a fixed candidate set and the ballots
// cast so far. Every ballot it holds is of one variant, has a unique id and
// names registered candidates only. Casting returns a new snapshot and
// leaves the receiver untouched, so snapshots can be kept and compared.
// Snapshots share the candidate set; the ballot list is copied per cast.
class Election {
 public:
  // Duplicate candidates collapse.
  explicit Election(const std::vector<Candidate>& candidates)
      : candidates_(std::make_shared<const CandidateSet>(candidates.begin(),
                                                         candidates.end())) {}

  // Cast validates the ballot and returns the election with the ballot added
  // and kCastOK. On failure it returns a copy of this election unchanged and
  // the reason.
  //
  // Every call copies the ballot collection and the id set, so a cast costs
  // O(n) in the ballots already cast and building an n-ballot election costs
  // O(n^2). Only the candidate set is shared between snapshots.
  std::tuple<Election, CastError> Cast(const BallotPtr& ballot) const;

  const CandidateSet& Candidates() const { return *candidates_; }

  // Ballots returns the accepted ballots, most recently cast first.
  const BallotPtrs& Ballots() const { return ballots_; }

  size_t Size() const { return ballots_.size(); }

  // BallotType is the variant of the first ballot cast, or VOTE_NOT_SET
  // while the election is empty.
  VoteCase BallotType() const;

  bool HasBallot(const std::string& id) const { return ids_.count(id) != 0; }

 private:
  std::shared_ptr<const CandidateSet> candidates_;
  BallotPtrs ballots_;
  std::set<std::string> ids_;
};

}  // namespace cballot
