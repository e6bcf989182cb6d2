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

#include <map>
#include <string>
#include <vector>

#include "src/define.h"

namespace cballot {

BallotPtr MakePluralityBallot(const std::string& id, const Candidate& choice);

// MakeApprovalBallot collapses repeated approvals of one candidate, keeping
// the order of first appearance.
BallotPtr MakeApprovalBallot(const std::string& id,
                             const std::vector<Candidate>& choices);

BallotPtr MakeRankedBallot(const std::string& id,
                           const std::vector<Candidate>& choices);

BallotPtr MakeScoreBallot(const std::string& id,
                          const std::map<Candidate, double>& scores);

inline const std::string& BallotId(const ballotpb::Ballot& ballot) {
  return ballot.id();
}

// BallotCandidates lists the distinct candidates named by the ballot, in no
// particular order. A ballot without a variant names nobody.
std::vector<Candidate> BallotCandidates(const ballotpb::Ballot& ballot);

const char* BallotTypeName(VoteCase vote_case);

}  // namespace cballot
