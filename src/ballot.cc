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

#include <set>

namespace cballot {

BallotPtr MakePluralityBallot(const std::string& id, const Candidate& choice) {
  auto b = std::make_shared<ballotpb::Ballot>();
  b->set_id(id);
  b->mutable_plurality()->set_choice(choice);
  return b;
}

BallotPtr MakeApprovalBallot(const std::string& id,
                             const std::vector<Candidate>& choices) {
  auto b = std::make_shared<ballotpb::Ballot>();
  b->set_id(id);
  auto approval = b->mutable_approval();
  std::set<Candidate> seen;
  for (auto& c : choices) {
    if (seen.insert(c).second) {
      approval->add_choices(c);
    }
  }
  return b;
}

BallotPtr MakeRankedBallot(const std::string& id,
                           const std::vector<Candidate>& choices) {
  auto b = std::make_shared<ballotpb::Ballot>();
  b->set_id(id);
  auto ranked = b->mutable_ranked();
  for (auto& c : choices) {
    ranked->add_choices(c);
  }
  return b;
}

BallotPtr MakeScoreBallot(const std::string& id,
                          const std::map<Candidate, double>& scores) {
  auto b = std::make_shared<ballotpb::Ballot>();
  b->set_id(id);
  auto& m = *b->mutable_score()->mutable_scores();
  for (auto& p : scores) {
    m[p.first] = p.second;
  }
  return b;
}

std::vector<Candidate> BallotCandidates(const ballotpb::Ballot& ballot) {
  std::set<Candidate> names;
  switch (ballot.vote_case()) {
    case ballotpb::Ballot::kPlurality:
      names.insert(ballot.plurality().choice());
      break;
    case ballotpb::Ballot::kApproval:
      names.insert(ballot.approval().choices().begin(),
                   ballot.approval().choices().end());
      break;
    case ballotpb::Ballot::kRanked:
      names.insert(ballot.ranked().choices().begin(),
                   ballot.ranked().choices().end());
      break;
    case ballotpb::Ballot::kScore:
      for (auto& p : ballot.score().scores()) {
        names.insert(p.first);
      }
      break;
    default:
      break;
  }
  return std::vector<Candidate>(names.begin(), names.end());
}

const char* BallotTypeName(VoteCase vote_case) {
  switch (vote_case) {
    case ballotpb::Ballot::kPlurality:
      return "plurality";
    case ballotpb::Ballot::kApproval:
      return "approval";
    case ballotpb::Ballot::kRanked:
      return "ranked";
    case ballotpb::Ballot::kScore:
      return "score";
    default:
      return "unset";
  }
}

}  // namespace cballot
