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
#include <map>
#include <vector>

#include "gtest/gtest.h"
#include "src/ballot.h"

TEST(Ballot, Builders) {
  auto p = cballot::MakePluralityBallot("p", "A");
  ASSERT_EQ(cballot::BallotId(*p), "p");
  ASSERT_EQ(p->vote_case(), ballotpb::Ballot::kPlurality);
  ASSERT_EQ(p->plurality().choice(), "A");

  auto r = cballot::MakeRankedBallot("r", {"B", "A", "C"});
  ASSERT_EQ(r->vote_case(), ballotpb::Ballot::kRanked);
  ASSERT_EQ(r->ranked().choices_size(), 3);
  ASSERT_EQ(r->ranked().choices(0), "B");
  ASSERT_EQ(r->ranked().choices(2), "C");

  auto s = cballot::MakeScoreBallot("s", {{"A", 5}, {"B", -1.5}});
  ASSERT_EQ(s->vote_case(), ballotpb::Ballot::kScore);
  ASSERT_EQ(s->score().scores().size(), 2u);
  ASSERT_EQ(s->score().scores().at("B"), -1.5);
}

// An approval ballot lists each candidate once, in first-seen order.
TEST(Ballot, ApprovalCollapsesDuplicates) {
  auto a = cballot::MakeApprovalBallot("a", {"B", "A", "B", "A", "C"});
  ASSERT_EQ(a->vote_case(), ballotpb::Ballot::kApproval);
  ASSERT_EQ(a->approval().choices_size(), 3);
  ASSERT_EQ(a->approval().choices(0), "B");
  ASSERT_EQ(a->approval().choices(1), "A");
  ASSERT_EQ(a->approval().choices(2), "C");
}

TEST(Ballot, Candidates) {
  struct Test {
    cballot::BallotPtr ballot;

    std::vector<cballot::Candidate> wcandidates;
  };

  std::vector<Test> tests = {
    {cballot::MakePluralityBallot("1", "A"), {"A"}},
    {cballot::MakeApprovalBallot("2", {"C", "A"}), {"A", "C"}},
    {cballot::MakeApprovalBallot("3", {}), {}},
    {cballot::MakeRankedBallot("4", {"C", "B", "C"}), {"B", "C"}},
    {cballot::MakeScoreBallot("5", {{"B", 1}, {"A", 0}}), {"A", "B"}},
    {std::make_shared<ballotpb::Ballot>(), {}},
  };

  for (size_t i = 0; i < tests.size(); i++) {
    auto& tt = tests[i];
    ASSERT_EQ(cballot::BallotCandidates(*tt.ballot), tt.wcandidates) << "#" << i;
  }
}

TEST(Ballot, TypeName) {
  ASSERT_STREQ(cballot::BallotTypeName(ballotpb::Ballot::kPlurality), "plurality");
  ASSERT_STREQ(cballot::BallotTypeName(ballotpb::Ballot::kApproval), "approval");
  ASSERT_STREQ(cballot::BallotTypeName(ballotpb::Ballot::kRanked), "ranked");
  ASSERT_STREQ(cballot::BallotTypeName(ballotpb::Ballot::kScore), "score");
  ASSERT_STREQ(cballot::BallotTypeName(ballotpb::Ballot::VOTE_NOT_SET), "unset");
}
