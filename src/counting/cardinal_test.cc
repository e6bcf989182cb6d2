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
#include <limits>
#include <map>
#include <vector>

#include "gtest/gtest.h"
#include "src/ballot.h"
#include "src/counting/counting.h"
#include "src/test_util.h"

TEST(Approval, Count) {
  struct Test {
    std::vector<std::vector<cballot::Candidate>> choices;

    cballot::CandidateSet wwinners;
  };

  std::vector<Test> tests = {
    {{{"A", "B"}, {"B", "C"}}, cballot::Set({"B"})},
    {{{"A", "C"}, {"B", "D"}}, cballot::Set({"A", "B", "C", "D"})},
    {{{"A"}, {}, {"A", "B"}}, cballot::Set({"A"})},
  };

  for (size_t i = 0; i < tests.size(); i++) {
    auto& tt = tests[i];
    auto [outcome, s] = cballot::Approval(cballot::ApprovalBallots(tt.choices));
    ASSERT_TRUE(s.IsOK()) << "#" << i << " " << s.Str();
    ASSERT_EQ(outcome.Winners(), tt.wwinners) << "#" << i;
  }
}

// A ballot built by hand with a repeated choice still approves only once.
TEST(Approval, RepeatedChoice) {
  auto stuffed = std::make_shared<ballotpb::Ballot>();
  stuffed->set_id("x");
  stuffed->mutable_approval()->add_choices("A");
  stuffed->mutable_approval()->add_choices("A");
  stuffed->mutable_approval()->add_choices("A");

  auto ballots = cballot::ApprovalBallots({{"B", "C"}, {"B"}});
  ballots.push_back(stuffed);

  auto [outcome, s] = cballot::Approval(ballots);
  ASSERT_TRUE(s.IsOK());
  ASSERT_EQ(outcome.Type(), cballot::kWinner);
  ASSERT_EQ(outcome.Winner(), "B");
}

TEST(Approval, EmptyAndWrongType) {
  auto [outcome, s] = cballot::Approval(cballot::BallotPtrs());
  ASSERT_TRUE(s.Is(cballot::kErrEmptyInput));

  // Ballots that approve of nobody leave nothing to count.
  auto [outcome2, s2] = cballot::Approval(cballot::ApprovalBallots({{}, {}}));
  ASSERT_TRUE(s2.Is(cballot::kErrEmptyInput));

  auto [outcome3, s3] = cballot::Approval(cballot::RankedBallots({{"A"}}));
  ASSERT_TRUE(s3.Is(cballot::kErrBallotType));
}

TEST(Score, Count) {
  struct Test {
    std::vector<std::map<cballot::Candidate, double>> scores;

    cballot::CandidateSet wwinners;
  };

  std::vector<Test> tests = {
    {{{{"A", 5}, {"B", 4}, {"C", 1}}, {{"A", 1}, {"B", 4}, {"C", 1}}},
     cballot::Set({"B"})},
    {{{{"A", 5}, {"B", 5}, {"C", 1}}, {{"A", 5}, {"B", 5}, {"C", 1}}},
     cballot::Set({"A", "B"})},
    // scores are summed, negatives included
    {{{{"A", 5}}, {{"A", -10}, {"B", 1}}}, cballot::Set({"B"})},
  };

  for (size_t i = 0; i < tests.size(); i++) {
    auto& tt = tests[i];
    auto [outcome, s] = cballot::Score(cballot::ScoreBallots(tt.scores));
    ASSERT_TRUE(s.IsOK()) << "#" << i << " " << s.Str();
    ASSERT_EQ(outcome.Winners(), tt.wwinners) << "#" << i;
  }
}

TEST(Score, EmptyAndWrongType) {
  auto [outcome, s] = cballot::Score(cballot::BallotPtrs());
  ASSERT_TRUE(s.Is(cballot::kErrEmptyInput));

  auto [outcome2, s2] = cballot::Score(cballot::ApprovalBallots({{"A"}}));
  ASSERT_TRUE(s2.Is(cballot::kErrBallotType));
}

TEST(MajorityJudgement, Count) {
  struct Test {
    std::vector<std::map<cballot::Candidate, double>> scores;

    cballot::CandidateSet wwinners;
  };

  std::vector<Test> tests = {
    // medians: A 2, B 3, C 2
    {{{{"A", 1}, {"B", 3}, {"C", 2}},
      {{"A", 2}, {"B", 3}, {"C", 2}},
      {{"A", 5}, {"B", 1}, {"C", 2}},
      {{"A", 2}, {"B", 4}, {"C", 3}},
      {{"A", 4}, {"B", 3}, {"C", 1}}},
     cballot::Set({"B"})},
    // medians: A 3, B 3
    {{{{"A", 1}, {"B", 3}}, {{"A", 3}, {"B", 3}}, {{"A", 5}, {"B", 3}}},
     cballot::Set({"A", "B"})},
    // an even number of grades averages the middle pair: A 2.5, B 2
    {{{{"A", 1}, {"B", 2}}, {{"A", 4}, {"B", 2}}}, cballot::Set({"A"})},
    // a candidate is judged only by the ballots that grade it
    {{{{"A", 1}}, {{"B", 2}}}, cballot::Set({"B"})},
  };

  for (size_t i = 0; i < tests.size(); i++) {
    auto& tt = tests[i];
    auto [outcome, s] = cballot::MajorityJudgement(cballot::ScoreBallots(tt.scores));
    ASSERT_TRUE(s.IsOK()) << "#" << i << " " << s.Str();
    ASSERT_EQ(outcome.Winners(), tt.wwinners) << "#" << i;
  }
}

TEST(MajorityJudgement, EmptyAndWrongType) {
  auto [outcome, s] = cballot::MajorityJudgement(cballot::BallotPtrs());
  ASSERT_TRUE(s.Is(cballot::kErrEmptyInput));
  ASSERT_FALSE(outcome.HasWinner());

  auto [outcome2, s2] = cballot::MajorityJudgement(cballot::ScoreBallots({{}, {}}));
  ASSERT_TRUE(s2.Is(cballot::kErrEmptyInput));

  auto [outcome3, s3] = cballot::MajorityJudgement(cballot::PluralityBallots({"A"}));
  ASSERT_TRUE(s3.Is(cballot::kErrBallotType));
}

TEST(Score, NonFiniteScores) {
  double nan = std::numeric_limits<double>::quiet_NaN();
  double inf = std::numeric_limits<double>::infinity();

  for (double bad : {nan, inf, -inf}) {
    auto ballots = cballot::ScoreBallots({{{"A", 3}, {"B", 1}},
                                          {{"A", bad}, {"B", 4}}});

    auto [score, s] = cballot::Score(ballots);
    ASSERT_TRUE(s.Is(cballot::kErrInvalidArgument)) << bad;
    ASSERT_FALSE(score.HasWinner()) << bad;

    auto [judged, s2] = cballot::MajorityJudgement(ballots);
    ASSERT_TRUE(s2.Is(cballot::kErrInvalidArgument)) << bad;
    ASSERT_FALSE(judged.HasWinner()) << bad;
  }
}
