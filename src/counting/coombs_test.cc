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
#include <memory>
#include <vector>

#include "gtest/gtest.h"
#include "src/ballot.h"
#include "src/counting/counting.h"
#include "src/test_util.h"

TEST(Coombs, Count) {
  struct Test {
    cballot::BallotPtrs ballots;

    cballot::OutcomeType wtype;
    cballot::CandidateSet wwinners;
  };

  std::vector<Test> tests = {
    {cballot::RankedBallots({{"A", "B"}, {"A", "B"}, {"B", "C"}}),
     cballot::kWinner, cballot::Set({"A"})},
    // B collects the most last places and goes first
    {cballot::RankedDistribution({{{"A", "B"}, 3},
                                  {{"B", "A"}, 1},
                                  {{"C", "D"}, 1},
                                  {{"D", "C"}, 1}}),
     cballot::kWinner, cballot::Set({"A"})},
    {cballot::StanfordBallots(), cballot::kWinner, cballot::Set({"B"})},
    // a cycle eliminates everyone at once
    {cballot::RankedBallots({{"A", "B"}, {"B", "C"}, {"C", "A"}}),
     cballot::kNoWinner, {}},
    {cballot::RankedBallots({{}, {}}), cballot::kNoWinner, {}},
    {cballot::BallotPtrs(), cballot::kNoWinner, {}},
  };

  for (size_t i = 0; i < tests.size(); i++) {
    auto& tt = tests[i];
    auto [outcome, s] = cballot::Coombs(tt.ballots);
    ASSERT_TRUE(s.IsOK()) << "#" << i << " " << s.Str();
    ASSERT_EQ(outcome.Type(), tt.wtype) << "#" << i;
    ASSERT_EQ(outcome.Winners(), tt.wwinners) << "#" << i;
  }
}

TEST(Coombs, Cycle) {
  auto logger = std::make_shared<cballot::RecordingLogger>();
  cballot::CoombsCounter::Config c;
  c.logger = logger;

  auto [counter, s] = cballot::CoombsCounter::New(
      c, cballot::RankedBallots({{"A", "B"}, {"B", "C"}, {"C", "A"}}));
  ASSERT_TRUE(s.IsOK());

  ASSERT_FALSE(counter->Step());
  ASSERT_EQ(counter->State().eliminated, cballot::Set({"A", "B", "C"}));
  ASSERT_TRUE(logger->Contains("coombs round 1: eliminated A,B,C"));

  ASSERT_TRUE(counter->Step());
  ASSERT_EQ(counter->State().round, 2u);
  ASSERT_EQ(counter->Result().Type(), cballot::kNoWinner);
  ASSERT_TRUE(logger->Contains("[INFO] coombs round 2"));
}

TEST(Coombs, StanfordRounds) {
  auto [counter, s] = cballot::CoombsCounter::New(
      cballot::CoombsCounter::Config(), cballot::StanfordBallots());
  ASSERT_TRUE(s.IsOK());

  ASSERT_FALSE(counter->Step());
  ASSERT_EQ(counter->State().eliminated, cballot::Set({"A"}));
  ASSERT_TRUE(counter->Step());
  ASSERT_EQ(counter->Result().Winner(), "B");
}

TEST(Coombs, Errors) {
  auto [outcome, s] = cballot::Coombs(cballot::ScoreBallots({{{"A", 1}}}));
  ASSERT_TRUE(s.Is(cballot::kErrBallotType));

  cballot::CoombsCounter::Config c;
  c.logger = nullptr;
  auto [counter, s2] = cballot::CoombsCounter::New(c, cballot::BallotPtrs());
  ASSERT_TRUE(s2.Is(cballot::kErrInvalidArgument));
  ASSERT_TRUE(counter == nullptr);
}

TEST(Coombs, Stream) {
  auto ballots = cballot::StanfordBallots();
  cballot::SliceBallotStream stream(ballots);
  auto [outcome, s] = cballot::Coombs(stream);
  ASSERT_TRUE(s.IsOK());
  ASSERT_EQ(outcome.Winner(), "B");
}
