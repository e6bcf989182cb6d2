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

#include <memory>
#include <tuple>

#include "cballot/status.h"
#include "src/counting/round.h"
#include "src/define.h"
#include "src/logger.h"
#include "src/outcome.h"
#include "src/stream.h"

namespace cballot {

// InstantRunoffCounter counts ranked ballots by repeated elimination. Each
// round every ballot counts for its most preferred candidate that is still
// standing. A leader holding more than win_percentage of the round's votes
// wins. Otherwise everyone tied for the fewest votes is eliminated and the
// next round starts. Ballots whose candidates are all eliminated drop out of
// the count.
class InstantRunoffCounter {
 public:
  struct Config {
    // win_percentage is the share of a round's votes, in percent, that the
    // leader must exceed. It must be within [50, 100], which also rules out
    // a tie for the win.
    double win_percentage = 50.0;

    // logger receives one debug line per round and the final decision.
    LoggerPtr logger = std::make_shared<ConsoleLogger>();

    Status Validate() const;
  };

  // New validates the config and checks that every ballot is ranked.
  static std::tuple<std::unique_ptr<InstantRunoffCounter>, Status> New(
      const Config& c, BallotPtrs ballots);

  InstantRunoffCounter(const Config& c, BallotPtrs ballots)
      : config_(c), ballots_(std::move(ballots)), done_(false) {}

  // Step runs a single round and returns true once the count is over. It is
  // a no-op after termination.
  bool Step();

  // Count steps until termination and returns the result.
  const Outcome& Count();

  bool Done() const { return done_; }
  const RoundState& State() const { return state_; }
  const Outcome& Result() const { return outcome_; }

 private:
  Config config_;
  BallotPtrs ballots_;
  RoundState state_;
  Outcome outcome_;
  bool done_;
};

// InstantRunoff counts the ballots with a default-configured counter. If
// every ballot runs out of standing candidates the result is kNoWinner.
CountResult InstantRunoff(const BallotPtrs& ballots,
                          double win_percentage = 50.0);
// The stream is materialized once; every round replays the whole set.
CountResult InstantRunoff(BallotStream& ballots, double win_percentage = 50.0);

}  // namespace cballot
