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

// CoombsCounter is an elimination count over ranked ballots that drops the
// candidates with the most last-place votes. Each round eliminated
// candidates are struck from every ballot and emptied ballots are set aside.
// A candidate first on more than half of the remaining ballots wins;
// otherwise everyone tied for the most last places is eliminated. The count
// ends without a winner once no ballot remains.
class CoombsCounter {
 public:
  struct Config {
    LoggerPtr logger = std::make_shared<ConsoleLogger>();

    Status Validate() const;
  };

  // New validates the config and checks that every ballot is ranked.
  static std::tuple<std::unique_ptr<CoombsCounter>, Status> New(
      const Config& c, BallotPtrs ballots);

  CoombsCounter(const Config& c, BallotPtrs ballots)
      : config_(c), ballots_(std::move(ballots)), done_(false) {}

  // Step runs a single round and returns true once the count is over.
  bool Step();

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

CountResult Coombs(const BallotPtrs& ballots);
CountResult Coombs(BallotStream& ballots);

}  // namespace cballot
