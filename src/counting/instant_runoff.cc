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
#include "src/counting/instant_runoff.h"

#include "src/counting/counting.h"
#include "src/tally/tally.h"
#include "src/util.h"

namespace cballot {

Status InstantRunoffCounter::Config::Validate() const {
  if (!(win_percentage >= 50.0 && win_percentage <= 100.0)) {
    return Status::Error(
        "%s: instant runoff win percentage must be within [50, 100], got %g",
        kErrInvalidArgument, win_percentage);
  }

  if (!logger) {
    return Status::Error("%s: logger cannot be null", kErrInvalidArgument);
  }

  return Status::OK();
}

std::tuple<std::unique_ptr<InstantRunoffCounter>, Status>
InstantRunoffCounter::New(const Config& c, BallotPtrs ballots) {
  auto s = c.Validate();
  if (!s.IsOK()) {
    return std::make_tuple(nullptr, std::move(s));
  }
  for (auto& ballot : ballots) {
    s = CheckBallotType(ballot, ballotpb::Ballot::kRanked, "instant runoff");
    if (!s.IsOK()) {
      return std::make_tuple(nullptr, std::move(s));
    }
  }
  return std::make_tuple(
      std::make_unique<InstantRunoffCounter>(c, std::move(ballots)),
      Status::OK());
}

bool InstantRunoffCounter::Step() {
  if (done_) {
    return true;
  }
  state_.round++;

  Tally tally;
  for (auto& ballot : ballots_) {
    for (auto& choice : ballot->ranked().choices()) {
      if (state_.eliminated.count(choice) == 0) {
        tally.Add(choice, 1);
        break;
      }
    }
  }

  if (tally.Empty()) {
    CBALLOT_LOG_INFO(config_.logger,
                     "instant runoff round %llu: every ballot is exhausted, no winner",
                     static_cast<unsigned long long>(state_.round));
    done_ = true;
    outcome_ = Outcome();
    return true;
  }

  double best_percentage = tally.Max() / tally.Total() * 100;
  CBALLOT_LOG_DEBUG(config_.logger,
                    "instant runoff round %llu: tallies %s, leader share %.2f%%",
                    static_cast<unsigned long long>(state_.round),
                    tally.String().c_str(), best_percentage);

  if (best_percentage > config_.win_percentage) {
    outcome_ = Outcome(std::get<0>(tally.Leaders()));
    done_ = true;
    CBALLOT_LOG_INFO(config_.logger, "instant runoff round %llu: %s",
                     static_cast<unsigned long long>(state_.round),
                     outcome_.String().c_str());
    return true;
  }

  // Ties for last place are all eliminated in the same round.
  auto losers = tally.Losers();
  state_.eliminated.insert(losers.begin(), losers.end());
  CBALLOT_LOG_DEBUG(config_.logger,
                    "instant runoff round %llu: eliminated %s",
                    static_cast<unsigned long long>(state_.round),
                    Util::Join(losers, ",").c_str());
  return false;
}

const Outcome& InstantRunoffCounter::Count() {
  while (!Step()) {
  }
  return outcome_;
}

CountResult InstantRunoff(const BallotPtrs& ballots, double win_percentage) {
  InstantRunoffCounter::Config c;
  c.win_percentage = win_percentage;
  auto [counter, s] = InstantRunoffCounter::New(c, ballots);
  if (!s.IsOK()) {
    return std::make_tuple(Outcome(), std::move(s));
  }
  return std::make_tuple(counter->Count(), Status::OK());
}

CountResult InstantRunoff(BallotStream& ballots, double win_percentage) {
  return InstantRunoff(Materialize(ballots), win_percentage);
}

}  // namespace cballot
