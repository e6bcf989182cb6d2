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
#include "src/counting/coombs.h"

#include "src/counting/counting.h"
#include "src/tally/tally.h"
#include "src/util.h"

namespace cballot {

Status CoombsCounter::Config::Validate() const {
  if (!logger) {
    return Status::Error("%s: logger cannot be null", kErrInvalidArgument);
  }
  return Status::OK();
}

std::tuple<std::unique_ptr<CoombsCounter>, Status> CoombsCounter::New(
    const Config& c, BallotPtrs ballots) {
  auto s = c.Validate();
  if (!s.IsOK()) {
    return std::make_tuple(nullptr, std::move(s));
  }
  for (auto& ballot : ballots) {
    s = CheckBallotType(ballot, ballotpb::Ballot::kRanked, "coombs");
    if (!s.IsOK()) {
      return std::make_tuple(nullptr, std::move(s));
    }
  }
  return std::make_tuple(std::make_unique<CoombsCounter>(c, std::move(ballots)),
                         Status::OK());
}

bool CoombsCounter::Step() {
  if (done_) {
    return true;
  }
  state_.round++;

  Tally first;
  Tally last;
  uint64_t remaining = 0;
  for (auto& ballot : ballots_) {
    const Candidate* top = nullptr;
    const Candidate* bottom = nullptr;
    for (auto& choice : ballot->ranked().choices()) {
      if (state_.eliminated.count(choice) != 0) {
        continue;
      }
      if (top == nullptr) {
        top = &choice;
      }
      bottom = &choice;
    }
    if (top == nullptr) {
      continue;
    }
    first.Add(*top, 1);
    last.Add(*bottom, 1);
    remaining++;
  }

  if (remaining == 0) {
    CBALLOT_LOG_INFO(config_.logger,
                     "coombs round %llu: no ballot left, no winner",
                     static_cast<unsigned long long>(state_.round));
    done_ = true;
    outcome_ = Outcome();
    return true;
  }

  CBALLOT_LOG_DEBUG(config_.logger,
                    "coombs round %llu: %llu ballots, first places %s, last places %s",
                    static_cast<unsigned long long>(state_.round),
                    static_cast<unsigned long long>(remaining),
                    first.String().c_str(), last.String().c_str());

  if (first.Max() / static_cast<double>(remaining) > 0.5) {
    outcome_ = Outcome(std::get<0>(first.Leaders()));
    done_ = true;
    CBALLOT_LOG_INFO(config_.logger, "coombs round %llu: %s",
                     static_cast<unsigned long long>(state_.round),
                     outcome_.String().c_str());
    return true;
  }

  auto losers = std::get<0>(last.Leaders());
  state_.eliminated.insert(losers.begin(), losers.end());
  CBALLOT_LOG_DEBUG(config_.logger, "coombs round %llu: eliminated %s",
                    static_cast<unsigned long long>(state_.round),
                    Util::Join(losers, ",").c_str());
  return false;
}

const Outcome& CoombsCounter::Count() {
  while (!Step()) {
  }
  return outcome_;
}

CountResult Coombs(const BallotPtrs& ballots) {
  auto [counter, s] = CoombsCounter::New(CoombsCounter::Config(), ballots);
  if (!s.IsOK()) {
    return std::make_tuple(Outcome(), std::move(s));
  }
  return std::make_tuple(counter->Count(), Status::OK());
}

CountResult Coombs(BallotStream& ballots) {
  return Coombs(Materialize(ballots));
}

}  // namespace cballot
