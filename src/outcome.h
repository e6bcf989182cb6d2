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
#include <string>
#include <tuple>

#include "cballot/status.h"
#include "src/define.h"

namespace cballot {

// ErrEmptyInput is returned when a counter has nothing to score, or when a
// median is taken of an empty score list.
const char* const kErrEmptyInput = "empty input";

// ErrInvalidArgument is returned when a counting parameter is out of range.
const char* const kErrInvalidArgument = "invalid argument";

// ErrBallotType is returned when a counter is handed a ballot variant it
// does not know how to count.
const char* const kErrBallotType = "unsupported ballot type";

enum OutcomeType : uint8_t {
  // kNoWinner means nobody met the winning condition. It is a normal
  // result, not an error.
  kNoWinner,
  kWinner,
  // kTie means several candidates share the winning score.
  kTie,
};

const char* OutcomeTypeName(OutcomeType t);

// Outcome is the result of a count: nobody, one winner, or a tied set.
class Outcome {
 public:
  Outcome() = default;
  explicit Outcome(CandidateSet winners) : winners_(std::move(winners)) {}

  OutcomeType Type() const {
    if (winners_.empty()) {
      return kNoWinner;
    }
    return winners_.size() == 1 ? kWinner : kTie;
  }

  bool HasWinner() const { return !winners_.empty(); }

  // Winner returns the sole winner, or an empty candidate when there is
  // no winner or a tie.
  const Candidate& Winner() const;

  const CandidateSet& Winners() const { return winners_; }

  std::string String() const;

  bool operator==(const Outcome& rhs) const { return winners_ == rhs.winners_; }
  bool operator!=(const Outcome& rhs) const { return !(*this == rhs); }

 private:
  CandidateSet winners_;
};

using CountResult = std::tuple<Outcome, Status>;

}  // namespace cballot
