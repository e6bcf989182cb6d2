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
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "cballot/status.h"
#include "src/define.h"

namespace cballot {

// Tally accumulates (candidate, weight) pairs into running totals in a
// single forward pass, keeping track of the current maximum and of every
// candidate tied at it.
class Tally {
 public:
  Tally() : max_(0), total_(0), pairs_(0) {}

  // Add credits weight to the candidate's running total.
  void Add(const Candidate& candidate, double weight);

  // Empty returns true if no pair has been added yet.
  bool Empty() const { return pairs_ == 0; }

  // Leaders returns every candidate tied at the maximum total. It fails with
  // kErrEmptyInput if nothing was added.
  std::tuple<CandidateSet, Status> Leaders() const;

  // Losers returns every candidate tied at the minimum total, or an empty
  // set if nothing was added.
  CandidateSet Losers() const;

  double Max() const { return max_; }

  // Total is the sum of every weight added.
  double Total() const { return total_; }

  // Of returns the candidate's total, zero if never credited.
  double Of(const Candidate& candidate) const;

  const std::map<Candidate, double>& Totals() const { return totals_; }

  std::string String() const;

 private:
  // Rebuild recomputes the maximum and the leaders from the totals.
  void Rebuild();

 private:
  std::map<Candidate, double> totals_;
  CandidateSet leaders_;
  double max_;
  double total_;
  uint64_t pairs_;
};

using ScorePair = std::pair<Candidate, double>;

// MaxScores feeds the pairs through a Tally and returns its leaders.
std::tuple<CandidateSet, Status> MaxScores(const std::vector<ScorePair>& scores);

}  // namespace cballot
