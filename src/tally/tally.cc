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
#include "src/tally/tally.h"

#include <sstream>

#include "src/outcome.h"

namespace cballot {

void Tally::Add(const Candidate& candidate, double weight) {
  double& score = totals_[candidate];
  score += weight;
  total_ += weight;

  if (pairs_++ == 0) {
    max_ = score;
    leaders_ = {candidate};
    return;
  }

  if (score > max_) {
    max_ = score;
    leaders_.clear();
    leaders_.insert(candidate);
  } else if (score == max_) {
    leaders_.insert(candidate);
  } else if (leaders_.erase(candidate) != 0 && leaders_.empty()) {
    // A negative weight dropped the only leader below the maximum.
    Rebuild();
  }
}

void Tally::Rebuild() {
  leaders_.clear();
  bool first = true;
  for (auto& p : totals_) {
    if (first || p.second > max_) {
      max_ = p.second;
      leaders_.clear();
      leaders_.insert(p.first);
      first = false;
    } else if (p.second == max_) {
      leaders_.insert(p.first);
    }
  }
}

std::tuple<CandidateSet, Status> Tally::Leaders() const {
  if (Empty()) {
    return std::make_tuple(CandidateSet{},
                           Status::Error("%s: no scores to tally", kErrEmptyInput));
  }
  return std::make_tuple(leaders_, Status::OK());
}

CandidateSet Tally::Losers() const {
  CandidateSet losers;
  double min = 0;
  for (auto& p : totals_) {
    if (losers.empty() || p.second < min) {
      min = p.second;
      losers.clear();
      losers.insert(p.first);
    } else if (p.second == min) {
      losers.insert(p.first);
    }
  }
  return losers;
}

double Tally::Of(const Candidate& candidate) const {
  auto it = totals_.find(candidate);
  if (it == totals_.end()) {
    return 0;
  }
  return it->second;
}

std::string Tally::String() const {
  std::stringstream ss;
  ss << "{";
  bool first = true;
  for (auto& p : totals_) {
    if (!first) {
      ss << ", ";
    }
    ss << p.first << ":" << p.second;
    first = false;
  }
  ss << "}";
  return ss.str();
}

std::tuple<CandidateSet, Status> MaxScores(const std::vector<ScorePair>& scores) {
  Tally tally;
  for (auto& p : scores) {
    tally.Add(p.first, p.second);
  }
  return tally.Leaders();
}

}  // namespace cballot
