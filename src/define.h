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

#include <deque>
#include <memory>
#include <set>
#include <string>

#include "src/ballotpb/ballot.pb.h"

namespace cballot {

// A candidate is an opaque token, compared only by equality.
using Candidate = std::string;
using CandidateSet = std::set<Candidate>;

// Ballots are shared read-only once built.
using BallotPtr = std::shared_ptr<const ballotpb::Ballot>;
using BallotPtrs = std::deque<BallotPtr>;

using VoteCase = ballotpb::Ballot::VoteCase;

}  // namespace cballot
