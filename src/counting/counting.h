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

#include "src/counting/coombs.h"
#include "src/counting/instant_runoff.h"
#include "src/define.h"
#include "src/outcome.h"
#include "src/stream.h"
#include "src/tally/tally.h"

namespace cballot {

// Every counter returns the winning set and an OK status, or an empty
// outcome and the precondition it found violated. Counters only read the
// ballots they are given.
//
// The single-pass counters below consume a BallotStream exactly once, in
// order. Each also accepts a collection, which is read through a
// SliceBallotStream.

// CheckBallotType fails with kErrBallotType unless ballot is non-null and of
// the wanted variant.
Status CheckBallotType(const BallotPtr& ballot, VoteCase want,
                       const char* counter);

// LeadersOutcome turns the tally's leaders into a count result.
CountResult LeadersOutcome(const Tally& tally);

// Plurality grants the win to the candidate named by the most plurality
// ballots. Ties report every leader.
CountResult Plurality(BallotStream& ballots);
CountResult Plurality(const BallotPtrs& ballots);

// Quota returns every candidate whose share of the plurality ballots is at
// least q. A q greater than 1 is read as a percentage, otherwise as a
// fraction; q must be within (0, 100]. Nobody reaching the quota is a
// kNoWinner outcome.
CountResult Quota(BallotStream& ballots, double q);
CountResult Quota(const BallotPtrs& ballots, double q);

// Borda credits the candidate at 0-based rank i of an n-long ranked ballot
// with n - i - 1 + starting_at points. starting_at must be 0 or 1. Moving
// from 0 to 1 raises each total by the number of ballots naming the
// candidate, so the winners only agree when every ballot ranks everyone.
double BordaPoints(int n, int i, int starting_at);

CountResult Borda(BallotStream& ballots, int starting_at = 1);
CountResult Borda(const BallotPtrs& ballots, int starting_at = 1);

// Dowdall credits the candidate at 0-based rank i with 1 / (i + 1) points.
double DowdallPoints(int i);

CountResult Dowdall(BallotStream& ballots);
CountResult Dowdall(const BallotPtrs& ballots);

// Approval credits one point to each distinct candidate an approval ballot
// names.
CountResult Approval(BallotStream& ballots);
CountResult Approval(const BallotPtrs& ballots);

// Score sums the raw scores of each candidate over all score ballots. The
// sum orders candidates like the mean only when every ballot scores every
// candidate; partial ballots are summed all the same.
CountResult Score(BallotStream& ballots);
CountResult Score(const BallotPtrs& ballots);

// MajorityJudgement picks the candidates with the highest median score. All
// scores are buffered per candidate until the stream ends.
CountResult MajorityJudgement(BallotStream& ballots);
CountResult MajorityJudgement(const BallotPtrs& ballots);

// PluralityWithRunoff lets a candidate with more than half of the first
// choices win outright. Otherwise everyone tied for first and everyone tied
// for second go to a single runoff, where each ranked ballot counts for its
// most preferred runoff candidate. The runoff leader wins only with more
// than half of the ballots counted in the runoff.
CountResult PluralityWithRunoff(const BallotPtrs& ballots);
CountResult PluralityWithRunoff(BallotStream& ballots);

}  // namespace cballot
