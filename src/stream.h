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

#include <functional>
#include <tuple>

#include "cballot/noncopyable.h"
#include "src/define.h"

namespace cballot {

// BallotStream is a one-way source of ballots. Each ballot is handed out
// once, in order; a stream cannot be rewound or copied. Sources may be
// unbounded or produce ballots lazily.
class BallotStream : public noncopyable {
 public:
  virtual ~BallotStream() = default;

  // Next returns the next ballot and true, or a null ballot and false once
  // the stream is exhausted.
  virtual std::tuple<BallotPtr, bool> Next() = 0;
};

// SliceBallotStream reads an existing collection without copying it. The
// collection must outlive the stream.
class SliceBallotStream : public BallotStream {
 public:
  explicit SliceBallotStream(const BallotPtrs& ballots)
      : ballots_(ballots), pos_(0) {}

  std::tuple<BallotPtr, bool> Next() override {
    if (pos_ >= ballots_.size()) {
      return std::make_tuple(nullptr, false);
    }
    return std::make_tuple(ballots_[pos_++], true);
  }

 private:
  const BallotPtrs& ballots_;
  size_t pos_;
};

// GeneratorBallotStream pulls ballots from a producer function until the
// producer reports exhaustion.
class GeneratorBallotStream : public BallotStream {
 public:
  using Producer = std::function<std::tuple<BallotPtr, bool>()>;

  explicit GeneratorBallotStream(Producer producer)
      : producer_(std::move(producer)), done_(false) {}

  std::tuple<BallotPtr, bool> Next() override;

 private:
  Producer producer_;
  bool done_;
};

// Materialize drains the stream into a replayable collection.
BallotPtrs Materialize(BallotStream& stream);

}  // namespace cballot
