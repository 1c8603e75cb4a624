// Copyright 2022 Ola Rozenfeld
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

#ifndef SRC_ABILITY_QUEUE_H_
#define SRC_ABILITY_QUEUE_H_

#include <cstdint>
#include <vector>

#include "src/ability.h"
#include "src/game_time.h"

namespace mafia {

using std::vector;

struct QueuedAbility {
  int ability = -1;  // Index of the ability instance in the game.
  int user = kNoPlayer;
  bool shared = false;  // Keyed by ability only.
  vector<int> targets;
  Time time;
  int64_t seq = 0;  // Insertion order.
};

// Pending ability uses of the current phase. There is at most one entry per
// (ability, user); shared abilities have at most one entry per ability, held
// by the member that queued it last.
class AbilityQueue {
 public:
  // Replaces any previous entry of the same key. The new entry goes last.
  void Queue(int ability, bool shared, int user, const vector<int>& targets,
             const Time& time);
  // Returns whether an entry was removed.
  bool Dequeue(int ability, bool shared, int user);
  // Returns nullptr if the ability is not queued.
  const QueuedAbility* Find(int ability, bool shared, int user) const;
  const vector<QueuedAbility>& Snapshot() const { return entries_; }
  bool Empty() const { return entries_.empty(); }
  void Clear() { entries_.clear(); }
  int64_t next_seq() const { return next_seq_; }

 private:
  int FindIndex(int ability, bool shared, int user) const;
  void CheckUniqueKeys() const;

  vector<QueuedAbility> entries_;
  int64_t next_seq_ = 0;
};
}  // namespace mafia

#endif  // SRC_ABILITY_QUEUE_H_
