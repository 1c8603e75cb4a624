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

#include "src/ability_queue.h"

#include "ortools/base/logging.h"

namespace mafia {

namespace {
bool SameKey(const QueuedAbility& q, int ability, bool shared, int user) {
  if (q.ability != ability || q.shared != shared) {
    return false;
  }
  return shared || q.user == user;
}
}  // namespace

void AbilityQueue::Queue(int ability, bool shared, int user,
                         const vector<int>& targets, const Time& time) {
  CHECK_GE(ability, 0);
  CHECK_NE(user, kNoPlayer);
  const int i = FindIndex(ability, shared, user);
  if (i >= 0) {
    entries_.erase(entries_.begin() + i);
  }
  entries_.push_back({.ability = ability, .user = user, .shared = shared,
                      .targets = targets, .time = time, .seq = next_seq_++});
  CheckUniqueKeys();
}

bool AbilityQueue::Dequeue(int ability, bool shared, int user) {
  const int i = FindIndex(ability, shared, user);
  if (i < 0) {
    return false;
  }
  entries_.erase(entries_.begin() + i);
  return true;
}

const QueuedAbility* AbilityQueue::Find(int ability, bool shared,
                                        int user) const {
  const int i = FindIndex(ability, shared, user);
  return i < 0 ? nullptr : &entries_[i];
}

int AbilityQueue::FindIndex(int ability, bool shared, int user) const {
  for (int i = 0; i < entries_.size(); ++i) {
    if (SameKey(entries_[i], ability, shared, user)) {
      return i;
    }
  }
  return -1;
}

void AbilityQueue::CheckUniqueKeys() const {
  for (int i = 0; i < entries_.size(); ++i) {
    const QueuedAbility& q = entries_[i];
    for (int j = i + 1; j < entries_.size(); ++j) {
      CHECK(!SameKey(entries_[j], q.ability, q.shared, q.user))
          << "Duplicate queued ability " << q.ability << " of user " << q.user;
    }
  }
}
}  // namespace mafia
