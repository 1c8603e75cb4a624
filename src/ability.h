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

#ifndef SRC_ABILITY_H_
#define SRC_ABILITY_H_

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "src/game_log.pb.h"
#include "src/game_time.h"

namespace mafia {

using std::set;
using std::shared_ptr;
using std::string;
using std::vector;

const int kNoPlayer = -1;  // Used in place of player index.

class GameState;
class Modifier;
class ResolutionContext;

// A single use of an ability during resolution.
struct Visit {
  int ability = -1;  // Index of the ability instance in the game.
  int user = kNoPlayer;
  vector<int> targets;
  int64_t seq = 0;  // Insertion order.
  bool passive = false;
  bool blocked = false;  // Roleblocked before its turn.
  bool resolved = false;
  int hits = 0;  // Number of times the effect was triggered (protections).
  Outcome outcome = OUTCOME_UNSPECIFIED;
  string detail;
};

// The behavior of an ability. Every ability type implements this interface.
class Effect {
 public:
  virtual ~Effect() = default;

  // Extra target checks at queue time, beyond count and liveness.
  virtual absl::Status ValidateTargets(const GameState& g, int user,
                                       absl::Span<const int> targets) const {
    return absl::OkStatus();
  }

  // Applies the effect. All the participants are alive at this point.
  virtual Outcome Apply(ResolutionContext* ctx, Visit* visit) const = 0;

  // Number of uses a resolved passive consumes.
  virtual int PassiveUses(const Visit& visit) const {
    return visit.outcome == SUCCESS ? 1 : 0;
  }
};

// Immutable description of an ability. Templates hold these, and modifiers
// transform copies of them when a player is instantiated.
struct AbilitySpec {
  string id;
  string description;
  AbilityKind kind = ACTION;
  Phase phase = NIGHT;  // PHASE_UNSPECIFIED for any phase.
  bool immediate = false;  // Resolves at queue time.
  int target_count = 1;
  bool self_targeted = false;  // Targets are implicitly the user.
  bool allow_self_target = false;
  int priority = 0;  // Lower resolves first.
  EffectCategory category = PROTECTIVE;
  int max_uses = 0;  // 0 for unlimited.
  set<string> tags;
  shared_ptr<const Effect> effect;

  bool HasTag(const string& tag) const { return tags.count(tag) > 0; }
};

struct AbilityUseRecord {
  Time time;
  vector<int> targets;
};

// A per-game instance of an ability, owned by a player or an alignment.
struct AbilityInstance {
  AbilitySpec spec;
  // In application order: the last modifier is the outermost wrapper.
  vector<shared_ptr<const Modifier>> modifiers;
  int owner = kNoPlayer;  // Owning player, kNoPlayer for shared actions.
  int alignment = -1;  // Owning alignment, for shared actions.
  int uses = 0;
  vector<AbilityUseRecord> history;
  bool active = true;

  bool IsShared() const { return spec.kind == SHARED_ACTION; }
  bool UsesExhausted() const {
    return spec.max_uses > 0 && uses >= spec.max_uses;
  }
};
}  // namespace mafia

#endif  // SRC_ABILITY_H_
