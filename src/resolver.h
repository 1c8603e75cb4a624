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

#ifndef SRC_RESOLVER_H_
#define SRC_RESOLVER_H_

#include <map>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "src/ability.h"
#include "src/game_log.pb.h"

namespace mafia {

using std::map;
using std::string;
using std::vector;

class GameState;

// The state of one resolution pass, handed to effects and modifiers.
class ResolutionContext {
 public:
  ResolutionContext(GameState* game, vector<Visit> visits);

  GameState* game() { return game_; }
  const GameState& game() const { return *game_; }
  const vector<Visit>& visits() const { return visits_; }
  const Visit& current() const { return visits_[current_]; }
  int living_non_town_at_start() const { return living_non_town_at_start_; }

  // Blocks the not-yet-resolved non-passive abilities used by the player.
  // Returns the number of blocked abilities.
  int Roleblock(int player);

  // Swaps the two players in the targets of every not-yet-resolved ability
  // other than the current one. Returns the number of changed abilities.
  int Redirect(int first, int second);

  // Protects the target from kills for the rest of the pass. A limit of 0
  // means unlimited kills are stopped.
  void Protect(int target, int limit, bool dies_in_place);

  // Returns whether a protection on the target stopped a kill. Consumes the
  // protection; a protector that dies in place is killed.
  bool AbsorbKill(int target);

  // Players targeted by the visible abilities of the player.
  vector<int> TargetsOf(int player) const;

  // Users of the visible abilities targeting the player.
  vector<int> VisitorsOf(int player) const;

 private:
  friend class Resolver;

  struct Protection {
    int visit;
    int remaining;  // Negative for unlimited.
    bool dies_in_place;
  };

  bool IsVisible(int i) const;

  GameState* game_;
  vector<Visit> visits_;
  int current_ = 0;
  int living_non_town_at_start_ = 0;
  map<int, vector<Protection>> protections_;
};

vector<EffectCategory> DefaultCategoryOrder();

// The category order must be a permutation of all the effect categories.
absl::Status ValidateCategoryOrder(absl::Span<const EffectCategory> order);

// Resolves the abilities of a phase. Abilities resolve in ascending priority,
// then by category in the configured order, then in insertion order.
class Resolver {
 public:
  explicit Resolver(absl::Span<const EffectCategory> category_order);

  // Resolves all queued abilities of the current phase and the passives that
  // fire in it, then eliminates the vote winner, clears the queue, records
  // the ability uses and evaluates the win conditions.
  vector<ResolutionRecord> Resolve(GameState* g) const;

  // Resolves an immediate ability right away.
  ResolutionRecord ResolveImmediate(GameState* g, int ability, int user,
                                    const vector<int>& targets) const;

  // Returns the visits in resolution order.
  vector<Visit> Order(const GameState& g, vector<Visit> visits) const;

 private:
  vector<Visit> CollectVisits(const GameState& g) const;
  void ResolveVisit(ResolutionContext* ctx, int i) const;
  ResolutionRecord ToRecord(const GameState& g, const Visit& v) const;

  map<EffectCategory, int> rank_;
};
}  // namespace mafia

#endif  // SRC_RESOLVER_H_
