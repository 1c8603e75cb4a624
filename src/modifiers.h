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

#ifndef SRC_MODIFIERS_H_
#define SRC_MODIFIERS_H_

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/types/span.h"
#include "src/ability.h"
#include "src/game_log.pb.h"
#include "src/game_time.h"

namespace mafia {

using std::set;
using std::shared_ptr;
using std::string;
using std::vector;

// A composable transform of an ability. A role applies an ordered list of
// modifiers to each of its abilities; every hook below has a pass-through
// default, so a modifier only overrides the behaviors it changes.
class Modifier {
 public:
  virtual ~Modifier() = default;

  // Display name, used as a role name prefix (e.g. "1-Shot").
  virtual string Name() const = 0;

  // Rejects abilities the modifier cannot apply to, at instantiation.
  virtual absl::Status Validate(const AbilitySpec& spec) const {
    return absl::OkStatus();
  }

  // Changes the ability descriptor at instantiation.
  virtual void Transform(AbilitySpec* spec) const {}

  // Vetoes queuing (or a passive firing) with an IneligibleNow error.
  virtual absl::Status CheckQueue(const GameState& g, const AbilityInstance& a,
                                  int user,
                                  absl::Span<const int> targets) const {
    return absl::OkStatus();
  }

  // Returns a non-empty reason if the ability should fizzle at resolution.
  virtual string CheckResolve(const ResolutionContext& ctx,
                              const Visit& visit) const {
    return "";
  }

  // Wraps the effect; next applies the inner modifiers and the effect.
  virtual Outcome Apply(ResolutionContext* ctx, Visit* visit,
                        absl::FunctionRef<Outcome()> next) const {
    return next();
  }
};

// Limits the ability to max_uses uses over the game.
class XShot : public Modifier {
 public:
  explicit XShot(int max_uses) : max_uses_(max_uses) {}
  string Name() const override;
  void Transform(AbilitySpec* spec) const override;

 private:
  int max_uses_;
};

// The ability can only be used on the listed days or nights.
class NightX : public Modifier {
 public:
  explicit NightX(const set<int>& nights) : nights_(nights) {}
  string Name() const override;
  absl::Status CheckQueue(const GameState& g, const AbilityInstance& a,
                          int user,
                          absl::Span<const int> targets) const override;

 private:
  set<int> nights_;
};

// The ability cannot be used on two consecutive days or nights.
class NonConsecutiveNight : public Modifier {
 public:
  string Name() const override { return "Non-Consecutive Night"; }
  absl::Status CheckQueue(const GameState& g, const AbilityInstance& a,
                          int user,
                          absl::Span<const int> targets) const override;
};

// Cannot target the same player two times in a row.
class Indecisive : public Modifier {
 public:
  string Name() const override { return "Indecisive"; }
  absl::Status CheckQueue(const GameState& g, const AbilityInstance& a,
                          int user,
                          absl::Span<const int> targets) const override;
};

// The user dies when targeting a player not aligned with the Town. The effect
// still applies.
class Weak : public Modifier {
 public:
  string Name() const override { return "Weak"; }
  Outcome Apply(ResolutionContext* ctx, Visit* visit,
                absl::FunctionRef<Outcome()> next) const override;
};

// The ability can only target its user. Abilities with several targets
// cannot be made personal.
class Personal : public Modifier {
 public:
  string Name() const override { return "Personal"; }
  absl::Status Validate(const AbilitySpec& spec) const override;
  void Transform(AbilitySpec* spec) const override;
};

// Turns passive abilities into actions that have to be used explicitly.
class Activated : public Modifier {
 public:
  string Name() const override { return "Activated"; }
  void Transform(AbilitySpec* spec) const override;
};

// The ability fizzles if at most one living player not aligned with the Town
// remains at the start of the resolution.
class Lazy : public Modifier {
 public:
  string Name() const override { return "Lazy"; }
  void Transform(AbilitySpec* spec) const override;
  string CheckResolve(const ResolutionContext& ctx,
                      const Visit& visit) const override;
};

// The ability only succeeds on players of the user's alignment.
class Loyal : public Modifier {
 public:
  string Name() const override { return "Loyal"; }
  Outcome Apply(ResolutionContext* ctx, Visit* visit,
                absl::FunctionRef<Outcome()> next) const override;
};

// The ability only succeeds on players outside of the user's alignment.
class Disloyal : public Modifier {
 public:
  string Name() const override { return "Disloyal"; }
  Outcome Apply(ResolutionContext* ctx, Visit* visit,
                absl::FunctionRef<Outcome()> next) const override;
};

// Runs the queue checks of the ability's modifiers, outermost first.
absl::Status CheckModifiersQueue(const GameState& g, const AbilityInstance& a,
                                 int user, absl::Span<const int> targets);

// Returns the first fizzle reason given by the modifiers, outermost first.
string CheckModifiersResolve(const AbilityInstance& a,
                             const ResolutionContext& ctx, const Visit& visit);

// Applies the ability's effect wrapped in all of its modifiers.
Outcome ApplyWithModifiers(const AbilityInstance& a, ResolutionContext* ctx,
                           Visit* visit);
}  // namespace mafia

#endif  // SRC_MODIFIERS_H_
