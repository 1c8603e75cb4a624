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

#ifndef SRC_EFFECTS_H_
#define SRC_EFFECTS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "src/ability.h"
#include "src/game_log.pb.h"
#include "src/knowledge.h"

namespace mafia {

using std::string;

// Kills the target, unless the target is protected. Cannot target players
// the user knows to be allies.
class Kill : public Effect {
 public:
  absl::Status ValidateTargets(const GameState& g, int user,
                               absl::Span<const int> targets) const override;
  Outcome Apply(ResolutionContext* ctx, Visit* visit) const override;
};

// Protects the target from up to limit kills (0 for any number). A protector
// that dies in place is killed instead of the target.
class Protect : public Effect {
 public:
  Protect(int limit, bool dies_in_place)
      : limit_(limit), dies_in_place_(dies_in_place) {}
  Outcome Apply(ResolutionContext* ctx, Visit* visit) const override;
  // Passive protections are used up only by the kills they stop.
  int PassiveUses(const Visit& visit) const override { return visit.hits; }

 private:
  int limit_;
  bool dies_in_place_;
};

// Blocks the target's abilities that did not resolve yet.
class Roleblock : public Effect {
 public:
  Outcome Apply(ResolutionContext* ctx, Visit* visit) const override;
};

// Roleblocks and protects the target from any number of kills.
class Jail : public Effect {
 public:
  Outcome Apply(ResolutionContext* ctx, Visit* visit) const override;
};

// Swaps two players: abilities that did not resolve yet targeting one of them
// target the other instead.
class Redirect : public Effect {
 public:
  absl::Status ValidateTargets(const GameState& g, int user,
                               absl::Span<const int> targets) const override;
  Outcome Apply(ResolutionContext* ctx, Visit* visit) const override;
};

// Sends the user a result message about the target, and possibly teaches the
// user a fact about the target.
class Investigate : public Effect {
 public:
  Outcome Apply(ResolutionContext* ctx, Visit* visit) const override;

 protected:
  virtual string Result(const ResolutionContext& ctx, int target) const = 0;
  virtual Fact Learned(const GameState& g, int target) const { return {}; }
};

// Whether the target is aligned with the Town (Cop).
class AlignmentCheck : public Investigate {
 protected:
  string Result(const ResolutionContext& ctx, int target) const override;
  Fact Learned(const GameState& g, int target) const override;
};

// The target's role (Rolecop).
class RoleCheck : public Investigate {
 protected:
  string Result(const ResolutionContext& ctx, int target) const override;
  Fact Learned(const GameState& g, int target) const override;
};

// Whether the target is Vanilla (Vanilla Cop).
class VanillaCheck : public Investigate {
 protected:
  string Result(const ResolutionContext& ctx, int target) const override;
  Fact Learned(const GameState& g, int target) const override;
};

// Whom the target targeted (Tracker).
class Track : public Investigate {
 protected:
  string Result(const ResolutionContext& ctx, int target) const override;
};

// Who targeted the target (Watcher).
class Watch : public Investigate {
 protected:
  string Result(const ResolutionContext& ctx, int target) const override;
};

// Tells the target the user's alignment (Friendly Neighbor).
class Inform : public Effect {
 public:
  Outcome Apply(ResolutionContext* ctx, Visit* visit) const override;
};

// Publicly reveals the user's alignment to everyone (Innocent Child).
class Reveal : public Effect {
 public:
  Outcome Apply(ResolutionContext* ctx, Visit* visit) const override;
};
}  // namespace mafia

#endif  // SRC_EFFECTS_H_
