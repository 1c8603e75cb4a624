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

#include "src/effects.h"

#include <vector>

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/errors.h"
#include "src/game_state.h"
#include "src/resolver.h"

namespace mafia {

using std::vector;

namespace {
const string& AbilityId(const ResolutionContext& ctx, const Visit& visit) {
  return ctx.game().ability(visit.ability).spec.id;
}

bool IsUnstoppable(const ResolutionContext& ctx, const Visit& visit) {
  return ctx.game().ability(visit.ability).spec.HasTag("unstoppable");
}

string JoinNames(const GameState& g, const vector<int>& players) {
  return absl::StrJoin(players, ", ", [&g](string* out, int p) {
    out->append(g.PlayerName(p));
  });
}
}  // namespace

absl::Status Kill::ValidateTargets(const GameState& g, int user,
                                   absl::Span<const int> targets) const {
  for (int t : targets) {
    if (t != user && g.SameAlignment(user, t) && g.Knows(user, t).has_value()) {
      return InvalidTarget(absl::StrFormat(
          "%s is a known ally of %s", g.PlayerName(t), g.PlayerName(user)));
    }
  }
  return absl::OkStatus();
}

Outcome Kill::Apply(ResolutionContext* ctx, Visit* visit) const {
  CHECK_EQ(visit->targets.size(), 1);
  const int target = visit->targets[0];
  if (!IsUnstoppable(*ctx, *visit) && ctx->AbsorbKill(target)) {
    visit->detail = "protected";
    return BLOCKED;
  }
  ctx->game()->KillPlayer(target, AbilityId(*ctx, *visit));
  return SUCCESS;
}

Outcome Protect::Apply(ResolutionContext* ctx, Visit* visit) const {
  CHECK_EQ(visit->targets.size(), 1);
  ctx->Protect(visit->targets[0], limit_, dies_in_place_);
  return SUCCESS;
}

Outcome Roleblock::Apply(ResolutionContext* ctx, Visit* visit) const {
  CHECK_EQ(visit->targets.size(), 1);
  const int blocked = ctx->Roleblock(visit->targets[0]);
  visit->detail = absl::StrFormat("blocked %d", blocked);
  return blocked > 0 ? SUCCESS : FAILURE;
}

Outcome Jail::Apply(ResolutionContext* ctx, Visit* visit) const {
  CHECK_EQ(visit->targets.size(), 1);
  const int blocked = ctx->Roleblock(visit->targets[0]);
  ctx->Protect(visit->targets[0], 0, false);
  visit->detail = absl::StrFormat("blocked %d", blocked);
  return SUCCESS;
}

absl::Status Redirect::ValidateTargets(const GameState& g, int user,
                                       absl::Span<const int> targets) const {
  if (targets.size() == 2 && targets[0] == targets[1]) {
    return InvalidTarget("Cannot swap a player with themselves");
  }
  return absl::OkStatus();
}

Outcome Redirect::Apply(ResolutionContext* ctx, Visit* visit) const {
  CHECK_EQ(visit->targets.size(), 2);
  const int changed = ctx->Redirect(visit->targets[0], visit->targets[1]);
  visit->detail = absl::StrFormat("redirected %d", changed);
  return changed > 0 ? SUCCESS : FAILURE;
}

Outcome Investigate::Apply(ResolutionContext* ctx, Visit* visit) const {
  CHECK_EQ(visit->targets.size(), 1);
  const int target = visit->targets[0];
  GameState* g = ctx->game();
  g->Learn(visit->user, target, Learned(*g, target));
  g->SendPrivateMessage(visit->user, AbilityId(*ctx, *visit),
                        Result(*ctx, target));
  return SUCCESS;
}

string AlignmentCheck::Result(const ResolutionContext& ctx, int target) const {
  const GameState& g = ctx.game();
  if (g.IsTown(target)) {
    return absl::StrFormat("%s is aligned with the Town.", g.PlayerName(target));
  }
  return absl::StrFormat("%s is not aligned with the Town!",
                         g.PlayerName(target));
}

Fact AlignmentCheck::Learned(const GameState& g, int target) const {
  return Fact::Alignment(g.AlignmentId(target));
}

string RoleCheck::Result(const ResolutionContext& ctx, int target) const {
  const GameState& g = ctx.game();
  return absl::StrFormat("%s is a %s.", g.PlayerName(target), g.RoleId(target));
}

Fact RoleCheck::Learned(const GameState& g, int target) const {
  return Fact::Role(g.RoleId(target));
}

string VanillaCheck::Result(const ResolutionContext& ctx, int target) const {
  const GameState& g = ctx.game();
  if (g.RoleId(target) == "Vanilla") {
    return absl::StrFormat("%s is Vanilla.", g.PlayerName(target));
  }
  return absl::StrFormat("%s is not Vanilla.", g.PlayerName(target));
}

Fact VanillaCheck::Learned(const GameState& g, int target) const {
  return g.RoleId(target) == "Vanilla" ? Fact::Role("Vanilla") : Fact();
}

string Track::Result(const ResolutionContext& ctx, int target) const {
  const GameState& g = ctx.game();
  const vector<int> targets = ctx.TargetsOf(target);
  if (targets.empty()) {
    return absl::StrFormat("%s did not target anyone.", g.PlayerName(target));
  }
  return absl::StrFormat("%s targeted %s!", g.PlayerName(target),
                         JoinNames(g, targets));
}

string Watch::Result(const ResolutionContext& ctx, int target) const {
  const GameState& g = ctx.game();
  const vector<int> visitors = ctx.VisitorsOf(target);
  if (visitors.empty()) {
    return absl::StrFormat("%s was not targeted by anyone.",
                           g.PlayerName(target));
  }
  return absl::StrFormat("%s was targeted by %s.", g.PlayerName(target),
                         JoinNames(g, visitors));
}

Outcome Inform::Apply(ResolutionContext* ctx, Visit* visit) const {
  CHECK_EQ(visit->targets.size(), 1);
  GameState* g = ctx->game();
  const int target = visit->targets[0];
  g->Learn(target, visit->user, Fact::Alignment(g->AlignmentId(visit->user)));
  g->SendPrivateMessage(
      target, AbilityId(*ctx, *visit),
      absl::StrFormat("%s is aligned with the %s!", g->PlayerName(visit->user),
                      g->AlignmentId(visit->user)));
  return SUCCESS;
}

Outcome Reveal::Apply(ResolutionContext* ctx, Visit* visit) const {
  GameState* g = ctx->game();
  const Fact fact = Fact::Alignment(g->AlignmentId(visit->user));
  for (int i = 0; i < g->NumPlayers(); ++i) {
    g->Learn(i, visit->user, fact);
  }
  g->PostGlobal(AbilityId(*ctx, *visit),
                absl::StrFormat("%s is aligned with the %s!",
                                g->PlayerName(visit->user),
                                g->AlignmentId(visit->user)));
  return SUCCESS;
}
}  // namespace mafia
