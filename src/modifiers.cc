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

#include "src/modifiers.h"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/errors.h"
#include "src/game_state.h"
#include "src/resolver.h"

namespace mafia {

string XShot::Name() const { return absl::StrFormat("%d-Shot", max_uses_); }

void XShot::Transform(AbilitySpec* spec) const {
  if (spec->max_uses == 0 || spec->max_uses > max_uses_) {
    spec->max_uses = max_uses_;
  }
}

string NightX::Name() const {
  return absl::StrCat("Night ", absl::StrJoin(nights_, ","));
}

absl::Status NightX::CheckQueue(const GameState& g, const AbilityInstance& a,
                                int user,
                                absl::Span<const int> targets) const {
  if (nights_.count(g.time().count) == 0) {
    return IneligibleNow(absl::StrFormat(
        "%s can only be used on %s", a.spec.id, Name()));
  }
  return absl::OkStatus();
}

absl::Status NonConsecutiveNight::CheckQueue(
    const GameState& g, const AbilityInstance& a, int user,
    absl::Span<const int> targets) const {
  for (const auto& use : a.history) {
    if (g.time().count <= use.time.count + 1) {
      return IneligibleNow(absl::StrFormat(
          "%s was used on %s and cannot be used consecutively", a.spec.id,
          string(use.time)));
    }
  }
  return absl::OkStatus();
}

absl::Status Indecisive::CheckQueue(const GameState& g,
                                    const AbilityInstance& a, int user,
                                    absl::Span<const int> targets) const {
  for (const auto& use : a.history) {
    if (g.time().count > use.time.count + 1) {
      continue;
    }
    const int n = std::min(targets.size(), use.targets.size());
    for (int i = 0; i < n; ++i) {
      if (targets[i] == use.targets[i]) {
        return IneligibleNow(absl::StrFormat(
            "%s cannot target %s two times in a row", a.spec.id,
            g.PlayerName(targets[i])));
      }
    }
  }
  return absl::OkStatus();
}

Outcome Weak::Apply(ResolutionContext* ctx, Visit* visit,
                    absl::FunctionRef<Outcome()> next) const {
  GameState* g = ctx->game();
  for (int t : visit->targets) {
    if (t != visit->user && !g->IsTown(t)) {
      g->KillPlayer(visit->user, Name());
      break;
    }
  }
  return next();
}

absl::Status Personal::Validate(const AbilitySpec& spec) const {
  if (spec.target_count > 1) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "%s takes %d targets and cannot be %s", spec.id, spec.target_count,
        Name()));
  }
  return absl::OkStatus();
}

void Personal::Transform(AbilitySpec* spec) const {
  spec->target_count = 0;
  spec->self_targeted = true;
}

void Activated::Transform(AbilitySpec* spec) const {
  if (spec->kind == PASSIVE) {
    spec->kind = ACTION;
  }
}

void Lazy::Transform(AbilitySpec* spec) const { spec->tags.insert("lazy"); }

string Lazy::CheckResolve(const ResolutionContext& ctx,
                          const Visit& visit) const {
  if (ctx.living_non_town_at_start() <= 1) {
    return "lazy";
  }
  return "";
}

Outcome Loyal::Apply(ResolutionContext* ctx, Visit* visit,
                     absl::FunctionRef<Outcome()> next) const {
  const GameState& g = *ctx->game();
  for (int t : visit->targets) {
    if (!g.SameAlignment(visit->user, t)) {
      visit->detail = "loyal";
      return FAILURE;
    }
  }
  return next();
}

Outcome Disloyal::Apply(ResolutionContext* ctx, Visit* visit,
                        absl::FunctionRef<Outcome()> next) const {
  const GameState& g = *ctx->game();
  for (int t : visit->targets) {
    if (t != visit->user && g.SameAlignment(visit->user, t)) {
      visit->detail = "disloyal";
      return FAILURE;
    }
  }
  return next();
}

absl::Status CheckModifiersQueue(const GameState& g, const AbilityInstance& a,
                                 int user, absl::Span<const int> targets) {
  for (auto it = a.modifiers.rbegin(); it != a.modifiers.rend(); ++it) {
    absl::Status status = (*it)->CheckQueue(g, a, user, targets);
    if (!status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

string CheckModifiersResolve(const AbilityInstance& a,
                             const ResolutionContext& ctx,
                             const Visit& visit) {
  for (auto it = a.modifiers.rbegin(); it != a.modifiers.rend(); ++it) {
    const string reason = (*it)->CheckResolve(ctx, visit);
    if (!reason.empty()) {
      return reason;
    }
  }
  return "";
}

namespace {
Outcome ApplyFrom(const AbilityInstance& a, int i, ResolutionContext* ctx,
                  Visit* visit) {
  if (i < 0) {
    return a.spec.effect->Apply(ctx, visit);
  }
  return a.modifiers[i]->Apply(ctx, visit, [&a, i, ctx, visit]() {
    return ApplyFrom(a, i - 1, ctx, visit);
  });
}
}  // namespace

Outcome ApplyWithModifiers(const AbilityInstance& a, ResolutionContext* ctx,
                           Visit* visit) {
  CHECK(a.spec.effect != nullptr) << "Ability " << a.spec.id << " has no effect";
  return ApplyFrom(a, static_cast<int>(a.modifiers.size()) - 1, ctx, visit);
}
}  // namespace mafia
