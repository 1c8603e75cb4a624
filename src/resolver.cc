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

#include "src/resolver.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <tuple>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/game_state.h"
#include "src/modifiers.h"

namespace mafia {

using std::set;

namespace {
const char kFailedInvestigation[] =
    "Your ability failed, and you did not receive a result.";

const EffectCategory kAllCategories[] = {PROTECTIVE, INFORMATIONAL, OFFENSIVE,
                                         CLEANUP};

// Self targeted abilities implicitly target their user.
vector<int> VisitTargets(const AbilityInstance& a, int user,
                         const vector<int>& targets) {
  if (a.spec.self_targeted) {
    return {user};
  }
  return targets;
}
}  // namespace

ResolutionContext::ResolutionContext(GameState* game, vector<Visit> visits)
    : game_(game), visits_(std::move(visits)),
      living_non_town_at_start_(game->NumAliveNonTown()) {}

int ResolutionContext::Roleblock(int player) {
  int blocked = 0;
  for (int i = current_ + 1; i < visits_.size(); ++i) {
    Visit& v = visits_[i];
    if (v.user != player || v.passive || v.resolved || v.blocked) {
      continue;
    }
    if (game_->ability(v.ability).spec.HasTag("unstoppable")) {
      continue;
    }
    v.blocked = true;
    ++blocked;
  }
  return blocked;
}

int ResolutionContext::Redirect(int first, int second) {
  int changed = 0;
  for (int i = current_ + 1; i < visits_.size(); ++i) {
    Visit& v = visits_[i];
    if (v.resolved || v.passive) {
      continue;
    }
    bool swapped = false;
    for (int& t : v.targets) {
      if (t == first) {
        t = second;
        swapped = true;
      } else if (t == second) {
        t = first;
        swapped = true;
      }
    }
    changed += swapped;
  }
  return changed;
}

void ResolutionContext::Protect(int target, int limit, bool dies_in_place) {
  protections_[target].push_back({.visit = current_,
                                  .remaining = limit > 0 ? limit : -1,
                                  .dies_in_place = dies_in_place});
}

bool ResolutionContext::AbsorbKill(int target) {
  auto it = protections_.find(target);
  if (it == protections_.end()) {
    return false;
  }
  for (Protection& p : it->second) {
    if (p.remaining == 0) {
      continue;
    }
    if (p.remaining > 0) {
      --p.remaining;
    }
    Visit& protector = visits_[p.visit];
    ++protector.hits;
    if (p.dies_in_place) {
      game_->KillPlayer(protector.user,
                        game_->ability(protector.ability).spec.id);
    }
    return true;
  }
  return false;
}

bool ResolutionContext::IsVisible(int i) const {
  const Visit& v = visits_[i];
  if (i == current_ || v.passive || v.blocked) {
    return false;
  }
  const AbilitySpec& spec = game_->ability(v.ability).spec;
  return !spec.self_targeted && !spec.HasTag("hidden");
}

vector<int> ResolutionContext::TargetsOf(int player) const {
  vector<int> targets;
  for (int i = 0; i < visits_.size(); ++i) {
    if (visits_[i].user == player && IsVisible(i)) {
      for (int t : visits_[i].targets) {
        targets.push_back(t);
      }
    }
  }
  return targets;
}

vector<int> ResolutionContext::VisitorsOf(int player) const {
  vector<int> visitors;
  for (int i = 0; i < visits_.size(); ++i) {
    const Visit& v = visits_[i];
    if (IsVisible(i) &&
        std::find(v.targets.begin(), v.targets.end(), player) !=
            v.targets.end()) {
      visitors.push_back(v.user);
    }
  }
  return visitors;
}

vector<EffectCategory> DefaultCategoryOrder() {
  return vector<EffectCategory>(std::begin(kAllCategories),
                                std::end(kAllCategories));
}

absl::Status ValidateCategoryOrder(absl::Span<const EffectCategory> order) {
  set<EffectCategory> seen(order.begin(), order.end());
  if (order.size() != seen.size()) {
    return absl::InvalidArgumentError("Repeated category in category order");
  }
  for (EffectCategory c : kAllCategories) {
    if (seen.count(c) == 0) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Category order is missing ", EffectCategory_Name(c)));
    }
  }
  if (seen.size() != std::size(kAllCategories)) {
    return absl::InvalidArgumentError("Unknown category in category order");
  }
  return absl::OkStatus();
}

Resolver::Resolver(absl::Span<const EffectCategory> category_order) {
  vector<EffectCategory> order(category_order.begin(), category_order.end());
  if (order.empty()) {
    order = DefaultCategoryOrder();
  }
  CHECK(ValidateCategoryOrder(order).ok()) << "Invalid category order";
  for (int i = 0; i < order.size(); ++i) {
    rank_[order[i]] = i;
  }
}

vector<Visit> Resolver::CollectVisits(const GameState& g) const {
  vector<Visit> visits;
  for (const QueuedAbility& q : g.queue_.Snapshot()) {
    if (q.time != g.time()) {
      continue;
    }
    const AbilityInstance& a = g.ability(q.ability);
    visits.push_back({.ability = q.ability, .user = q.user,
                      .targets = VisitTargets(a, q.user, q.targets),
                      .seq = q.seq});
  }
  int64_t seq = g.queue_.next_seq();
  for (int p = 0; p < g.NumPlayers(); ++p) {
    if (!g.IsAlive(p)) {
      continue;
    }
    for (int i : g.player(p).abilities) {
      const AbilityInstance& a = g.ability(i);
      if (a.spec.kind != PASSIVE || !a.active || a.UsesExhausted()) {
        continue;
      }
      if (a.spec.phase != PHASE_UNSPECIFIED && a.spec.phase != g.time().phase()) {
        continue;
      }
      const vector<int> targets = VisitTargets(a, p, {});
      if (!CheckModifiersQueue(g, a, p, targets).ok()) {
        continue;
      }
      visits.push_back({.ability = i, .user = p, .targets = targets,
                        .seq = seq++, .passive = true});
    }
  }
  return visits;
}

vector<Visit> Resolver::Order(const GameState& g, vector<Visit> visits) const {
  auto key = [this, &g](const Visit& v) {
    const AbilitySpec& spec = g.ability(v.ability).spec;
    const auto it = rank_.find(spec.category);
    const int rank =
        it == rank_.end() ? static_cast<int>(rank_.size()) : it->second;
    return std::make_tuple(spec.priority, rank, v.seq);
  };
  std::stable_sort(visits.begin(), visits.end(),
                   [&key](const Visit& l, const Visit& r) {
                     return key(l) < key(r);
                   });
  return visits;
}

void Resolver::ResolveVisit(ResolutionContext* ctx, int i) const {
  ctx->current_ = i;
  Visit& v = ctx->visits_[i];
  GameState* g = ctx->game();
  const AbilityInstance& a = g->ability(v.ability);
  if (v.blocked) {
    v.outcome = FIZZLED;
    v.detail = "roleblocked";
  } else if (!g->IsAlive(v.user)) {
    v.outcome = FIZZLED;
    v.detail = "user is dead";
  } else if (std::any_of(v.targets.begin(), v.targets.end(),
                         [g](int t) { return !g->IsAlive(t); })) {
    v.outcome = FIZZLED;
    v.detail = "target is dead";
  } else {
    const string reason = CheckModifiersResolve(a, *ctx, v);
    if (!reason.empty()) {
      v.outcome = FIZZLED;
      v.detail = reason;
    } else {
      v.outcome = ApplyWithModifiers(a, ctx, &v);
    }
  }
  v.resolved = true;
  VLOG(1) << g->time() << ": " << g->PlayerName(v.user) << " " << a.spec.id
          << " -> " << Outcome_Name(v.outcome) << " " << v.detail;
}

ResolutionRecord Resolver::ToRecord(const GameState& g, const Visit& v) const {
  ResolutionRecord r;
  *r.mutable_time() = g.time().ToProto();
  if (v.user != kNoPlayer) {
    r.set_user(g.PlayerName(v.user));
  }
  r.set_ability(g.ability(v.ability).spec.id);
  for (int t : v.targets) {
    r.add_targets(g.PlayerName(t));
  }
  r.set_outcome(v.outcome);
  r.set_detail(v.detail);
  return r;
}

vector<ResolutionRecord> Resolver::Resolve(GameState* g) const {
  ResolutionContext ctx(g, Order(*g, CollectVisits(*g)));
  for (int i = 0; i < ctx.visits_.size(); ++i) {
    ResolveVisit(&ctx, i);
  }
  vector<ResolutionRecord> records;
  for (const Visit& v : ctx.visits_) {
    records.push_back(ToRecord(*g, v));
    const AbilityInstance& a = g->ability(v.ability);
    if (a.spec.HasTag("investigate") && v.blocked) {
      g->SendPrivateMessage(v.user, a.spec.id, kFailedInvestigation);
    }
  }
  const int eliminated = g->EliminateByVote();
  if (eliminated != kNoPlayer) {
    ResolutionRecord r;
    *r.mutable_time() = g->time().ToProto();
    r.set_ability("Vote");
    r.add_targets(g->PlayerName(eliminated));
    r.set_outcome(SUCCESS);
    r.set_detail("eliminated");
    records.push_back(r);
  }
  for (const Visit& v : ctx.visits_) {
    const int uses = v.passive
        ? g->ability(v.ability).spec.effect->PassiveUses(v) : 1;
    g->RecordUse(v.ability, v.targets, uses);
  }
  g->ClearPhaseState();
  g->EvaluateWin();
  return records;
}

ResolutionRecord Resolver::ResolveImmediate(GameState* g, int ability,
                                            int user,
                                            const vector<int>& targets) const {
  const AbilityInstance& a = g->ability(ability);
  vector<Visit> visits = {{.ability = ability, .user = user,
                           .targets = VisitTargets(a, user, targets)}};
  ResolutionContext ctx(g, std::move(visits));
  ResolveVisit(&ctx, 0);
  const Visit& v = ctx.visits_[0];
  g->RecordUse(ability, v.targets, 1);
  g->EvaluateWin();
  return ToRecord(*g, v);
}
}  // namespace mafia
