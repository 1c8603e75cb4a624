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

#include "src/catalog.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "ortools/base/logging.h"
#include "src/effects.h"
#include "src/game_state.h"

namespace mafia {

using std::make_shared;

bool FactionWins(const GameState& g, int alignment) {
  bool faction_alive = false, opponent_alive = false;
  for (int i = 0; i < g.NumPlayers(); ++i) {
    if (!g.IsAlive(i)) {
      continue;
    }
    if (g.player(i).alignment_index == alignment) {
      faction_alive = true;
    } else {
      opponent_alive = true;
    }
  }
  return faction_alive && !opponent_alive;
}

bool LastOneStandingWins(const GameState& g, int alignment) {
  return g.NumAlive() == 0 || FactionWins(g, alignment);
}

string RoleName(const RoleTemplate& role, const AlignmentTemplate& alignment,
                absl::Span<const string> modifiers) {
  auto format = [&role, &alignment](const string& s) {
    return absl::StrReplaceAll(
        s, {{"{role}", role.id}, {"{alignment}", alignment.id}});
  };
  string name;
  const auto it = alignment.role_names.find(role.id);
  if (it != alignment.role_names.end()) {
    name = format(it->second);
  } else if (role.is_adjective) {
    name = absl::StrCat(role.id, " ",
                        alignment.demonym.empty() ? alignment.id
                                                  : format(alignment.demonym));
  } else {
    name = absl::StrCat(alignment.id, " ", role.id);
  }
  if (modifiers.empty()) {
    return name;
  }
  return absl::StrCat(absl::StrJoin(modifiers, " "), " ", name);
}

void Catalog::AddRole(const RoleTemplate& role) {
  CHECK(!role.id.empty()) << "Roles need an id";
  CHECK(roles_.emplace(role.id, role).second) << "Duplicate role " << role.id;
}

void Catalog::AddAlignment(const AlignmentTemplate& alignment) {
  CHECK(!alignment.id.empty()) << "Alignments need an id";
  CHECK(alignment.win != nullptr)
      << "Alignment " << alignment.id << " needs a win condition";
  CHECK(alignments_.emplace(alignment.id, alignment).second)
      << "Duplicate alignment " << alignment.id;
}

void Catalog::AddModifier(const string& id, ModifierFactory factory) {
  CHECK(modifiers_.emplace(id, std::move(factory)).second)
      << "Duplicate modifier " << id;
}

const RoleTemplate* Catalog::FindRole(const string& id) const {
  const auto it = roles_.find(id);
  return it == roles_.end() ? nullptr : &it->second;
}

const AlignmentTemplate* Catalog::FindAlignment(const string& id) const {
  const auto it = alignments_.find(id);
  return it == alignments_.end() ? nullptr : &it->second;
}

absl::StatusOr<shared_ptr<const Modifier>> Catalog::NewModifier(
    const ModifierSpec& spec) const {
  const auto it = modifiers_.find(spec.id());
  if (it == modifiers_.end()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown modifier ", spec.id()));
  }
  return it->second(spec);
}

namespace {
AbilitySpec NewSpec(const string& id, const string& description,
                    shared_ptr<const Effect> effect, int priority,
                    EffectCategory category, const set<string>& tags) {
  AbilitySpec spec;
  spec.id = id;
  spec.description = description;
  spec.effect = std::move(effect);
  spec.priority = priority;
  spec.category = category;
  spec.tags = tags;
  return spec;
}

AbilitySpec KillSpec(const string& id, const set<string>& tags) {
  return NewSpec(id, "Kill another player at night.", make_shared<Kill>(),
                 kKillPriority, OFFENSIVE, tags);
}

RoleTemplate NewRole(const string& id, const string& description,
                     const AbilitySpec& action) {
  return {.id = id, .description = description, .actions = {action}};
}

template <typename M>
ModifierFactory Simple() {
  return [](const ModifierSpec& spec)
      -> absl::StatusOr<shared_ptr<const Modifier>> {
    return shared_ptr<const Modifier>(make_shared<M>());
  };
}
}  // namespace

void AddDefaultTemplates(Catalog* catalog) {
  // Roles.
  catalog->AddRole({.id = "Vanilla", .description = "No abilities.",
                    .is_adjective = true});
  catalog->AddRole(NewRole(
      "Cop", "Checks if a player is aligned with the Town.",
      NewSpec("Cop", "Investigate another player to learn if they are Town or "
              "not Town.", make_shared<AlignmentCheck>(),
              kInvestigatePriority, INFORMATIONAL, {"investigate", "gun"})));
  catalog->AddRole(NewRole(
      "Rolecop", "Checks a player to learn their role.",
      NewSpec("Rolecop", "Investigate another player to learn their role.",
              make_shared<RoleCheck>(), kInvestigatePriority, INFORMATIONAL,
              {"investigate", "gun"})));
  catalog->AddRole(NewRole(
      "Vanilla Cop", "Checks if a player is Vanilla.",
      NewSpec("Vanilla Cop", "Investigate another player to learn if they are "
              "Vanilla.", make_shared<VanillaCheck>(), kInvestigatePriority,
              INFORMATIONAL, {"investigate", "gun"})));
  catalog->AddRole(NewRole(
      "Tracker", "Checks a player to learn who they targeted.",
      NewSpec("Tracker", "Learn whom another player targeted tonight.",
              make_shared<Track>(), kInvestigatePriority, INFORMATIONAL,
              {"investigate", "gun"})));
  catalog->AddRole(NewRole(
      "Watcher", "Checks a player to learn who targeted them.",
      NewSpec("Watcher", "Learn who targeted another player tonight.",
              make_shared<Watch>(), kInvestigatePriority, INFORMATIONAL,
              {"investigate", "gun"})));
  catalog->AddRole(NewRole(
      "Doctor", "Protects a player from one kill.",
      NewSpec("Doctor", "Protect another player from a single nightkill.",
              make_shared<Protect>(1, false), kProtectPriority, PROTECTIVE,
              {"protect", "mafia_no_gun"})));
  catalog->AddRole(NewRole(
      "Bodyguard", "Protects a player from one kill, but dies if successful.",
      NewSpec("Bodyguard", "Protect another player from a single nightkill. "
              "If successful, you die in their place.",
              make_shared<Protect>(1, true), kProtectPriority, PROTECTIVE,
              {"protect"})));
  AbilitySpec bulletproof = NewSpec(
      "Bulletproof", "Any killing actions that target you will fail.",
      make_shared<Protect>(0, false), kProtectPriority, PROTECTIVE,
      {"protect"});
  bulletproof.kind = PASSIVE;
  bulletproof.target_count = 0;
  bulletproof.self_targeted = true;
  catalog->AddRole({.id = "Bulletproof",
                    .description = "Blocks all kills targeting the player.",
                    .is_adjective = true, .passives = {bulletproof}});
  catalog->AddRole(NewRole(
      "Roleblocker", "Roleblocks a player.",
      NewSpec("Roleblocker", "Block the abilities of another player tonight.",
              make_shared<Roleblock>(), kRoleblockPriority, PROTECTIVE,
              {"roleblock"})));
  catalog->AddRole(NewRole(
      "Jailkeeper", "Protects a player from kills and roleblocks them.",
      NewSpec("Jailkeeper", "Roleblock another player and protect them from "
              "all kills tonight.", make_shared<Jail>(), kRoleblockPriority,
              PROTECTIVE, {"protect", "roleblock"})));
  catalog->AddRole(NewRole("Vigilante", "Kills a player.",
                           KillSpec("Vigilante", {"kill", "gun"})));
  catalog->AddRole(NewRole(
      "Friendly Neighbor", "Informs a player of the actor's alignment.",
      NewSpec("Friendly Neighbor", "Inform another player that you are "
              "aligned with your faction.", make_shared<Inform>(),
              kInvestigatePriority, INFORMATIONAL, {"inform"})));
  AbilitySpec bus = NewSpec(
      "Bus Driver", "Swap two players: abilities targeting one of them "
      "target the other instead.", make_shared<Redirect>(), kRedirectPriority,
      PROTECTIVE, {"redirect"});
  bus.target_count = 2;
  bus.allow_self_target = true;
  catalog->AddRole(NewRole("Bus Driver", "Swaps two players.", bus));
  AbilitySpec reveal = NewSpec(
      "Innocent Child", "Reveal your alignment to everyone.",
      make_shared<Reveal>(), kInvestigatePriority, INFORMATIONAL, {"inform"});
  reveal.phase = PHASE_UNSPECIFIED;
  reveal.immediate = true;
  reveal.target_count = 0;
  reveal.max_uses = 1;
  catalog->AddRole(NewRole("Innocent Child",
                           "Informs all players of the actor's alignment.",
                           reveal));

  // Alignments.
  catalog->AddAlignment({.id = "Town",
                         .description = "The uninformed majority.",
                         .tags = {"town"},
                         .demonym = "{alignment}ie"});
  catalog->AddAlignment({
      .id = "Mafia",
      .description = "The informed minority.",
      .tags = {"mafia", "chat", "informed"},
      .shared_actions = {KillSpec("Mafia Factional Kill",
                                  {"kill", "factional"})},
      .demonym = "Mafioso",
      .role_names = {{"Vanilla", "{alignment} Goon"}}});
  catalog->AddAlignment({
      .id = "Serial Killer",
      .description = "Self-aligned third party.",
      .tags = {"third_party"},
      .actions = {KillSpec("Serial Killer Kill", {"kill", "factional"})},
      .role_names = {{"Vanilla", "{alignment}"}},
      .win = LastOneStandingWins});

  // Modifiers.
  catalog->AddModifier("X-Shot", [](const ModifierSpec& spec)
      -> absl::StatusOr<shared_ptr<const Modifier>> {
    if (spec.max_uses() <= 0) {
      return absl::InvalidArgumentError("X-Shot needs a positive max_uses");
    }
    return shared_ptr<const Modifier>(make_shared<XShot>(spec.max_uses()));
  });
  catalog->AddModifier("Night X", [](const ModifierSpec& spec)
      -> absl::StatusOr<shared_ptr<const Modifier>> {
    if (spec.nights().empty()) {
      return absl::InvalidArgumentError("Night X needs nights");
    }
    const set<int> nights(spec.nights().begin(), spec.nights().end());
    return shared_ptr<const Modifier>(make_shared<NightX>(nights));
  });
  catalog->AddModifier("Non-Consecutive Night", Simple<NonConsecutiveNight>());
  catalog->AddModifier("Indecisive", Simple<Indecisive>());
  catalog->AddModifier("Weak", Simple<Weak>());
  catalog->AddModifier("Personal", Simple<Personal>());
  catalog->AddModifier("Activated", Simple<Activated>());
  catalog->AddModifier("Lazy", Simple<Lazy>());
  catalog->AddModifier("Loyal", Simple<Loyal>());
  catalog->AddModifier("Disloyal", Simple<Disloyal>());
}

shared_ptr<const Catalog> DefaultCatalog() {
  static const shared_ptr<const Catalog> catalog = [] {
    auto c = make_shared<Catalog>();
    AddDefaultTemplates(c.get());
    return shared_ptr<const Catalog>(c);
  }();
  return catalog;
}
}  // namespace mafia
