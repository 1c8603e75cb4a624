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

#ifndef SRC_CATALOG_H_
#define SRC_CATALOG_H_

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/ability.h"
#include "src/game_log.pb.h"
#include "src/modifiers.h"

namespace mafia {

using std::map;
using std::set;
using std::shared_ptr;
using std::string;
using std::vector;

class GameState;

// Returns whether the alignment (an index into the game's alignments) won.
typedef bool (*WinCondition)(const GameState& g, int alignment);

// Living members exist, and no living player belongs to another faction.
bool FactionWins(const GameState& g, int alignment);
// Wins as a faction, or when nobody is left alive.
bool LastOneStandingWins(const GameState& g, int alignment);

struct RoleTemplate {
  string id;
  string description;
  // Adjective roles are named "{role} {demonym}", e.g. "Vanilla Townie".
  bool is_adjective = false;
  vector<AbilitySpec> actions;
  vector<AbilitySpec> passives;
};

struct AlignmentTemplate {
  string id;
  string description;
  set<string> tags;  // E.g. "town", "informed", "chat".
  vector<AbilitySpec> actions;  // Granted to every member.
  vector<AbilitySpec> shared_actions;  // Usable by one member per phase.
  // Both support the "{role}" and "{alignment}" placeholders.
  string demonym;
  map<string, string> role_names;  // Role id to custom role name.
  WinCondition win = FactionWins;

  bool HasTag(const string& tag) const { return tags.count(tag) > 0; }
};

// Display name of a role played for an alignment, e.g. "Town Cop",
// "Vanilla Townie" or "Mafia Goon". Modifier names come first.
string RoleName(const RoleTemplate& role, const AlignmentTemplate& alignment,
                absl::Span<const string> modifiers = {});

typedef std::function<absl::StatusOr<shared_ptr<const Modifier>>(
    const ModifierSpec&)> ModifierFactory;

// Registry of role, alignment and modifier templates, keyed by id.
class Catalog {
 public:
  void AddRole(const RoleTemplate& role);
  void AddAlignment(const AlignmentTemplate& alignment);
  void AddModifier(const string& id, ModifierFactory factory);

  // Return nullptr for unknown ids.
  const RoleTemplate* FindRole(const string& id) const;
  const AlignmentTemplate* FindAlignment(const string& id) const;
  absl::StatusOr<shared_ptr<const Modifier>> NewModifier(
      const ModifierSpec& spec) const;

 private:
  map<string, RoleTemplate> roles_;
  map<string, AlignmentTemplate> alignments_;
  map<string, ModifierFactory> modifiers_;
};

// Default ability priorities.
const int kRedirectPriority = 5;
const int kRoleblockPriority = 10;
const int kProtectPriority = 20;
const int kInvestigatePriority = 30;
const int kKillPriority = 40;

// The catalog of the built-in roles, alignments and modifiers.
shared_ptr<const Catalog> DefaultCatalog();

// Adds the built-in templates to the catalog.
void AddDefaultTemplates(Catalog* catalog);
}  // namespace mafia

#endif  // SRC_CATALOG_H_
