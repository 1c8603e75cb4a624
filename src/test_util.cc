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

#include "src/test_util.h"

#include <utility>

#include "absl/status/statusor.h"
#include "ortools/base/logging.h"

namespace mafia {

ModifierSpec Mod(const string& id) {
  ModifierSpec m;
  m.set_id(id);
  return m;
}

ModifierSpec XShotMod(int max_uses) {
  ModifierSpec m = Mod("X-Shot");
  m.set_max_uses(max_uses);
  return m;
}

ModifierSpec NightsMod(const vector<int>& nights) {
  ModifierSpec m = Mod("Night X");
  for (int n : nights) {
    m.add_nights(n);
  }
  return m;
}

GameSetup MakeSetup(const vector<Seat>& seats, const Time& start) {
  GameSetup setup;
  for (const Seat& s : seats) {
    setup.add_players(s.name);
    RoleAssignment* r = setup.add_roles();
    r->set_role(s.role);
    r->set_alignment(s.alignment);
    for (const ModifierSpec& m : s.modifiers) {
      *r->add_modifiers() = m;
    }
  }
  *setup.mutable_start() = start.ToProto();
  return setup;
}

GameState MakeGame(const vector<Seat>& seats, const Time& start,
                   shared_ptr<const Catalog> catalog) {
  absl::StatusOr<GameState> g =
      GameState::Create(std::move(catalog), MakeSetup(seats, start));
  CHECK(g.ok()) << g.status();
  return *std::move(g);
}

Viewer ModeratorViewer() {
  Viewer v;
  v.set_level(Viewer::MODERATOR);
  return v;
}

Viewer PlayerViewer(const string& player) {
  Viewer v;
  v.set_level(Viewer::PLAYER);
  v.set_player(player);
  return v;
}

const ResolutionRecord* FindRecord(const GameState& g, const string& ability) {
  const ResolutionRecord* found = nullptr;
  for (const ResolutionRecord& r : g.resolution_log()) {
    if (r.ability() == ability) {
      found = &r;
    }
  }
  return found;
}

vector<string> Messages(const GameState& g, const string& channel) {
  absl::StatusOr<ChatPage> page =
      g.ReadChat(ModeratorViewer(), channel, 0, 1000);
  CHECK(page.ok()) << page.status();
  vector<string> messages;
  for (const ChatMessage& m : page->messages()) {
    messages.push_back(m.content());
  }
  return messages;
}
}  // namespace mafia
