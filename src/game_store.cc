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

#include "src/game_store.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"

namespace mafia {

absl::Status CheckModerator(const Viewer& viewer) {
  if (viewer.level() != Viewer::MODERATOR) {
    return absl::PermissionDeniedError("Moderators only");
  }
  return absl::OkStatus();
}

absl::Status CheckSelfOrModerator(const Viewer& viewer, const string& player) {
  if (viewer.level() == Viewer::MODERATOR ||
      (viewer.level() == Viewer::PLAYER && viewer.player() == player)) {
    return absl::OkStatus();
  }
  return absl::PermissionDeniedError(
      absl::StrCat("Only ", player, " or a moderator can do this"));
}

string GameStore::AddGame(GameState g) {
  absl::MutexLock lock(&mu_);
  const string id = absl::StrCat(next_id_++);
  games_[id] = std::make_unique<Entry>(std::move(g));
  LOG(INFO) << "Stored game " << id;
  return id;
}

absl::StatusOr<string> GameStore::CreateGame(const GameSetup& setup) {
  absl::StatusOr<GameState> g = GameState::Create(catalog_, setup);
  if (!g.ok()) {
    return g.status();
  }
  return AddGame(*std::move(g));
}

absl::StatusOr<string> GameStore::LoadGame(const GameLog& log) {
  absl::StatusOr<GameState> g = GameState::FromProto(catalog_, log);
  if (!g.ok()) {
    return g.status();
  }
  return AddGame(*std::move(g));
}

vector<string> GameStore::GameIds() const {
  absl::ReaderMutexLock lock(&mu_);
  vector<string> ids;
  for (const auto& it : games_) {
    ids.push_back(it.first);
  }
  return ids;
}

absl::StatusOr<GameStore::Entry*> GameStore::Find(
    const string& game_id) const {
  absl::ReaderMutexLock lock(&mu_);
  const auto it = games_.find(game_id);
  if (it == games_.end()) {
    return absl::NotFoundError(absl::StrCat("Unknown game ", game_id));
  }
  return it->second.get();
}

absl::StatusOr<GameOverview> GameStore::Overview(const string& game_id,
                                                 const Viewer& viewer) const {
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  absl::ReaderMutexLock lock(&(*e)->mu);
  return (*e)->state.Overview(viewer);
}

absl::Status GameStore::UpdateGame(const string& game_id, const Viewer& viewer,
                                   const UpdateRequest& request) {
  absl::Status status = CheckModerator(viewer);
  if (!status.ok()) {
    return status;
  }
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  if (request.has_set_time() && !request.commands().empty()) {
    return absl::InvalidArgumentError(
        "Set the time or send commands, not both");
  }
  absl::MutexLock lock(&(*e)->mu);
  GameState& g = (*e)->state;
  if (request.has_set_time()) {
    return g.SetTime(Time::FromProto(request.set_time()));
  }
  vector<GameCommand> commands;
  for (int c : request.commands()) {
    commands.push_back(GameCommand(c));
  }
  return g.ApplyCommands(commands);
}

absl::StatusOr<AbilityListing> GameStore::ListAbilities(
    const string& game_id, const Viewer& viewer, const string& player) const {
  absl::Status status = CheckSelfOrModerator(viewer, player);
  if (!status.ok()) {
    return status;
  }
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  absl::ReaderMutexLock lock(&(*e)->mu);
  return (*e)->state.ListAbilities(player);
}

absl::Status GameStore::QueueAbility(const string& game_id,
                                     const Viewer& viewer,
                                     const AbilityUse& use) {
  absl::Status status = CheckSelfOrModerator(viewer, use.player());
  if (!status.ok()) {
    return status;
  }
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  const vector<string> targets(use.targets().begin(), use.targets().end());
  absl::MutexLock lock(&(*e)->mu);
  return (*e)->state.QueueAbility(use.player(), use.ability(), targets);
}

absl::Status GameStore::DequeueAbility(const string& game_id,
                                       const Viewer& viewer,
                                       const AbilityUse& use) {
  absl::Status status = CheckSelfOrModerator(viewer, use.player());
  if (!status.ok()) {
    return status;
  }
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  absl::MutexLock lock(&(*e)->mu);
  return (*e)->state.DequeueAbility(use.player(), use.ability());
}

absl::Status GameStore::CastVote(const string& game_id, const Viewer& viewer,
                                 const Vote& vote) {
  absl::Status status = CheckSelfOrModerator(viewer, vote.voter());
  if (!status.ok()) {
    return status;
  }
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  absl::MutexLock lock(&(*e)->mu);
  return (*e)->state.CastVote(vote.voter(), vote.target());
}

absl::Status GameStore::Unvote(const string& game_id, const Viewer& viewer,
                               const string& voter) {
  absl::Status status = CheckSelfOrModerator(viewer, voter);
  if (!status.ok()) {
    return status;
  }
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  absl::MutexLock lock(&(*e)->mu);
  return (*e)->state.Unvote(voter);
}

absl::StatusOr<string> GameStore::VoteCount(const string& game_id,
                                            const Viewer& viewer) const {
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  absl::ReaderMutexLock lock(&(*e)->mu);
  return (*e)->state.VoteCount();
}

absl::StatusOr<ChatPage> GameStore::ReadChat(const string& game_id,
                                             const Viewer& viewer,
                                             const string& channel, int start,
                                             int limit) const {
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  absl::ReaderMutexLock lock(&(*e)->mu);
  return (*e)->state.ReadChat(viewer, channel, start, limit);
}

absl::Status GameStore::PostChat(const string& game_id, const Viewer& viewer,
                                 const string& channel,
                                 const string& content) {
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  absl::MutexLock lock(&(*e)->mu);
  return (*e)->state.PostChat(viewer, channel, content);
}

absl::StatusOr<vector<ResolutionRecord>> GameStore::ResolutionLog(
    const string& game_id, const Viewer& viewer) const {
  absl::Status status = CheckModerator(viewer);
  if (!status.ok()) {
    return status;
  }
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  absl::ReaderMutexLock lock(&(*e)->mu);
  return (*e)->state.resolution_log();
}

absl::StatusOr<GameLog> GameStore::ExportLog(const string& game_id,
                                             const Viewer& viewer) const {
  absl::Status status = CheckModerator(viewer);
  if (!status.ok()) {
    return status;
  }
  absl::StatusOr<Entry*> e = Find(game_id);
  if (!e.ok()) {
    return e.status();
  }
  absl::ReaderMutexLock lock(&(*e)->mu);
  return (*e)->state.ToProto();
}
}  // namespace mafia
