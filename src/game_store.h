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

#ifndef SRC_GAME_STORE_H_
#define SRC_GAME_STORE_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include "src/catalog.h"
#include "src/game_log.pb.h"
#include "src/game_state.h"
#include "src/views.pb.h"

namespace mafia {

using std::map;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

// Owns the games of a service. Every call takes the authorization of the
// caller. Mutations on a game are serialized by its lock, and reads see the
// game between two mutations.
class GameStore {
 public:
  explicit GameStore(shared_ptr<const Catalog> catalog)
      : catalog_(std::move(catalog)) {}

  // Returns the new game id.
  absl::StatusOr<string> CreateGame(const GameSetup& setup);
  // Starts serving a recorded game under a new id.
  absl::StatusOr<string> LoadGame(const GameLog& log);
  vector<string> GameIds() const;

  absl::StatusOr<GameOverview> Overview(const string& game_id,
                                        const Viewer& viewer) const;
  // Moderators only.
  absl::Status UpdateGame(const string& game_id, const Viewer& viewer,
                          const UpdateRequest& request);

  // The player themselves or a moderator.
  absl::StatusOr<AbilityListing> ListAbilities(const string& game_id,
                                               const Viewer& viewer,
                                               const string& player) const;
  absl::Status QueueAbility(const string& game_id, const Viewer& viewer,
                            const AbilityUse& use);
  absl::Status DequeueAbility(const string& game_id, const Viewer& viewer,
                              const AbilityUse& use);

  absl::Status CastVote(const string& game_id, const Viewer& viewer,
                        const Vote& vote);
  absl::Status Unvote(const string& game_id, const Viewer& viewer,
                      const string& voter);
  absl::StatusOr<string> VoteCount(const string& game_id,
                                   const Viewer& viewer) const;

  absl::StatusOr<ChatPage> ReadChat(const string& game_id,
                                    const Viewer& viewer,
                                    const string& channel, int start,
                                    int limit) const;
  absl::Status PostChat(const string& game_id, const Viewer& viewer,
                        const string& channel, const string& content);

  // Moderators only.
  absl::StatusOr<vector<ResolutionRecord>> ResolutionLog(
      const string& game_id, const Viewer& viewer) const;
  absl::StatusOr<GameLog> ExportLog(const string& game_id,
                                    const Viewer& viewer) const;

 private:
  struct Entry {
    explicit Entry(GameState g) : state(std::move(g)) {}

    mutable absl::Mutex mu;
    GameState state ABSL_GUARDED_BY(mu);
  };

  string AddGame(GameState g) ABSL_LOCKS_EXCLUDED(mu_);
  absl::StatusOr<Entry*> Find(const string& game_id) const
      ABSL_LOCKS_EXCLUDED(mu_);

  const shared_ptr<const Catalog> catalog_;
  mutable absl::Mutex mu_;
  int next_id_ ABSL_GUARDED_BY(mu_) = 1;
  // Entries are never removed, so their addresses are stable.
  map<string, unique_ptr<Entry>> games_ ABSL_GUARDED_BY(mu_);
};

// Authorization checks, shared with the CLI.
absl::Status CheckModerator(const Viewer& viewer);
absl::Status CheckSelfOrModerator(const Viewer& viewer, const string& player);
}  // namespace mafia

#endif  // SRC_GAME_STORE_H_
