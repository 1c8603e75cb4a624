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

#ifndef SRC_GAME_STATE_H_
#define SRC_GAME_STATE_H_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/ability.h"
#include "src/ability_queue.h"
#include "src/catalog.h"
#include "src/chat.h"
#include "src/game_log.pb.h"
#include "src/game_time.h"
#include "src/knowledge.h"
#include "src/views.pb.h"

namespace mafia {

using std::map;
using std::shared_ptr;
using std::string;
using std::unordered_map;
using std::vector;

const int kDefaultPageSize = 25;

struct Player {
  string name;
  const RoleTemplate* role = nullptr;
  const AlignmentTemplate* alignment = nullptr;
  int alignment_index = -1;
  vector<string> modifiers;  // Modifier names, in application order.
  vector<int> abilities;  // Owned ability instances: actions, then passives.
  vector<string> death_causes;

  bool IsAlive() const { return death_causes.empty(); }
};

// An alignment in play.
struct AlignmentState {
  const AlignmentTemplate* alignment = nullptr;
  vector<int> members;
  vector<int> shared_abilities;  // Ability instances.
};

// This contains an instance of a game, at its current time.
class GameState {
 public:
  static absl::StatusOr<GameState> Create(shared_ptr<const Catalog> catalog,
                                          const GameSetup& setup);
  // Replays a game log.
  static absl::StatusOr<GameState> FromProto(shared_ptr<const Catalog> catalog,
                                             const GameLog& log);
  // The setup (with roles already shuffled) and all the accepted events.
  const GameLog& ToProto() const { return log_; }

  absl::Status AddEvent(const Event& event);

  // Phases.
  const Time& time() const { return time_; }
  bool IsResolved() const { return resolved_; }
  const vector<string>& winners() const { return winners_; }
  bool IsDraw() const { return draw_; }
  absl::Status Resolve();
  absl::Status NextPhase();
  // Resolves before advancing the phase, whatever the command order.
  absl::Status ApplyCommands(absl::Span<const GameCommand> commands);
  // Moderator override. Pending abilities and votes are dropped.
  absl::Status SetTime(const Time& t);

  // Abilities.
  absl::Status QueueAbility(const string& player, const string& ability,
                            absl::Span<const string> targets);
  absl::Status DequeueAbility(const string& player, const string& ability);
  absl::StatusOr<AbilityListing> ListAbilities(const string& player) const;
  const AbilityQueue& queue() const { return queue_; }
  const vector<ResolutionRecord>& resolution_log() const {
    return resolution_log_;
  }

  // Votes.
  absl::Status CastVote(const string& voter, const string& target);
  absl::Status Unvote(const string& voter);
  string VoteCount() const;

  // Chats.
  bool CanRead(const Viewer& viewer, const string& channel) const;
  bool CanWrite(const Viewer& viewer, const string& channel) const;
  // A non-positive limit means the default page size.
  absl::StatusOr<ChatPage> ReadChat(const Viewer& viewer,
                                    const string& channel, int start,
                                    int limit) const;
  absl::Status PostChat(const Viewer& viewer, const string& channel,
                        const string& content);

  // What the viewer is allowed to see of the game.
  GameOverview Overview(const Viewer& viewer) const;

  // Players, alignments and abilities.
  int NumPlayers() const { return players_.size(); }
  int PlayerIndex(const string& name) const;  // kNoPlayer if unknown.
  const Player& player(int i) const { return players_[i]; }
  const string& PlayerName(int i) const { return players_[i].name; }
  bool IsAlive(int i) const { return players_[i].IsAlive(); }
  bool IsTown(int i) const { return players_[i].alignment->HasTag("town"); }
  bool SameAlignment(int a, int b) const {
    return players_[a].alignment_index == players_[b].alignment_index;
  }
  const string& AlignmentId(int i) const { return players_[i].alignment->id; }
  const string& RoleId(int i) const { return players_[i].role->id; }
  string RoleName(int i) const;
  int NumAlive() const;
  int NumAliveNonTown() const;
  int NumAlignments() const { return alignments_.size(); }
  const AlignmentState& alignment(int i) const { return alignments_[i]; }
  const AbilityInstance& ability(int i) const { return abilities_[i]; }
  std::optional<Fact> Knows(int observer, int subject) const {
    return knowledge_.Knows(observer, subject);
  }
  const EngineOptions& options() const { return options_; }

  // Mutations applied by resolving effects.
  void KillPlayer(int i, const string& cause);
  void Learn(int observer, int subject, const Fact& fact);
  void SendPrivateMessage(int player, const string& author,
                          const string& content);
  void PostGlobal(const string& author, const string& content);

 private:
  friend class Resolver;

  explicit GameState(shared_ptr<const Catalog> catalog);
  absl::Status Init(const GameSetup& setup);
  int AddAlignment(const AlignmentTemplate* alignment);
  absl::Status AddPlayer(const string& name, const RoleAssignment& assignment);

  absl::Status CheckMutable() const;
  // The player's own abilities, then the shared ones of their alignment.
  vector<int> PlayerAbilities(int player) const;
  int FindAbility(int player, const string& id) const;  // -1 if unknown.
  // Eligibility regardless of the targets.
  absl::Status CheckEligible(int user, int ability) const;
  absl::Status CheckCanQueue(int user, int ability,
                             absl::Span<const int> targets) const;
  vector<int> ValidTargets(int user, int ability) const;
  AbilityView AbilityToView(int user, int ability) const;
  bool IsVotingPhase() const;
  bool IsChatPhase() const;
  // Returns the players of a private pair channel id, or false.
  bool ParsePairChannel(const string& id, int* a, int* b) const;
  bool IsParticipant(int player, const string& channel) const;
  string Author(const Viewer& viewer) const;

  // Resolution bookkeeping.
  int EliminateByVote();  // Returns the eliminated player, or kNoPlayer.
  void RecordUse(int ability, const vector<int>& targets, int uses);
  void ClearPhaseState();
  void EvaluateWin();

  shared_ptr<const Catalog> catalog_;
  GameLog log_;
  EngineOptions options_;
  Time time_;
  bool resolved_ = false;
  bool draw_ = false;
  vector<string> winners_;
  vector<Player> players_;
  unordered_map<string, int> player_index_;
  vector<AlignmentState> alignments_;
  vector<AbilityInstance> abilities_;
  AbilityQueue queue_;
  map<int, int> votes_;  // Voter to target, kNoPlayer for no elimination.
  Knowledge knowledge_;
  ChatRegistry chats_;
  vector<ResolutionRecord> resolution_log_;
};
}  // namespace mafia

#endif  // SRC_GAME_STATE_H_
