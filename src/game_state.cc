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

#include "src/game_state.h"

#include <algorithm>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "ortools/base/logging.h"
#include "src/errors.h"
#include "src/game_log.pb.h"
#include "src/modifiers.h"
#include "src/resolver.h"

namespace mafia {

using std::set;

namespace {
const char kVoteAuthor[] = "Vote";
const char kUnvoteAuthor[] = "Unvote";
const char kPairPrefix[] = "private:";

vector<EffectCategory> CategoryOrder(const EngineOptions& options) {
  vector<EffectCategory> order;
  for (int c : options.category_order()) {
    order.push_back(EffectCategory(c));
  }
  return order;
}

bool HasPhase(const google::protobuf::RepeatedField<int>& phases, Phase p) {
  return std::find(phases.begin(), phases.end(), p) != phases.end();
}

vector<string> ToVector(const google::protobuf::RepeatedPtrField<string>& rf) {
  return vector<string>(rf.begin(), rf.end());
}
}  // namespace

GameState::GameState(shared_ptr<const Catalog> catalog)
    : catalog_(std::move(catalog)) {
  CHECK(catalog_ != nullptr) << "A game needs a catalog";
}

absl::StatusOr<GameState> GameState::Create(shared_ptr<const Catalog> catalog,
                                            const GameSetup& setup) {
  GameState g(std::move(catalog));
  absl::Status status = g.Init(setup);
  if (!status.ok()) {
    return status;
  }
  return g;
}

absl::StatusOr<GameState> GameState::FromProto(
    shared_ptr<const Catalog> catalog, const GameLog& log) {
  absl::StatusOr<GameState> g = Create(std::move(catalog), log.setup());
  if (!g.ok()) {
    return g.status();
  }
  for (int i = 0; i < log.events_size(); ++i) {
    absl::Status status = g->AddEvent(log.events(i));
    if (!status.ok()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Replaying event %d: %s", i, status.ToString()));
    }
  }
  return g;
}

absl::Status GameState::Init(const GameSetup& setup) {
  if (setup.players().empty()) {
    return absl::InvalidArgumentError("A game needs players");
  }
  set<string> names;
  for (const string& name : setup.players()) {
    if (name.empty() || absl::StrContains(name, ":")) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid player name '", name, "'"));
    }
    if (!names.insert(name).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate player name ", name));
    }
  }
  if (setup.roles_size() != setup.players_size()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Expected %d role assignments, got %d", setup.players_size(),
        setup.roles_size()));
  }
  time_ = setup.has_start() ? Time::FromProto(setup.start()) : Time::Day(1);
  if (!time_.Initialized()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid start day ", time_.count));
  }

  options_ = setup.options();
  if (options_.category_order().empty()) {
    for (EffectCategory c : DefaultCategoryOrder()) {
      options_.add_category_order(c);
    }
  }
  absl::Status status = ValidateCategoryOrder(CategoryOrder(options_));
  if (!status.ok()) {
    return status;
  }
  if (!options_.has_reveal_roles_on_death()) {
    options_.set_reveal_roles_on_death(true);
  }
  if (options_.chat_phases().empty()) {
    options_.add_chat_phases(DAY);
  }
  if (options_.voting_phases().empty()) {
    options_.add_voting_phases(DAY);
  }
  if (options_.page_size() <= 0) {
    options_.set_page_size(kDefaultPageSize);
  }

  vector<RoleAssignment> roles(setup.roles().begin(), setup.roles().end());
  if (setup.shuffle_roles()) {
    uint64_t seed = setup.seed();
    if (seed == 0) {
      absl::BitGen bitgen;
      seed = absl::Uniform<uint64_t>(bitgen);
    }
    std::mt19937_64 rng(seed);
    std::shuffle(roles.begin(), roles.end(), rng);
  }
  for (int i = 0; i < setup.players_size(); ++i) {
    status = AddPlayer(setup.players(i), roles[i]);
    if (!status.ok()) {
      return status;
    }
  }

  // Channels and what the players know from the start.
  for (int i = 0; i < NumPlayers(); ++i) {
    chats_.AddChannel(InboxChannel(PlayerName(i)), ChannelKind::INBOX, {i});
  }
  for (const AlignmentState& a : alignments_) {
    if (a.alignment->HasTag("chat")) {
      const string id = FactionChannel(a.alignment->id);
      chats_.AddChannel(id, ChannelKind::FACTION,
                        set<int>(a.members.begin(), a.members.end()));
      for (int m : a.members) {
        chats_.Post(id, a.alignment->id,
                    absl::StrFormat("%s is a %s.", PlayerName(m), RoleName(m)));
      }
    }
    if (a.alignment->HasTag("informed")) {
      for (int observer : a.members) {
        for (int subject : a.members) {
          knowledge_.Learn(observer, subject,
                           {.alignment = AlignmentId(subject),
                            .role = RoleId(subject)});
        }
      }
    }
  }

  // The log holds the setup actually played.
  GameSetup* logged = log_.mutable_setup();
  *logged = setup;
  logged->clear_roles();
  for (const RoleAssignment& r : roles) {
    *logged->add_roles() = r;
  }
  logged->set_shuffle_roles(false);
  *logged->mutable_start() = time_.ToProto();
  *logged->mutable_options() = options_;
  LOG(INFO) << "Created a game of " << NumPlayers() << " players at " << time_;
  return absl::OkStatus();
}

int GameState::AddAlignment(const AlignmentTemplate* alignment) {
  const int index = alignments_.size();
  AlignmentState state = {.alignment = alignment};
  for (const AbilitySpec& spec : alignment->shared_actions) {
    AbilityInstance a = {.spec = spec, .owner = kNoPlayer, .alignment = index};
    a.spec.kind = SHARED_ACTION;
    state.shared_abilities.push_back(abilities_.size());
    abilities_.push_back(std::move(a));
  }
  alignments_.push_back(std::move(state));
  return index;
}

absl::Status GameState::AddPlayer(const string& name,
                                  const RoleAssignment& assignment) {
  const RoleTemplate* role = catalog_->FindRole(assignment.role());
  if (role == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown role ", assignment.role()));
  }
  const AlignmentTemplate* alignment =
      catalog_->FindAlignment(assignment.alignment());
  if (alignment == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown alignment ", assignment.alignment()));
  }
  vector<shared_ptr<const Modifier>> modifiers;
  for (const ModifierSpec& spec : assignment.modifiers()) {
    absl::StatusOr<shared_ptr<const Modifier>> m = catalog_->NewModifier(spec);
    if (!m.ok()) {
      return m.status();
    }
    modifiers.push_back(*std::move(m));
  }

  int alignment_index = -1;
  for (int i = 0; i < alignments_.size(); ++i) {
    if (alignments_[i].alignment == alignment) {
      alignment_index = i;
    }
  }
  if (alignment_index == -1) {
    alignment_index = AddAlignment(alignment);
  }

  const int index = players_.size();
  Player p = {.name = name, .role = role, .alignment = alignment,
              .alignment_index = alignment_index};
  for (const auto& m : modifiers) {
    p.modifiers.push_back(m->Name());
  }
  vector<AbilityInstance> added;
  auto add_ability = [&](const AbilitySpec& spec,
                         bool modified) -> absl::Status {
    AbilityInstance a = {.spec = spec, .owner = index,
                         .alignment = alignment_index};
    if (modified) {
      for (const auto& m : modifiers) {
        absl::Status status = m->Validate(a.spec);
        if (!status.ok()) {
          return status;
        }
        m->Transform(&a.spec);
      }
      a.modifiers = modifiers;
    }
    added.push_back(std::move(a));
    return absl::OkStatus();
  };
  for (const AbilitySpec& spec : role->actions) {
    absl::Status status = add_ability(spec, true);
    if (!status.ok()) {
      return status;
    }
  }
  for (const AbilitySpec& spec : role->passives) {
    absl::Status status = add_ability(spec, true);
    if (!status.ok()) {
      return status;
    }
  }
  // Modifiers change the role, not the abilities granted by the alignment.
  for (const AbilitySpec& spec : alignment->actions) {
    CHECK(add_ability(spec, false).ok());
  }
  for (AbilityInstance& a : added) {
    p.abilities.push_back(abilities_.size());
    abilities_.push_back(std::move(a));
  }
  players_.push_back(std::move(p));
  player_index_[name] = index;
  alignments_[alignment_index].members.push_back(index);
  return absl::OkStatus();
}

absl::Status GameState::AddEvent(const Event& event) {
  switch (event.details_case()) {
    case Event::kQueue:
      return QueueAbility(event.queue().player(), event.queue().ability(),
                          ToVector(event.queue().targets()));
    case Event::kDequeue:
      return DequeueAbility(event.dequeue().player(),
                            event.dequeue().ability());
    case Event::kCommand:
      switch (event.command()) {
        case RESOLVE:
          return Resolve();
        case NEXT_PHASE:
          return NextPhase();
        default:
          return absl::InvalidArgumentError(
              absl::StrCat("Unknown command ", event.command()));
      }
    case Event::kSetTime:
      return SetTime(Time::FromProto(event.set_time()));
    case Event::kVote:
      return CastVote(event.vote().voter(), event.vote().target());
    case Event::kUnvote:
      return Unvote(event.unvote());
    case Event::kPost: {
      Viewer viewer;
      if (event.post().author().empty()) {
        viewer.set_level(Viewer::MODERATOR);
      } else {
        viewer.set_level(Viewer::PLAYER);
        viewer.set_player(event.post().author());
      }
      return PostChat(viewer, event.post().channel(), event.post().content());
    }
    default:
      return absl::InvalidArgumentError("Empty event");
  }
}

absl::Status GameState::CheckMutable() const {
  if (resolved_) {
    return GameAlreadyResolved("The game is already resolved");
  }
  return absl::OkStatus();
}

absl::Status GameState::Resolve() {
  absl::Status status = CheckMutable();
  if (!status.ok()) {
    return status;
  }
  VLOG(1) << "Resolving " << time_;
  for (ResolutionRecord& r :
       Resolver(CategoryOrder(options_)).Resolve(this)) {
    resolution_log_.push_back(std::move(r));
  }
  Event e;
  e.set_command(RESOLVE);
  *log_.add_events() = e;
  return absl::OkStatus();
}

absl::Status GameState::NextPhase() {
  if (resolved_) {
    return IllegalPhaseTransition("The game is resolved");
  }
  if (!queue_.Empty() || !votes_.empty()) {
    return IllegalPhaseTransition(absl::StrCat(
        "There are unresolved abilities or votes on ", string(time_)));
  }
  ++time_;
  VLOG(1) << "Advanced to " << time_;
  Event e;
  e.set_command(NEXT_PHASE);
  *log_.add_events() = e;
  return absl::OkStatus();
}

absl::Status GameState::ApplyCommands(absl::Span<const GameCommand> commands) {
  bool resolve = false, next_phase = false;
  for (GameCommand c : commands) {
    switch (c) {
      case RESOLVE:
        resolve = true;
        break;
      case NEXT_PHASE:
        next_phase = true;
        break;
      default:
        return absl::InvalidArgumentError(
            absl::StrCat("Unknown command ", GameCommand_Name(c)));
    }
  }
  if (resolve) {
    absl::Status status = Resolve();
    if (!status.ok()) {
      return status;
    }
    if (resolved_) {
      return absl::OkStatus();  // Nothing to advance to.
    }
  }
  return next_phase ? NextPhase() : absl::OkStatus();
}

absl::Status GameState::SetTime(const Time& t) {
  if (resolved_) {
    return IllegalPhaseTransition("The game is resolved");
  }
  if (!t.Initialized()) {
    return IllegalPhaseTransition(absl::StrCat("Invalid day ", t.count));
  }
  time_ = t;
  ClearPhaseState();
  LOG(INFO) << "Time set to " << time_;
  Event e;
  *e.mutable_set_time() = time_.ToProto();
  *log_.add_events() = e;
  return absl::OkStatus();
}

vector<int> GameState::PlayerAbilities(int player) const {
  vector<int> result = players_[player].abilities;
  const AlignmentState& a = alignments_[players_[player].alignment_index];
  result.insert(result.end(), a.shared_abilities.begin(),
                a.shared_abilities.end());
  return result;
}

int GameState::FindAbility(int player, const string& id) const {
  for (int i : PlayerAbilities(player)) {
    if (abilities_[i].spec.id == id) {
      return i;
    }
  }
  return -1;
}

absl::Status GameState::CheckEligible(int user, int ability) const {
  const AbilityInstance& a = abilities_[ability];
  if (a.spec.kind == PASSIVE) {
    return IneligibleNow(absl::StrCat(a.spec.id, " is passive"));
  }
  if (!a.active) {
    return IneligibleNow(absl::StrCat(a.spec.id, " is not active"));
  }
  if (!IsAlive(user)) {
    return IneligibleNow(absl::StrCat(PlayerName(user), " is dead"));
  }
  if (a.spec.phase != PHASE_UNSPECIFIED && a.spec.phase != time_.phase()) {
    return IneligibleNow(absl::StrFormat("%s cannot be used during %s",
                                         a.spec.id, string(time_)));
  }
  if (a.UsesExhausted()) {
    return IneligibleNow(absl::StrFormat("%s was used %d times already",
                                         a.spec.id, a.uses));
  }
  return absl::OkStatus();
}

absl::Status GameState::CheckCanQueue(int user, int ability,
                                      absl::Span<const int> targets) const {
  absl::Status status = CheckEligible(user, ability);
  if (!status.ok()) {
    return status;
  }
  const AbilityInstance& a = abilities_[ability];
  const int expected = a.spec.self_targeted ? 0 : a.spec.target_count;
  if (targets.size() != expected) {
    return InvalidTargetCount(absl::StrFormat(
        "%s needs %d targets, got %d", a.spec.id, expected, targets.size()));
  }
  for (int t : targets) {
    if (!IsAlive(t)) {
      return InvalidTarget(absl::StrCat(PlayerName(t), " is dead"));
    }
    if (t == user && !a.spec.allow_self_target) {
      return InvalidTarget(absl::StrCat(a.spec.id, " cannot target its user"));
    }
  }
  if (a.spec.effect != nullptr) {
    status = a.spec.effect->ValidateTargets(*this, user, targets);
    if (!status.ok()) {
      return status;
    }
  }
  return CheckModifiersQueue(*this, a, user, targets);
}

absl::Status GameState::QueueAbility(const string& player,
                                     const string& ability,
                                     absl::Span<const string> targets) {
  absl::Status status = CheckMutable();
  if (!status.ok()) {
    return status;
  }
  const int user = PlayerIndex(player);
  if (user == kNoPlayer) {
    return absl::NotFoundError(absl::StrCat("Unknown player ", player));
  }
  const int index = FindAbility(user, ability);
  if (index == -1) {
    return UnknownAbility(
        absl::StrFormat("%s has no ability %s", player, ability));
  }
  const AbilityInstance& a = abilities_[index];
  if (targets.empty() && !a.spec.self_targeted && a.spec.target_count > 0) {
    return DequeueAbility(player, ability);  // An empty selection.
  }
  vector<int> target_indices;
  for (const string& t : targets) {
    const int i = PlayerIndex(t);
    if (i == kNoPlayer) {
      return InvalidTarget(absl::StrCat("Unknown player ", t));
    }
    target_indices.push_back(i);
  }
  status = CheckCanQueue(user, index, target_indices);
  if (!status.ok()) {
    return status;
  }

  Event e;
  AbilityUse* use = e.mutable_queue();
  use->set_player(player);
  use->set_ability(ability);
  for (const string& t : targets) {
    use->add_targets(t);
  }
  *log_.add_events() = e;
  if (a.spec.immediate) {
    resolution_log_.push_back(Resolver(CategoryOrder(options_))
        .ResolveImmediate(this, index, user, target_indices));
  } else {
    queue_.Queue(index, a.IsShared(), user, target_indices, time_);
  }
  return absl::OkStatus();
}

absl::Status GameState::DequeueAbility(const string& player,
                                       const string& ability) {
  absl::Status status = CheckMutable();
  if (!status.ok()) {
    return status;
  }
  const int user = PlayerIndex(player);
  if (user == kNoPlayer) {
    return absl::NotFoundError(absl::StrCat("Unknown player ", player));
  }
  const int index = FindAbility(user, ability);
  if (index == -1) {
    return UnknownAbility(
        absl::StrFormat("%s has no ability %s", player, ability));
  }
  queue_.Dequeue(index, abilities_[index].IsShared(), user);
  Event e;
  e.mutable_dequeue()->set_player(player);
  e.mutable_dequeue()->set_ability(ability);
  *log_.add_events() = e;
  return absl::OkStatus();
}

vector<int> GameState::ValidTargets(int user, int ability) const {
  vector<int> result;
  const AbilitySpec& spec = abilities_[ability].spec;
  if (spec.self_targeted || spec.target_count != 1) {
    return result;
  }
  for (int t = 0; t < NumPlayers(); ++t) {
    const int targets[] = {t};
    if (CheckCanQueue(user, ability, targets).ok()) {
      result.push_back(t);
    }
  }
  return result;
}

AbilityView GameState::AbilityToView(int user, int ability) const {
  const AbilityInstance& a = abilities_[ability];
  AbilityView v;
  v.set_id(a.spec.id);
  v.set_kind(a.spec.kind);
  v.set_description(a.spec.description);
  v.set_target_count(a.spec.self_targeted ? 0 : a.spec.target_count);
  v.set_immediate(a.spec.immediate);
  v.set_eligible(!resolved_ && CheckEligible(user, ability).ok() &&
                 CheckModifiersQueue(*this, a, user, {}).ok());
  if (v.eligible()) {
    for (int t : ValidTargets(user, ability)) {
      v.add_valid_targets(PlayerName(t));
    }
  }
  const QueuedAbility* q = queue_.Find(ability, a.IsShared(), user);
  if (q != nullptr) {
    v.set_queued(true);
    for (int t : q->targets) {
      v.add_queued_targets(PlayerName(t));
    }
    if (a.IsShared()) {
      v.set_used_by(PlayerName(q->user));
    }
  }
  v.set_uses(a.uses);
  v.set_max_uses(a.spec.max_uses);
  return v;
}

absl::StatusOr<AbilityListing> GameState::ListAbilities(
    const string& player) const {
  const int user = PlayerIndex(player);
  if (user == kNoPlayer) {
    return absl::NotFoundError(absl::StrCat("Unknown player ", player));
  }
  AbilityListing listing;
  listing.set_player(player);
  for (int i : PlayerAbilities(user)) {
    switch (abilities_[i].spec.kind) {
      case PASSIVE:
        *listing.add_passives() = AbilityToView(user, i);
        break;
      case SHARED_ACTION:
        *listing.add_shared_actions() = AbilityToView(user, i);
        break;
      default:
        *listing.add_actions() = AbilityToView(user, i);
    }
  }
  return listing;
}

bool GameState::IsVotingPhase() const {
  return HasPhase(options_.voting_phases(), time_.phase());
}

bool GameState::IsChatPhase() const {
  return HasPhase(options_.chat_phases(), time_.phase());
}

absl::Status GameState::CastVote(const string& voter, const string& target) {
  absl::Status status = CheckMutable();
  if (!status.ok()) {
    return status;
  }
  const int v = PlayerIndex(voter);
  if (v == kNoPlayer) {
    return absl::NotFoundError(absl::StrCat("Unknown player ", voter));
  }
  if (!IsVotingPhase()) {
    return IneligibleNow(absl::StrCat("No voting during ", string(time_)));
  }
  if (!IsAlive(v)) {
    return IneligibleNow(absl::StrCat(voter, " is dead"));
  }
  int t = kNoPlayer;
  if (!target.empty()) {
    t = PlayerIndex(target);
    if (t == kNoPlayer) {
      return InvalidTarget(absl::StrCat("Unknown player ", target));
    }
    if (!IsAlive(t)) {
      return InvalidTarget(absl::StrCat(target, " is dead"));
    }
  }
  votes_[v] = t;
  PostGlobal(kVoteAuthor,
             t == kNoPlayer
                 ? absl::StrCat(voter, " voted to not eliminate anyone.")
                 : absl::StrFormat("%s voted for %s.", voter, target));
  Event e;
  e.mutable_vote()->set_voter(voter);
  e.mutable_vote()->set_target(target);
  *log_.add_events() = e;
  return absl::OkStatus();
}

absl::Status GameState::Unvote(const string& voter) {
  absl::Status status = CheckMutable();
  if (!status.ok()) {
    return status;
  }
  const int v = PlayerIndex(voter);
  if (v == kNoPlayer) {
    return absl::NotFoundError(absl::StrCat("Unknown player ", voter));
  }
  if (!IsVotingPhase()) {
    return IneligibleNow(absl::StrCat("No voting during ", string(time_)));
  }
  if (!IsAlive(v)) {
    return IneligibleNow(absl::StrCat(voter, " is dead"));
  }
  votes_.erase(v);
  PostGlobal(kUnvoteAuthor, absl::StrCat(voter, " unvoted."));
  Event e;
  e.set_unvote(voter);
  *log_.add_events() = e;
  return absl::OkStatus();
}

string GameState::VoteCount() const {
  auto names = [this](const vector<int>& players) {
    return absl::StrJoin(players, ", ", [this](string* out, int p) {
      out->append(PlayerName(p));
    });
  };
  vector<string> lines;
  map<int, vector<int>> voters;
  for (const auto& it : votes_) {
    voters[it.second].push_back(it.first);
  }
  for (int i = 0; i < NumPlayers(); ++i) {
    const auto it = voters.find(i);
    if (it != voters.end()) {
      lines.push_back(absl::StrFormat("%s (%d): %s", PlayerName(i),
                                      it->second.size(), names(it->second)));
    }
  }
  const auto no_elimination = voters.find(kNoPlayer);
  if (no_elimination != voters.end()) {
    lines.push_back(absl::StrFormat("No Elimination (%d): %s",
                                    no_elimination->second.size(),
                                    names(no_elimination->second)));
  }
  vector<int> non_voters;
  for (int i = 0; i < NumPlayers(); ++i) {
    if (IsAlive(i) && votes_.count(i) == 0) {
      non_voters.push_back(i);
    }
  }
  if (!non_voters.empty()) {
    lines.push_back(absl::StrFormat("Not Voting (%d): %s", non_voters.size(),
                                    names(non_voters)));
  }
  return absl::StrJoin(lines, "\n");
}

int GameState::EliminateByVote() {
  map<int, int> counts;
  for (const auto& it : votes_) {
    if (it.second != kNoPlayer && IsAlive(it.first)) {
      ++counts[it.second];
    }
  }
  const int alive = NumAlive();
  for (const auto& it : counts) {
    if (it.second > alive / 2.0 && IsAlive(it.first)) {
      KillPlayer(it.first, kVoteAuthor);
      return it.first;
    }
  }
  return kNoPlayer;
}

void GameState::RecordUse(int ability, const vector<int>& targets, int uses) {
  if (uses <= 0) {
    return;
  }
  AbilityInstance& a = abilities_[ability];
  a.uses += uses;
  a.history.push_back({.time = time_, .targets = targets});
}

void GameState::ClearPhaseState() {
  queue_.Clear();
  votes_.clear();
}

void GameState::EvaluateWin() {
  vector<string> winners;
  for (int i = 0; i < alignments_.size(); ++i) {
    const AlignmentTemplate* a = alignments_[i].alignment;
    if (a->win(*this, i)) {
      winners.push_back(a->id);
    }
  }
  if (winners.size() == 1) {
    resolved_ = true;
    winners_ = winners;
    LOG(INFO) << winners[0] << " won on " << time_;
  } else if (NumAlive() == 0) {
    resolved_ = true;
    draw_ = true;
    LOG(INFO) << "The game ended in a draw on " << time_;
  }
}

int GameState::PlayerIndex(const string& name) const {
  const auto it = player_index_.find(name);
  return it == player_index_.end() ? kNoPlayer : it->second;
}

string GameState::RoleName(int i) const {
  const Player& p = players_[i];
  return mafia::RoleName(*p.role, *p.alignment, p.modifiers);
}

int GameState::NumAlive() const {
  return std::count_if(players_.begin(), players_.end(),
                       [](const Player& p) { return p.IsAlive(); });
}

int GameState::NumAliveNonTown() const {
  int count = 0;
  for (int i = 0; i < NumPlayers(); ++i) {
    count += IsAlive(i) && !IsTown(i);
  }
  return count;
}

void GameState::KillPlayer(int i, const string& cause) {
  Player& p = players_[i];
  if (!p.IsAlive()) {
    return;
  }
  p.death_causes.push_back(cause);
  VLOG(1) << p.name << " died on " << time_ << " (" << cause << ")";
  if (options_.reveal_roles_on_death()) {
    const Fact fact = {.alignment = AlignmentId(i), .role = RoleId(i)};
    for (int j = 0; j < NumPlayers(); ++j) {
      knowledge_.Learn(j, i, fact);
    }
  }
}

void GameState::Learn(int observer, int subject, const Fact& fact) {
  knowledge_.Learn(observer, subject, fact);
}

void GameState::SendPrivateMessage(int player, const string& author,
                                   const string& content) {
  chats_.Post(InboxChannel(PlayerName(player)), author, content);
}

void GameState::PostGlobal(const string& author, const string& content) {
  chats_.Post(kGlobalChannel, author, content);
}

bool GameState::ParsePairChannel(const string& id, int* a, int* b) const {
  absl::string_view rest = id;
  if (!absl::ConsumePrefix(&rest, kPairPrefix)) {
    return false;
  }
  const vector<string> names = absl::StrSplit(rest, ':');
  if (names.size() != 2 || names[0] == names[1]) {
    return false;
  }
  *a = PlayerIndex(names[0]);
  *b = PlayerIndex(names[1]);
  return *a != kNoPlayer && *b != kNoPlayer &&
         PairChannel(names[0], names[1]) == id;
}

bool GameState::IsParticipant(int player, const string& channel) const {
  const Channel* c = chats_.Find(channel);
  if (c != nullptr) {
    return c->IsParticipant(player);
  }
  int a, b;
  return ParsePairChannel(channel, &a, &b) && (player == a || player == b);
}

string GameState::Author(const Viewer& viewer) const {
  return viewer.level() == Viewer::MODERATOR ? kModeratorAuthor
                                             : viewer.player();
}

bool GameState::CanRead(const Viewer& viewer, const string& channel) const {
  int a, b;
  const Channel* c = chats_.Find(channel);
  if (c == nullptr && !ParsePairChannel(channel, &a, &b)) {
    return false;
  }
  switch (viewer.level()) {
    case Viewer::MODERATOR:
      return true;
    case Viewer::PLAYER: {
      const int p = PlayerIndex(viewer.player());
      return p != kNoPlayer && IsParticipant(p, channel);
    }
    default:
      return c != nullptr && c->kind == ChannelKind::GLOBAL;
  }
}

bool GameState::CanWrite(const Viewer& viewer, const string& channel) const {
  if (!CanRead(viewer, channel)) {
    return false;
  }
  switch (viewer.level()) {
    case Viewer::MODERATOR:
      return true;
    case Viewer::PLAYER: {
      const int p = PlayerIndex(viewer.player());
      if (!IsAlive(p)) {
        return false;
      }
      return channel != kGlobalChannel || IsChatPhase();
    }
    default:
      return false;
  }
}

absl::StatusOr<ChatPage> GameState::ReadChat(const Viewer& viewer,
                                             const string& channel, int start,
                                             int limit) const {
  if (viewer.level() == Viewer::PLAYER &&
      PlayerIndex(viewer.player()) == kNoPlayer) {
    return absl::NotFoundError(absl::StrCat("Unknown player ",
                                            viewer.player()));
  }
  int a, b;
  const bool exists = chats_.HasChannel(channel);
  if (!exists && !ParsePairChannel(channel, &a, &b)) {
    return absl::NotFoundError(absl::StrCat("Unknown channel ", channel));
  }
  if (!CanRead(viewer, channel)) {
    return absl::PermissionDeniedError(
        absl::StrFormat("%s cannot read %s", Author(viewer), channel));
  }
  if (start < 0) {
    return absl::InvalidArgumentError(absl::StrCat("Invalid start ", start));
  }
  if (limit <= 0) {
    limit = options_.page_size();
  }
  if (!exists) {
    ChatPage page;  // A pair channel nobody wrote to yet.
    page.set_channel(channel);
    page.set_start(start);
    return page;
  }
  return chats_.Page(channel, start, limit);
}

absl::Status GameState::PostChat(const Viewer& viewer, const string& channel,
                                 const string& content) {
  absl::Status status = CheckMutable();
  if (!status.ok()) {
    return status;
  }
  if (viewer.level() == Viewer::PLAYER &&
      PlayerIndex(viewer.player()) == kNoPlayer) {
    return absl::NotFoundError(absl::StrCat("Unknown player ",
                                            viewer.player()));
  }
  int a, b;
  const bool exists = chats_.HasChannel(channel);
  const bool pair = !exists && ParsePairChannel(channel, &a, &b);
  if (!exists && !pair) {
    return absl::NotFoundError(absl::StrCat("Unknown channel ", channel));
  }
  if (!CanWrite(viewer, channel)) {
    return absl::PermissionDeniedError(
        absl::StrFormat("%s cannot write to %s", Author(viewer), channel));
  }
  if (content.empty()) {
    return absl::InvalidArgumentError("Empty message");
  }
  if (pair) {
    chats_.AddChannel(channel, ChannelKind::PAIR, {a, b});
  }
  chats_.Post(channel, Author(viewer), content);
  Event e;
  ChatPost* post = e.mutable_post();
  post->set_channel(channel);
  if (viewer.level() == Viewer::PLAYER) {
    post->set_author(viewer.player());
  }
  post->set_content(content);
  *log_.add_events() = e;
  return absl::OkStatus();
}

GameOverview GameState::Overview(const Viewer& viewer) const {
  GameOverview o;
  *o.mutable_time() = time_.ToProto();
  o.set_resolved(resolved_);
  for (const string& w : winners_) {
    o.add_winners(w);
  }
  o.set_draw(draw_);
  const bool moderator = viewer.level() == Viewer::MODERATOR;
  const int self = viewer.level() == Viewer::PLAYER
      ? PlayerIndex(viewer.player()) : kNoPlayer;
  for (int i = 0; i < NumPlayers(); ++i) {
    PlayerView* v = o.add_players();
    v->set_name(PlayerName(i));
    v->set_alive(IsAlive(i));
    if (moderator || i == self) {
      v->set_role(RoleId(i));
      v->set_alignment(AlignmentId(i));
      v->set_role_name(RoleName(i));
      for (const string& cause : players_[i].death_causes) {
        v->add_death_causes(cause);
      }
      continue;
    }
    if (self == kNoPlayer) {
      continue;
    }
    const std::optional<Fact> fact = Knows(self, i);
    if (fact.has_value()) {
      v->set_role(fact->role);
      v->set_alignment(fact->alignment);
      // Modifiers are never learned.
      if (fact->Complete()) {
        v->set_role_name(mafia::RoleName(*players_[i].role,
                                         *players_[i].alignment));
      }
    }
  }
  for (const string& id : chats_.ChannelIds()) {
    if (CanRead(viewer, id)) {
      ChannelSummary* c = o.add_channels();
      c->set_id(id);
      c->set_message_count(chats_.Find(id)->messages.size());
      c->set_can_write(CanWrite(viewer, id));
    }
  }
  return o;
}
}  // namespace mafia
