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

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/catalog.h"
#include "src/errors.h"
#include "src/effects.h"
#include "src/game_state.h"
#include "src/test_util.h"

namespace mafia {
namespace {

using std::make_shared;
using testing::ElementsAre;

// The default catalog, plus a protection that resolves after kills, a kill
// that resolves with protections, and kills tagged unstoppable and hidden.
shared_ptr<const Catalog> TestCatalog() {
  auto c = make_shared<Catalog>();
  AddDefaultTemplates(c.get());
  AbilitySpec late;
  late.id = "Late Doctor";
  late.effect = make_shared<Protect>(1, false);
  late.priority = kKillPriority + 10;
  c->AddRole({.id = "Late Doctor", .actions = {late}});
  AbilitySpec quick;
  quick.id = "Quick Kill";
  quick.effect = make_shared<Kill>();
  quick.priority = kProtectPriority;
  quick.category = OFFENSIVE;
  c->AddRole({.id = "Quick Killer", .actions = {quick}});
  AbilitySpec assassinate;
  assassinate.id = "Assassinate";
  assassinate.effect = make_shared<Kill>();
  assassinate.priority = kKillPriority;
  assassinate.category = OFFENSIVE;
  assassinate.tags = {"kill", "unstoppable"};
  c->AddRole({.id = "Assassin", .actions = {assassinate}});
  AbilitySpec sneak = assassinate;
  sneak.id = "Sneak Kill";
  sneak.tags = {"kill", "hidden"};
  c->AddRole({.id = "Ninja", .actions = {sneak}});
  return c;
}

const vector<Seat> kTown = {
  {"Alice", "Vanilla", "Town"},
  {"Bob", "Vanilla", "Town"},
  {"Carol", "Vanilla", "Town"},
  {"Eve", "Vanilla", "Mafia"},
  {"Mal", "Vanilla", "Mafia"},
};

vector<Seat> With(vector<Seat> extra) {
  vector<Seat> seats = kTown;
  seats.insert(seats.end(), extra.begin(), extra.end());
  return seats;
}

TEST(CategoryOrder, Validation) {
  EXPECT_TRUE(ValidateCategoryOrder(DefaultCategoryOrder()).ok());
  const EffectCategory reversed[] = {CLEANUP, OFFENSIVE, INFORMATIONAL,
                                     PROTECTIVE};
  EXPECT_TRUE(ValidateCategoryOrder(reversed).ok());
  const EffectCategory missing[] = {PROTECTIVE, INFORMATIONAL, OFFENSIVE};
  EXPECT_FALSE(ValidateCategoryOrder(missing).ok());
  const EffectCategory repeated[] = {PROTECTIVE, INFORMATIONAL, OFFENSIVE,
                                     CLEANUP, CLEANUP};
  EXPECT_FALSE(ValidateCategoryOrder(repeated).ok());
  const EffectCategory unspecified[] = {PROTECTIVE, INFORMATIONAL, OFFENSIVE,
                                        CLEANUP, EFFECT_CATEGORY_UNSPECIFIED};
  EXPECT_FALSE(ValidateCategoryOrder(unspecified).ok());
}

TEST(Resolver, ProtectionBeforeKillSaves) {
  GameState g = MakeGame(With({{"Dan", "Doctor", "Town"}}), Time::Night(1),
                         TestCatalog());
  EXPECT_TRUE(g.QueueAbility("Eve", "Mafia Factional Kill", {"Alice"}).ok());
  EXPECT_TRUE(g.QueueAbility("Dan", "Doctor", {"Alice"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(g.IsAlive(0));
  EXPECT_EQ(FindRecord(g, "Mafia Factional Kill")->detail(), "protected");
}

TEST(Resolver, ProtectionAfterKillDoesNothing) {
  GameState g = MakeGame(With({{"Lee", "Late Doctor", "Town"}}),
                         Time::Night(1), TestCatalog());
  EXPECT_TRUE(g.QueueAbility("Lee", "Late Doctor", {"Alice"}).ok());
  EXPECT_TRUE(g.QueueAbility("Eve", "Mafia Factional Kill", {"Alice"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_FALSE(g.IsAlive(0));
  EXPECT_THAT(g.player(0).death_causes, ElementsAre("Mafia Factional Kill"));
  const ResolutionRecord* late = FindRecord(g, "Late Doctor");
  EXPECT_EQ(late->outcome(), FIZZLED);
  EXPECT_EQ(late->detail(), "target is dead");
  // Resolution order, not queue order.
  EXPECT_EQ(g.resolution_log()[0].ability(), "Mafia Factional Kill");
}

TEST(Resolver, CategoryOrderBreaksPriorityTies) {
  const vector<Seat> seats = With({{"Dan", "Doctor", "Town"},
                                   {"Quinn", "Quick Killer", "Town"}});
  GameState protective_first = MakeGame(seats, Time::Night(1), TestCatalog());
  EXPECT_TRUE(protective_first.QueueAbility("Quinn", "Quick Kill", {"Eve"})
                  .ok());
  EXPECT_TRUE(protective_first.QueueAbility("Dan", "Doctor", {"Eve"}).ok());
  EXPECT_TRUE(protective_first.Resolve().ok());
  EXPECT_TRUE(protective_first.IsAlive(3));

  GameSetup setup = MakeSetup(seats, Time::Night(1));
  for (EffectCategory c : {OFFENSIVE, PROTECTIVE, INFORMATIONAL, CLEANUP}) {
    setup.mutable_options()->add_category_order(c);
  }
  absl::StatusOr<GameState> offensive_first =
      GameState::Create(TestCatalog(), setup);
  ASSERT_TRUE(offensive_first.ok());
  EXPECT_TRUE(offensive_first->QueueAbility("Quinn", "Quick Kill", {"Eve"})
                  .ok());
  EXPECT_TRUE(offensive_first->QueueAbility("Dan", "Doctor", {"Eve"}).ok());
  EXPECT_TRUE(offensive_first->Resolve().ok());
  EXPECT_FALSE(offensive_first->IsAlive(3));
}

TEST(Resolver, InsertionOrderBreaksRemainingTies) {
  GameState g = MakeGame(With({{"Cole", "Cop", "Town"},
                               {"Dirk", "Cop", "Town"}}), Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Dirk", "Cop", {"Eve"}).ok());
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Mal"}).ok());
  EXPECT_TRUE(g.QueueAbility("Dirk", "Cop", {"Bob"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  ASSERT_EQ(g.resolution_log().size(), 2);
  EXPECT_EQ(g.resolution_log()[0].user(), "Cole");
  EXPECT_EQ(g.resolution_log()[1].user(), "Dirk");
  EXPECT_THAT(g.resolution_log()[1].targets(), ElementsAre("Bob"));
}

TEST(Resolver, RoleblockFizzlesLaterAbilities) {
  GameState g = MakeGame(With({{"Rob", "Roleblocker", "Town"},
                               {"Vic", "Vigilante", "Town"},
                               {"Cole", "Cop", "Town"}}), Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Vic", "Vigilante", {"Eve"}).ok());
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Mal"}).ok());
  EXPECT_TRUE(g.QueueAbility("Rob", "Roleblocker", {"Vic"}).ok());
  EXPECT_TRUE(g.QueueAbility("Eve", "Mafia Factional Kill", {"Rob"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  const ResolutionRecord* vig = FindRecord(g, "Vigilante");
  EXPECT_EQ(vig->outcome(), FIZZLED);
  EXPECT_EQ(vig->detail(), "roleblocked");
  EXPECT_TRUE(g.IsAlive(3));
  EXPECT_EQ(FindRecord(g, "Roleblocker")->outcome(), SUCCESS);
  // The roleblocker dies after blocking.
  EXPECT_FALSE(g.IsAlive(5));
  EXPECT_EQ(FindRecord(g, "Cop")->outcome(), SUCCESS);
}

TEST(Resolver, RoleblockedInvestigatorIsTold) {
  GameState g = MakeGame(With({{"Rob", "Roleblocker", "Town"},
                               {"Cole", "Cop", "Town"}}), Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Eve"}).ok());
  EXPECT_TRUE(g.QueueAbility("Rob", "Roleblocker", {"Cole"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_FALSE(g.Knows(6, 3).has_value());
  EXPECT_THAT(Messages(g, "private:Cole"),
              ElementsAre("Your ability failed, and you did not receive a "
                          "result."));
}

TEST(Resolver, RoleblockWithoutAbilitiesFails) {
  GameState g = MakeGame(With({{"Rob", "Roleblocker", "Town"}}),
                         Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Rob", "Roleblocker", {"Alice"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_EQ(FindRecord(g, "Roleblocker")->outcome(), FAILURE);
}

TEST(Resolver, JailProtectsAndBlocks) {
  GameState g = MakeGame(With({{"Jay", "Jailkeeper", "Town"},
                               {"Cole", "Cop", "Town"}}), Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Eve"}).ok());
  EXPECT_TRUE(g.QueueAbility("Eve", "Mafia Factional Kill", {"Cole"}).ok());
  EXPECT_TRUE(g.QueueAbility("Jay", "Jailkeeper", {"Cole"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(g.IsAlive(6));
  EXPECT_EQ(FindRecord(g, "Cop")->outcome(), FIZZLED);
  EXPECT_EQ(FindRecord(g, "Mafia Factional Kill")->outcome(), BLOCKED);
}

TEST(Resolver, BusDriverRedirects) {
  GameState g = MakeGame(With({{"Bea", "Bus Driver", "Town"}}),
                         Time::Night(1));
  EXPECT_EQ(ErrorCodeOf(g.QueueAbility("Bea", "Bus Driver", {"Alice"})),
            INVALID_TARGET_COUNT);
  EXPECT_EQ(ErrorCodeOf(g.QueueAbility("Bea", "Bus Driver",
                                       {"Alice", "Alice"})),
            INVALID_TARGET);
  EXPECT_TRUE(g.QueueAbility("Eve", "Mafia Factional Kill", {"Alice"}).ok());
  EXPECT_TRUE(g.QueueAbility("Bea", "Bus Driver", {"Bob", "Alice"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(g.IsAlive(0));
  EXPECT_FALSE(g.IsAlive(1));
  EXPECT_THAT(FindRecord(g, "Mafia Factional Kill")->targets(),
              ElementsAre("Bob"));
}

TEST(Resolver, TrackerAndWatcher) {
  GameState g = MakeGame(With({{"Tom", "Tracker", "Town"},
                               {"Wes", "Watcher", "Town"}}), Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Tom", "Tracker", {"Eve"}).ok());
  EXPECT_TRUE(g.QueueAbility("Wes", "Watcher", {"Alice"}).ok());
  EXPECT_TRUE(g.QueueAbility("Eve", "Mafia Factional Kill", {"Alice"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_THAT(Messages(g, "private:Tom"), ElementsAre("Eve targeted Alice!"));
  EXPECT_THAT(Messages(g, "private:Wes"),
              ElementsAre("Alice was targeted by Eve."));
}

TEST(Resolver, NothingToSee) {
  GameState g = MakeGame(With({{"Tom", "Tracker", "Town"},
                               {"Wes", "Watcher", "Town"}}), Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Tom", "Tracker", {"Bob"}).ok());
  EXPECT_TRUE(g.QueueAbility("Wes", "Watcher", {"Carol"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_THAT(Messages(g, "private:Tom"),
              ElementsAre("Bob did not target anyone."));
  EXPECT_THAT(Messages(g, "private:Wes"),
              ElementsAre("Carol was not targeted by anyone."));
}

TEST(Resolver, UnstoppableIgnoresProtectionAndRoleblocks) {
  GameState g = MakeGame(With({{"Dan", "Doctor", "Town"},
                               {"Ray", "Roleblocker", "Town"},
                               {"Ash", "Assassin", "Serial Killer"}}),
                         Time::Night(1), TestCatalog());
  EXPECT_TRUE(g.QueueAbility("Ray", "Roleblocker", {"Ash"}).ok());
  EXPECT_TRUE(g.QueueAbility("Dan", "Doctor", {"Alice"}).ok());
  EXPECT_TRUE(g.QueueAbility("Ash", "Assassinate", {"Alice"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_FALSE(g.IsAlive(0));
  EXPECT_THAT(g.player(0).death_causes, ElementsAre("Assassinate"));
  EXPECT_EQ(FindRecord(g, "Assassinate")->outcome(), SUCCESS);
  const ResolutionRecord* block = FindRecord(g, "Roleblocker");
  EXPECT_EQ(block->outcome(), FAILURE);
  EXPECT_EQ(block->detail(), "blocked 0");
}

TEST(Resolver, HiddenVisitsAreNotSeen) {
  GameState g = MakeGame(With({{"Tom", "Tracker", "Town"},
                               {"Wes", "Watcher", "Town"},
                               {"Nia", "Ninja", "Serial Killer"}}),
                         Time::Night(1), TestCatalog());
  EXPECT_TRUE(g.QueueAbility("Tom", "Tracker", {"Nia"}).ok());
  EXPECT_TRUE(g.QueueAbility("Wes", "Watcher", {"Alice"}).ok());
  EXPECT_TRUE(g.QueueAbility("Nia", "Sneak Kill", {"Alice"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_FALSE(g.IsAlive(0));
  EXPECT_THAT(Messages(g, "private:Tom"),
              ElementsAre("Nia did not target anyone."));
  EXPECT_THAT(Messages(g, "private:Wes"),
              ElementsAre("Alice was not targeted by anyone."));
}

TEST(Resolver, RoleInvestigations) {
  GameState g = MakeGame(With({{"Rita", "Rolecop", "Town"},
                               {"Val", "Vanilla Cop", "Town"},
                               {"Finn", "Friendly Neighbor", "Town"}}),
                         Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Rita", "Rolecop", {"Finn"}).ok());
  EXPECT_TRUE(g.QueueAbility("Val", "Vanilla Cop", {"Eve"}).ok());
  EXPECT_TRUE(g.QueueAbility("Finn", "Friendly Neighbor", {"Bob"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_THAT(Messages(g, "private:Rita"),
              ElementsAre("Finn is a Friendly Neighbor."));
  EXPECT_EQ(g.Knows(5, 7)->role, "Friendly Neighbor");
  EXPECT_THAT(Messages(g, "private:Val"), ElementsAre("Eve is Vanilla."));
  EXPECT_THAT(Messages(g, "private:Bob"),
              ElementsAre("Finn is aligned with the Town!"));
  EXPECT_EQ(g.Knows(1, 7)->alignment, "Town");
}

TEST(Resolver, DeadUsersFizzle) {
  GameState g = MakeGame(With({{"Vic", "Vigilante", "Town"}}),
                         Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Vic", "Vigilante", {"Eve"}).ok());
  EXPECT_TRUE(g.QueueAbility("Eve", "Mafia Factional Kill", {"Vic"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_FALSE(g.IsAlive(3));
  EXPECT_TRUE(g.IsAlive(5));
  const ResolutionRecord* kill = FindRecord(g, "Mafia Factional Kill");
  EXPECT_EQ(kill->outcome(), FIZZLED);
  EXPECT_EQ(kill->detail(), "user is dead");
}

TEST(Resolver, Deterministic) {
  GameState g = MakeGame(With({{"Dan", "Doctor", "Town"},
                               {"Rob", "Roleblocker", "Town"},
                               {"Bea", "Bus Driver", "Town"}}),
                         Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Eve", "Mafia Factional Kill", {"Alice"}).ok());
  EXPECT_TRUE(g.QueueAbility("Dan", "Doctor", {"Bob"}).ok());
  EXPECT_TRUE(g.QueueAbility("Rob", "Roleblocker", {"Dan"}).ok());
  EXPECT_TRUE(g.QueueAbility("Bea", "Bus Driver", {"Alice", "Carol"}).ok());
  GameState copy = g;
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(copy.Resolve().ok());
  ASSERT_EQ(g.resolution_log().size(), copy.resolution_log().size());
  for (int i = 0; i < g.resolution_log().size(); ++i) {
    EXPECT_EQ(g.resolution_log()[i].DebugString(),
              copy.resolution_log()[i].DebugString());
  }
  EXPECT_EQ(g.Overview(ModeratorViewer()).DebugString(),
            copy.Overview(ModeratorViewer()).DebugString());
  EXPECT_FALSE(g.IsAlive(2));
}
}  // namespace
}  // namespace mafia
