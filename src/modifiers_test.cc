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

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/errors.h"
#include "src/game_state.h"
#include "src/test_util.h"

namespace mafia {
namespace {

using testing::ElementsAre;
using testing::IsEmpty;

vector<Seat> Seats(const Seat& modified) {
  return {modified,
          {"Alice", "Vanilla", "Town"},
          {"Bob", "Vanilla", "Town"},
          {"Eve", "Vanilla", "Mafia"},
          {"Mal", "Vanilla", "Mafia"}};
}

TEST(Modifiers, Names) {
  EXPECT_EQ(XShot(2).Name(), "2-Shot");
  EXPECT_EQ(NightX({1, 3}).Name(), "Night 1,3");
  GameState g = MakeGame(Seats({"Vic", "Vigilante", "Town",
                                {XShotMod(1), Mod("Weak")}}),
                         Time::Night(1));
  EXPECT_EQ(g.RoleName(0), "1-Shot Weak Town Vigilante");
}

TEST(Modifiers, XShotLimitsUses) {
  GameState g = MakeGame(Seats({"Vic", "Vigilante", "Town", {XShotMod(1)}}),
                         Time::Night(1));
  absl::StatusOr<AbilityListing> listing = g.ListAbilities("Vic");
  ASSERT_TRUE(listing.ok());
  EXPECT_EQ(listing->actions(0).max_uses(), 1);
  EXPECT_TRUE(g.QueueAbility("Vic", "Vigilante", {"Eve"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_FALSE(g.IsAlive(3));
  EXPECT_TRUE(g.SetTime(Time::Night(2)).ok());
  EXPECT_EQ(ErrorCodeOf(g.QueueAbility("Vic", "Vigilante", {"Mal"})),
            INELIGIBLE_NOW);
  listing = g.ListAbilities("Vic");
  ASSERT_TRUE(listing.ok());
  EXPECT_FALSE(listing->actions(0).eligible());
  EXPECT_EQ(listing->actions(0).uses(), 1);
}

TEST(Modifiers, NightXOnlyOnListedNights) {
  GameState g = MakeGame(Seats({"Cole", "Cop", "Town", {NightsMod({2})}}),
                         Time::Night(1));
  EXPECT_EQ(ErrorCodeOf(g.QueueAbility("Cole", "Cop", {"Eve"})),
            INELIGIBLE_NOW);
  EXPECT_TRUE(g.SetTime(Time::Night(2)).ok());
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Eve"}).ok());
}

TEST(Modifiers, NonConsecutiveNight) {
  GameState g = MakeGame(
      Seats({"Cole", "Cop", "Town", {Mod("Non-Consecutive Night")}}),
      Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Eve"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(g.SetTime(Time::Night(2)).ok());
  EXPECT_EQ(ErrorCodeOf(g.QueueAbility("Cole", "Cop", {"Mal"})),
            INELIGIBLE_NOW);
  EXPECT_TRUE(g.SetTime(Time::Night(3)).ok());
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Mal"}).ok());
}

TEST(Modifiers, IndecisiveCannotRepeatTargets) {
  GameState g = MakeGame(Seats({"Dan", "Doctor", "Town", {Mod("Indecisive")}}),
                         Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Dan", "Doctor", {"Alice"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(g.SetTime(Time::Night(2)).ok());
  EXPECT_EQ(ErrorCodeOf(g.QueueAbility("Dan", "Doctor", {"Alice"})),
            INELIGIBLE_NOW);
  absl::StatusOr<AbilityListing> listing = g.ListAbilities("Dan");
  ASSERT_TRUE(listing.ok());
  EXPECT_THAT(listing->actions(0).valid_targets(),
              ElementsAre("Bob", "Eve", "Mal"));
  EXPECT_TRUE(g.QueueAbility("Dan", "Doctor", {"Bob"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(g.SetTime(Time::Night(4)).ok());
  EXPECT_TRUE(g.QueueAbility("Dan", "Doctor", {"Bob"}).ok());
}

TEST(Modifiers, PersonalTargetsTheUser) {
  GameState g = MakeGame(Seats({"Dan", "Doctor", "Town", {Mod("Personal")}}),
                         Time::Night(1));
  EXPECT_EQ(ErrorCodeOf(g.QueueAbility("Dan", "Doctor", {"Alice"})),
            INVALID_TARGET_COUNT);
  EXPECT_TRUE(g.QueueAbility("Dan", "Doctor", {}).ok());
  EXPECT_TRUE(g.QueueAbility("Eve", "Mafia Factional Kill", {"Dan"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(g.IsAlive(0));
  EXPECT_THAT(FindRecord(g, "Doctor")->targets(), ElementsAre("Dan"));
  EXPECT_EQ(FindRecord(g, "Mafia Factional Kill")->outcome(), BLOCKED);
}

TEST(Modifiers, PersonalRejectsSeveralTargets) {
  absl::StatusOr<GameState> g = GameState::Create(
      DefaultCatalog(),
      MakeSetup(Seats({"Bus", "Bus Driver", "Town", {Mod("Personal")}}),
                Time::Night(1)));
  EXPECT_EQ(g.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_FALSE(Personal().Validate(
      DefaultCatalog()->FindRole("Bus Driver")->actions[0]).ok());
  EXPECT_TRUE(Personal().Validate(
      DefaultCatalog()->FindRole("Jailkeeper")->actions[0]).ok());
}

TEST(Modifiers, ActivatedPassiveMustBeUsed) {
  GameState g = MakeGame(
      Seats({"Bruce", "Bulletproof", "Town", {Mod("Activated")}}),
      Time::Night(1));
  absl::StatusOr<AbilityListing> listing = g.ListAbilities("Bruce");
  ASSERT_TRUE(listing.ok());
  EXPECT_THAT(listing->passives(), IsEmpty());
  ASSERT_EQ(listing->actions_size(), 1);
  EXPECT_TRUE(listing->actions(0).eligible());

  GameState unused = g;
  EXPECT_TRUE(unused.QueueAbility("Eve", "Mafia Factional Kill", {"Bruce"})
                  .ok());
  EXPECT_TRUE(unused.Resolve().ok());
  EXPECT_FALSE(unused.IsAlive(0));

  EXPECT_TRUE(g.QueueAbility("Bruce", "Bulletproof", {}).ok());
  EXPECT_TRUE(g.QueueAbility("Eve", "Mafia Factional Kill", {"Bruce"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(g.IsAlive(0));
}

TEST(Modifiers, LazyFizzlesWithOneNonTownLeft) {
  GameState g = MakeGame(Seats({"Vic", "Vigilante", "Town", {Mod("Lazy")}}),
                         Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Vic", "Vigilante", {"Eve"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_FALSE(g.IsAlive(3));
  EXPECT_TRUE(g.SetTime(Time::Night(2)).ok());
  EXPECT_TRUE(g.QueueAbility("Vic", "Vigilante", {"Mal"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(g.IsAlive(4));
  const ResolutionRecord* r = FindRecord(g, "Vigilante");
  EXPECT_EQ(r->outcome(), FIZZLED);
  EXPECT_EQ(r->detail(), "lazy");
}

TEST(Modifiers, LoyalAndDisloyal) {
  GameState g = MakeGame({{"Cole", "Cop", "Town", {Mod("Loyal")}},
                          {"Dirk", "Cop", "Town", {Mod("Disloyal")}},
                          {"Alice", "Vanilla", "Town"},
                          {"Eve", "Vanilla", "Mafia"}}, Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Eve"}).ok());
  EXPECT_TRUE(g.QueueAbility("Dirk", "Cop", {"Alice"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  ASSERT_EQ(g.resolution_log().size(), 2);
  EXPECT_EQ(g.resolution_log()[0].outcome(), FAILURE);
  EXPECT_EQ(g.resolution_log()[0].detail(), "loyal");
  EXPECT_EQ(g.resolution_log()[1].outcome(), FAILURE);
  EXPECT_EQ(g.resolution_log()[1].detail(), "disloyal");
  EXPECT_FALSE(g.Knows(0, 3).has_value());
  EXPECT_THAT(Messages(g, "private:Cole"), IsEmpty());

  EXPECT_TRUE(g.SetTime(Time::Night(2)).ok());
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Alice"}).ok());
  EXPECT_TRUE(g.QueueAbility("Dirk", "Cop", {"Eve"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_EQ(g.resolution_log()[2].outcome(), SUCCESS);
  EXPECT_EQ(g.resolution_log()[3].outcome(), SUCCESS);
  EXPECT_EQ(g.Knows(1, 3)->alignment, "Mafia");
}

TEST(Modifiers, LastListedModifierIsOutermost) {
  // Weak wraps Loyal: the user dies before Loyal stops the kill.
  GameState weak_outer = MakeGame(
      Seats({"Vic", "Vigilante", "Town", {Mod("Loyal"), Mod("Weak")}}),
      Time::Night(1));
  EXPECT_TRUE(weak_outer.QueueAbility("Vic", "Vigilante", {"Eve"}).ok());
  EXPECT_TRUE(weak_outer.Resolve().ok());
  EXPECT_FALSE(weak_outer.IsAlive(0));
  EXPECT_TRUE(weak_outer.IsAlive(3));
  EXPECT_EQ(FindRecord(weak_outer, "Vigilante")->outcome(), FAILURE);

  // Loyal wraps Weak: the kill is stopped before Weak applies.
  GameState loyal_outer = MakeGame(
      Seats({"Vic", "Vigilante", "Town", {Mod("Weak"), Mod("Loyal")}}),
      Time::Night(1));
  EXPECT_TRUE(loyal_outer.QueueAbility("Vic", "Vigilante", {"Eve"}).ok());
  EXPECT_TRUE(loyal_outer.Resolve().ok());
  EXPECT_TRUE(loyal_outer.IsAlive(0));
  EXPECT_TRUE(loyal_outer.IsAlive(3));
}

TEST(Modifiers, WeakOnlyHurtsWhenTargetingNonTown) {
  GameState g = MakeGame(Seats({"Cole", "Cop", "Town", {Mod("Weak")}}),
                         Time::Night(1));
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Alice"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_TRUE(g.IsAlive(0));
  EXPECT_TRUE(g.SetTime(Time::Night(2)).ok());
  EXPECT_TRUE(g.QueueAbility("Cole", "Cop", {"Eve"}).ok());
  EXPECT_TRUE(g.Resolve().ok());
  EXPECT_FALSE(g.IsAlive(0));
  // The investigation still completes.
  EXPECT_EQ(g.Knows(0, 3)->alignment, "Mafia");
}
}  // namespace
}  // namespace mafia
