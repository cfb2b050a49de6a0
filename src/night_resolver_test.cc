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

#include "src/night_resolver.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/roles.h"

namespace mafia {
namespace {

using testing::ElementsAre;
using testing::IsEmpty;

ResolvedNightActions Resolve(absl::Span<const NightAction> actions,
                             const unordered_map<string, Role>& roles) {
  vector<string> alive;
  for (const auto& [name, role] : roles) {
    alive.push_back(name);
  }
  return ResolveNightActions(actions, roles, alive);
}

TEST(NightResolver, EmptyNight) {
  const auto r = Resolve({}, {{"A", VILLAGER}, {"M", MAFIA}});
  EXPECT_THAT(r.blocked_players, IsEmpty());
  EXPECT_THAT(r.saved_players, IsEmpty());
  EXPECT_THAT(r.kills, IsEmpty());
  EXPECT_THAT(r.deaths, IsEmpty());
  EXPECT_THAT(r.investigations, IsEmpty());
  EXPECT_THAT(r.tracker_results, IsEmpty());
  EXPECT_THAT(r.bomb_retaliations, IsEmpty());
  EXPECT_THAT(r.death_reveal_overrides, IsEmpty());
}

TEST(NightResolver, BlockedDoctorCannotSave) {
  const auto r = Resolve(
      {NewBlock("Alice", "Bob"), NewSave("Bob", "Dave"),
       NewMafiaKill("Carol", "Dave")},
      {{"Alice", ROLEBLOCKER}, {"Bob", DOCTOR}, {"Carol", MAFIA},
       {"Dave", VILLAGER}});
  EXPECT_THAT(r.blocked_players, ElementsAre("Bob"));
  EXPECT_THAT(r.saved_players, IsEmpty());
  EXPECT_THAT(r.deaths, ElementsAre("Dave"));
  ASSERT_EQ(r.kills.size(), 1u);
  EXPECT_FALSE(r.kills[0].blocked);
  EXPECT_FALSE(r.kills[0].saved);
}

TEST(NightResolver, SaveStopsEveryKill) {
  const auto r = Resolve(
      {NewSave("Doc", "Town"), NewMafiaKill("Maf", "Town"),
       NewVigilanteKill("Vig", "Town")},
      {{"Doc", DOCTOR}, {"Maf", MAFIA}, {"Vig", VIGILANTE},
       {"Town", VILLAGER}});
  EXPECT_THAT(r.saved_players, ElementsAre("Town"));
  EXPECT_THAT(r.deaths, IsEmpty());
  ASSERT_EQ(r.kills.size(), 2u);
  EXPECT_TRUE(r.kills[0].saved);
  EXPECT_EQ(r.kills[0].source, MAFIA_KILL);
  EXPECT_TRUE(r.kills[1].saved);
  EXPECT_EQ(r.kills[1].source, VIGILANTE_KILL);
}

TEST(NightResolver, InvestigationResults) {
  const unordered_map<string, Role> roles = {
      {"Cop", COP}, {"Cop2", COP}, {"Maf", MAFIA}, {"GF", GODFATHER},
      {"Town", VILLAGER}};
  auto r = Resolve({NewInvestigate("Cop", "Maf"),
                    NewInvestigate("Cop2", "GF")}, roles);
  ASSERT_EQ(r.investigations.size(), 2u);
  EXPECT_EQ(r.investigations[0].target, "Maf");
  EXPECT_EQ(r.investigations[0].result, READS_MAFIA);
  EXPECT_EQ(r.investigations[1].target, "GF");
  EXPECT_EQ(r.investigations[1].result, READS_INNOCENT);

  r = Resolve({NewInvestigate("Cop", "Town")}, roles);
  ASSERT_EQ(r.investigations.size(), 1u);
  EXPECT_EQ(r.investigations[0].result, READS_INNOCENT);
}

TEST(NightResolver, FrameOverridesGodfatherImmunity) {
  const auto r = Resolve(
      {NewFrame("Framer", "GF"), NewInvestigate("Cop", "GF")},
      {{"Cop", COP}, {"Framer", FRAMER}, {"GF", GODFATHER},
       {"Town", VILLAGER}});
  ASSERT_EQ(r.investigations.size(), 1u);
  EXPECT_EQ(r.investigations[0].result, READS_MAFIA);
}

TEST(NightResolver, BlockedFramerHasNoEffect) {
  const auto r = Resolve(
      {NewBlock("RB", "Framer"), NewFrame("Framer", "Town"),
       NewInvestigate("Cop", "Town")},
      {{"Cop", COP}, {"RB", ROLEBLOCKER}, {"Framer", FRAMER},
       {"Town", VILLAGER}});
  ASSERT_EQ(r.investigations.size(), 1u);
  EXPECT_EQ(r.investigations[0].result, READS_INNOCENT);
}

TEST(NightResolver, UnknownRoleReadsInnocent) {
  const auto r = ResolveNightActions(
      {NewInvestigate("Cop", "Stranger")}, {{"Cop", COP}}, {"Cop"});
  ASSERT_EQ(r.investigations.size(), 1u);
  EXPECT_EQ(r.investigations[0].result, READS_INNOCENT);
}

TEST(NightResolver, BombTakesAttackerDown) {
  const auto r = Resolve(
      {NewMafiaKill("Maf", "Bomb")},
      {{"Bomb", BOMB}, {"Maf", MAFIA}, {"Town", VILLAGER}});
  EXPECT_THAT(r.deaths, ElementsAre("Bomb", "Maf"));
  EXPECT_THAT(r.bomb_retaliations, ElementsAre("Maf"));
}

TEST(NightResolver, SavedBombDoesNotRetaliate) {
  const auto r = Resolve(
      {NewSave("Doc", "Bomb"), NewMafiaKill("Maf", "Bomb")},
      {{"Bomb", BOMB}, {"Doc", DOCTOR}, {"Maf", MAFIA}, {"Town", VILLAGER}});
  EXPECT_THAT(r.deaths, IsEmpty());
  EXPECT_THAT(r.bomb_retaliations, IsEmpty());
}

TEST(NightResolver, ProtectedAttackerSurvivesBomb) {
  const auto r = Resolve(
      {NewSave("Doc", "Vig"), NewVigilanteKill("Vig", "Bomb")},
      {{"Bomb", BOMB}, {"Doc", DOCTOR}, {"Vig", VIGILANTE},
       {"Maf", MAFIA}});
  EXPECT_THAT(r.deaths, ElementsAre("Bomb"));
  EXPECT_THAT(r.bomb_retaliations, IsEmpty());
}

TEST(NightResolver, BombRetaliatesAgainstFirstAttackerOnly) {
  const auto r = Resolve(
      {NewMafiaKill("Maf", "Bomb"), NewVigilanteKill("Vig", "Bomb")},
      {{"Bomb", BOMB}, {"Maf", MAFIA}, {"Vig", VIGILANTE},
       {"Town", VILLAGER}});
  EXPECT_THAT(r.deaths, ElementsAre("Bomb", "Maf"));
  EXPECT_THAT(r.bomb_retaliations, ElementsAre("Maf"));
}

TEST(NightResolver, MafiaAlignedNeverDies) {
  const auto r = Resolve(
      {NewMafiaKill("Maf2", "Maf1")},
      {{"Maf1", MAFIA}, {"Maf2", MAFIA}, {"Town", VILLAGER}});
  EXPECT_THAT(r.deaths, IsEmpty());
  ASSERT_EQ(r.kills.size(), 1u);
  EXPECT_FALSE(r.kills[0].blocked);
  EXPECT_FALSE(r.kills[0].saved);
}

TEST(NightResolver, VigilanteCannotKillMafiaAligned) {
  const auto r = Resolve(
      {NewVigilanteKill("Vig", "Janitor")},
      {{"Vig", VIGILANTE}, {"Janitor", JANITOR}, {"Town", VILLAGER}});
  EXPECT_THAT(r.deaths, IsEmpty());
}

TEST(NightResolver, SimultaneousKillersOneDeath) {
  const auto r = Resolve(
      {NewMafiaKill("Maf", "Town"), NewVigilanteKill("Vig", "Town")},
      {{"Maf", MAFIA}, {"Vig", VIGILANTE}, {"Town", VILLAGER}});
  EXPECT_EQ(r.kills.size(), 2u);
  EXPECT_THAT(r.deaths, ElementsAre("Town"));
}

TEST(NightResolver, JailBlocksAndProtects) {
  const auto r = Resolve(
      {NewJail("JK", "Maf"), NewMafiaKill("Maf", "Town"),
       NewJail("JK2", "Cop"), NewInvestigate("Cop", "Maf"),
       NewVigilanteKill("Vig", "Cop")},
      {{"JK", JAILKEEPER}, {"JK2", JAILKEEPER}, {"Maf", MAFIA},
       {"Cop", COP}, {"Vig", VIGILANTE}, {"Town", VILLAGER}});
  EXPECT_THAT(r.blocked_players, ElementsAre("Cop", "Maf"));
  EXPECT_THAT(r.saved_players, ElementsAre("Cop", "Maf"));
  EXPECT_THAT(r.investigations, IsEmpty());
  ASSERT_EQ(r.kills.size(), 2u);
  EXPECT_TRUE(r.kills[0].blocked);
  EXPECT_FALSE(r.kills[0].saved);
  EXPECT_FALSE(r.kills[1].blocked);
  EXPECT_TRUE(r.kills[1].saved);
  EXPECT_THAT(r.deaths, IsEmpty());
}

TEST(NightResolver, BlockChainOnlyFirstLinkApplies) {
  const auto r = Resolve(
      {NewBlock("A", "B"), NewBlock("B", "C"), NewInvestigate("C", "M")},
      {{"A", ROLEBLOCKER}, {"B", ROLEBLOCKER}, {"C", COP}, {"M", MAFIA}});
  EXPECT_THAT(r.blocked_players, ElementsAre("B"));
  ASSERT_EQ(r.investigations.size(), 1u);
  EXPECT_EQ(r.investigations[0].result, READS_MAFIA);
}

TEST(NightResolver, BlockCycleBlocksEveryone) {
  const auto r = Resolve(
      {NewBlock("A", "B"), NewBlock("B", "A"), NewBlock("C", "A"),
       NewInvestigate("D", "M")},
      {{"A", ROLEBLOCKER}, {"B", MAFIA_ROLEBLOCKER}, {"C", ROLEBLOCKER},
       {"D", COP}, {"M", MAFIA}});
  // C is free, so A is blocked, which frees B.
  EXPECT_THAT(r.blocked_players, ElementsAre("A"));
  ASSERT_EQ(r.investigations.size(), 1u);

  const auto cycle = Resolve(
      {NewBlock("A", "B"), NewBlock("B", "A"), NewSave("Doc", "T")},
      {{"A", ROLEBLOCKER}, {"B", MAFIA_ROLEBLOCKER}, {"Doc", DOCTOR},
       {"T", VILLAGER}});
  EXPECT_THAT(cycle.blocked_players, ElementsAre("A", "B"));
  EXPECT_THAT(cycle.saved_players, ElementsAre("T"));
}

TEST(NightResolver, BlockedActorsProduceNothing) {
  const auto r = Resolve(
      {NewJail("JK", "Cop"), NewJail("JK", "Doc"), NewJail("JK", "Tr"),
       NewJail("JK", "Jan"), NewJail("JK", "Forger"),
       NewInvestigate("Cop", "Maf"), NewSave("Doc", "Town"),
       NewTrack("Tr", "Maf"), NewMafiaKill("Maf", "Town"),
       NewClean("Jan", "Town"), NewForge("Forger", "Town", COP)},
      {{"JK", JAILKEEPER}, {"Cop", COP}, {"Doc", DOCTOR}, {"Tr", TRACKER},
       {"Jan", JANITOR}, {"Forger", FORGER}, {"Maf", MAFIA},
       {"Town", VILLAGER}});
  EXPECT_THAT(r.investigations, IsEmpty());
  EXPECT_THAT(r.tracker_results, IsEmpty());
  EXPECT_THAT(r.saved_players,
              ElementsAre("Cop", "Doc", "Forger", "Jan", "Tr"));
  EXPECT_THAT(r.deaths, ElementsAre("Town"));
  EXPECT_THAT(r.death_reveal_overrides, IsEmpty());
}

TEST(NightResolver, TrackerSeesLiveVisit) {
  const auto r = Resolve(
      {NewTrack("Tr", "Maf"), NewMafiaKill("Maf", "Town")},
      {{"Tr", TRACKER}, {"Maf", MAFIA}, {"Town", VILLAGER}});
  ASSERT_EQ(r.tracker_results.size(), 1u);
  EXPECT_EQ(r.tracker_results[0].target, "Maf");
  EXPECT_EQ(r.tracker_results[0].visited, "Town");
}

TEST(NightResolver, TrackerCannotTellBlockedFromHome) {
  const unordered_map<string, Role> roles = {
      {"Tr", TRACKER}, {"RB", ROLEBLOCKER}, {"Maf", MAFIA},
      {"Town", VILLAGER}};
  auto r = Resolve({NewBlock("RB", "Maf"), NewTrack("Tr", "Maf"),
                    NewMafiaKill("Maf", "Town")}, roles);
  ASSERT_EQ(r.tracker_results.size(), 1u);
  EXPECT_EQ(r.tracker_results[0].visited, std::nullopt);

  r = Resolve({NewTrack("Tr", "Town")}, roles);
  ASSERT_EQ(r.tracker_results.size(), 1u);
  EXPECT_EQ(r.tracker_results[0].visited, std::nullopt);
}

TEST(NightResolver, ForgeBeatsClean) {
  const auto r = Resolve(
      {NewClean("Jan", "Town"), NewForge("Forger", "Town", DOCTOR),
       NewMafiaKill("Maf", "Town"), NewClean("Jan2", "Cop"),
       NewVigilanteKill("Vig", "Cop")},
      {{"Jan", JANITOR}, {"Jan2", JANITOR}, {"Forger", FORGER},
       {"Maf", MAFIA}, {"Vig", VIGILANTE}, {"Town", VILLAGER},
       {"Cop", COP}});
  EXPECT_THAT(r.deaths, ElementsAre("Cop", "Town"));
  ASSERT_EQ(r.death_reveal_overrides.size(), 2u);
  const DeathRevealOverride* town = r.FindOverride("Town");
  ASSERT_NE(town, nullptr);
  EXPECT_EQ(town->revealed_role, DOCTOR);
  const DeathRevealOverride* cop = r.FindOverride("Cop");
  ASSERT_NE(cop, nullptr);
  EXPECT_EQ(cop->revealed_role, std::nullopt);
}

TEST(NightResolver, NoOverrideForSurvivors) {
  const auto r = Resolve(
      {NewSave("Doc", "Town"), NewClean("Jan", "Town"),
       NewMafiaKill("Maf", "Town")},
      {{"Doc", DOCTOR}, {"Jan", JANITOR}, {"Maf", MAFIA},
       {"Town", VILLAGER}});
  EXPECT_THAT(r.deaths, IsEmpty());
  EXPECT_THAT(r.death_reveal_overrides, IsEmpty());
  EXPECT_EQ(r.FindOverride("Town"), nullptr);
}

TEST(NightResolver, DeathsComeOnlyFromSuccessfulKills) {
  const unordered_map<string, Role> roles = {
      {"RB", ROLEBLOCKER}, {"Doc", DOCTOR}, {"Maf", MAFIA}, {"GF", GODFATHER},
      {"Vig", VIGILANTE}, {"A", VILLAGER}, {"B", VILLAGER}, {"C", BOMB}};
  const auto r = Resolve(
      {NewBlock("RB", "Maf"), NewSave("Doc", "A"),
       NewMafiaKill("Maf", "B"), NewMafiaKill("GF", "A"),
       NewVigilanteKill("Vig", "GF")}, roles);
  set<string> successful;
  for (const ResolvedKill& k : r.kills) {
    if (!k.blocked && !k.saved && !IsMafiaAligned(roles.at(k.target))) {
      successful.insert(k.target);
    }
  }
  EXPECT_EQ(r.deaths, successful);
  EXPECT_THAT(r.deaths, IsEmpty());
}

}  // namespace
}  // namespace mafia
