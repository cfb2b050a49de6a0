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

#ifndef SRC_ROLES_H_
#define SRC_ROLES_H_

#include <string>
#include <vector>

#include "src/game_log.pb.h"

namespace mafia {

using std::string;
using std::vector;

// Describes a supported role. This is the only place that decides team
// membership; everything else asks the functions below.
struct RoleMetadata {
  Team team = TEAM_UNSPECIFIED;
  bool appears_mafia = false;  // What an unframed investigation reads.
  ActionKind night_action = ACTION_KIND_UNSPECIFIED;
  bool can_self_target = false;
  bool forgeable = false;  // A forger may reveal a victim as this role.
};

const RoleMetadata kRoleMetadata[] = {
  {},  // ROLE_UNSPECIFIED
  // VILLAGER
  {.team = TEAM_TOWN, .forgeable = true},
  // COP
  {.team = TEAM_TOWN, .night_action = INVESTIGATE, .forgeable = true},
  // DOCTOR
  {.team = TEAM_TOWN, .night_action = SAVE, .can_self_target = true,
   .forgeable = true},
  // VIGILANTE
  {.team = TEAM_TOWN, .night_action = KILL, .forgeable = true},
  // ROLEBLOCKER
  {.team = TEAM_TOWN, .night_action = BLOCK, .forgeable = true},
  // MAFIA
  {.team = TEAM_MAFIA, .appears_mafia = true, .night_action = KILL},
  // GODFATHER: investigation immune.
  {.team = TEAM_MAFIA, .night_action = KILL},
  // MAFIA_ROLEBLOCKER
  {.team = TEAM_MAFIA, .appears_mafia = true, .night_action = BLOCK},
  // TRACKER
  {.team = TEAM_TOWN, .night_action = TRACK, .forgeable = true},
  // JAILKEEPER
  {.team = TEAM_TOWN, .night_action = JAIL, .forgeable = true},
  // MASON
  {.team = TEAM_TOWN, .forgeable = true},
  // BOMB
  {.team = TEAM_TOWN, .forgeable = true},
  // FRAMER
  {.team = TEAM_MAFIA, .appears_mafia = true, .night_action = FRAME},
  // JANITOR
  {.team = TEAM_MAFIA, .appears_mafia = true, .night_action = CLEAN},
  // FORGER
  {.team = TEAM_MAFIA, .appears_mafia = true, .night_action = FORGE},
  // JESTER
  {.team = TEAM_NEUTRAL},
  // EXECUTIONER
  {.team = TEAM_NEUTRAL},
};

static_assert(sizeof(kRoleMetadata) / sizeof(kRoleMetadata[0]) ==
              Role_ARRAYSIZE, "kRoleMetadata must cover every Role");

const Role kAllRoles[] = {
    VILLAGER, COP, DOCTOR, VIGILANTE, ROLEBLOCKER, MAFIA, GODFATHER,
    MAFIA_ROLEBLOCKER, TRACKER, JAILKEEPER, MASON, BOMB, FRAMER, JANITOR,
    FORGER, JESTER, EXECUTIONER
};

// Unknown or unspecified roles are town-aligned and read innocent.
const RoleMetadata& GetRoleMetadata(Role role);
Team TeamOf(Role role);
bool IsMafiaAligned(Role role);
bool IsTownAligned(Role role);
bool AppearsMafiaToInvestigation(Role role);
bool CanSelfTarget(Role role);
bool IsForgeableRole(Role role);
vector<Role> ForgeableRoles();

// Lower case names, e.g. "mafia_roleblocker".
string RoleName(Role role);
// Returns ROLE_UNSPECIFIED on unknown names. Case insensitive.
Role RoleFromName(const string& name);
string TeamName(Team team);

}  // namespace mafia

#endif  // SRC_ROLES_H_
