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

#include "src/roles.h"

#include <algorithm>
#include <iterator>

#include "absl/strings/ascii.h"

namespace mafia {

const RoleMetadata& GetRoleMetadata(Role role) {
  if (!Role_IsValid(role)) {
    return kRoleMetadata[ROLE_UNSPECIFIED];
  }
  return kRoleMetadata[role];
}

Team TeamOf(Role role) {
  const Team team = GetRoleMetadata(role).team;
  return team == TEAM_UNSPECIFIED ? TEAM_TOWN : team;
}

bool IsMafiaAligned(Role role) {
  return GetRoleMetadata(role).team == TEAM_MAFIA;
}

bool IsTownAligned(Role role) {
  return TeamOf(role) == TEAM_TOWN;
}

bool AppearsMafiaToInvestigation(Role role) {
  return GetRoleMetadata(role).appears_mafia;
}

bool CanSelfTarget(Role role) {
  return GetRoleMetadata(role).can_self_target;
}

bool IsForgeableRole(Role role) {
  return GetRoleMetadata(role).forgeable;
}

vector<Role> ForgeableRoles() {
  vector<Role> r;
  std::copy_if(std::begin(kAllRoles), std::end(kAllRoles),
               std::back_inserter(r), IsForgeableRole);
  return r;
}

string RoleName(Role role) {
  if (!Role_IsValid(role) || role == ROLE_UNSPECIFIED) {
    return "unknown";
  }
  return absl::AsciiStrToLower(Role_Name(role));
}

Role RoleFromName(const string& name) {
  Role role = ROLE_UNSPECIFIED;
  if (!Role_Parse(absl::AsciiStrToUpper(name), &role)) {
    return ROLE_UNSPECIFIED;
  }
  return role;
}

string TeamName(Team team) {
  switch (team) {
    case TEAM_TOWN:
      return "villagers";
    case TEAM_MAFIA:
      return "mafia";
    case TEAM_NEUTRAL:
      return "neutral";
    default:
      return "nobody";
  }
}

}  // namespace mafia
