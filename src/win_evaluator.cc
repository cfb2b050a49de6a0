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

#include "src/win_evaluator.h"

#include <algorithm>
#include <map>

#include "src/roles.h"

namespace mafia {

Team CheckWinner(absl::Span<const Role> alive_roles) {
  const int num_mafia = std::count_if(
      alive_roles.begin(), alive_roles.end(), IsMafiaAligned);
  const int num_others = alive_roles.size() - num_mafia;
  if (num_mafia == 0) {
    return TEAM_TOWN;
  }
  if (num_mafia >= num_others) {
    return TEAM_MAFIA;
  }
  return TEAM_UNSPECIFIED;
}

vector<NeutralWin> NeutralWinnersOnElimination(
    const string& eliminated, Role eliminated_role,
    const unordered_map<string, string>& executioner_targets,
    absl::Span<const string> alive) {
  vector<NeutralWin> winners;
  if (eliminated_role == JESTER) {
    winners.push_back({.player = eliminated, .role = JESTER});
  }
  // Sorted, so that the outcome does not depend on hash order.
  const std::map<string, string> targets(executioner_targets.begin(),
                                         executioner_targets.end());
  for (const auto& [executioner, target] : targets) {
    if (target != eliminated) {
      continue;
    }
    if (std::find(alive.begin(), alive.end(), executioner) == alive.end()) {
      continue;
    }
    winners.push_back({.player = executioner, .role = EXECUTIONER});
  }
  return winners;
}

}  // namespace mafia
