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

#ifndef SRC_WIN_EVALUATOR_H_
#define SRC_WIN_EVALUATOR_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "absl/types/span.h"
#include "src/game_log.pb.h"

namespace mafia {

using std::string;
using std::unordered_map;
using std::vector;

// Villagers win when no mafia-aligned player is alive; mafia wins once it
// is at least as large as everyone else alive. Returns TEAM_UNSPECIFIED
// while the game goes on.
Team CheckWinner(absl::Span<const Role> alive_roles);

struct NeutralWin {
  string player;
  Role role = ROLE_UNSPECIFIED;
};

// Neutral players who win by the day vote elimination of `eliminated`:
// the eliminated jester, and every living executioner whose target it was.
// Executioners not in `alive` do not win.
vector<NeutralWin> NeutralWinnersOnElimination(
    const string& eliminated, Role eliminated_role,
    const unordered_map<string, string>& executioner_targets,
    absl::Span<const string> alive);

}  // namespace mafia

#endif  // SRC_WIN_EVALUATOR_H_
