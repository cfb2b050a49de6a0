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

#ifndef SRC_ROLE_COLLECTORS_H_
#define SRC_ROLE_COLLECTORS_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "src/agent.h"
#include "src/game_log.pb.h"
#include "src/night_action.h"

namespace mafia {

using std::string;
using std::unordered_map;
using std::vector;

// What the collectors may see of the game. Taken once per night, before the
// collectors start, and never mutated while they run.
struct NightSnapshot {
  int round = 0;
  vector<string> alive;  // In turn order.
  unordered_map<string, Role> roles;  // All players, dead ones included.

  Role RoleOf(const string& player) const;
  // Living holders of the role, in turn order.
  vector<string> HoldersOf(Role role) const;
  vector<string> AliveMafiaTeam() const;
  // Living players that are not mafia-aligned.
  vector<string> AliveNonMafia() const;
};

// Collectors never emit events themselves. Their notices are recorded by the
// engine after the join, in canonical order.
struct CollectorOutput {
  vector<NightAction> intents;
  vector<Event> notices;
};

// Everyone alive, minus the actor unless its role may target itself.
vector<string> ValidTargets(const NightSnapshot& snapshot,
                            const string& actor);

CollectorOutput CollectJailActions(const NightSnapshot& snapshot,
                                   const AgentIo& io);
CollectorOutput CollectBlockActions(const NightSnapshot& snapshot,
                                    const AgentIo& io);
CollectorOutput CollectCopActions(const NightSnapshot& snapshot,
                                  const AgentIo& io);
CollectorOutput CollectDoctorActions(const NightSnapshot& snapshot,
                                     const AgentIo& io);
// Vigilantes may also hold fire by choosing "nobody".
CollectorOutput CollectVigilanteActions(const NightSnapshot& snapshot,
                                        const AgentIo& io);
CollectorOutput CollectTrackerActions(const NightSnapshot& snapshot,
                                      const AgentIo& io);

}  // namespace mafia

#endif  // SRC_ROLE_COLLECTORS_H_
