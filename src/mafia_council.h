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

#ifndef SRC_MAFIA_COUNCIL_H_
#define SRC_MAFIA_COUNCIL_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/agent.h"
#include "src/game_log.pb.h"
#include "src/night_action.h"
#include "src/role_collectors.h"

namespace mafia {

using std::string;
using std::vector;

// Godfather, else plain mafia, else the first member. Empty for no team.
string ChooseMafiaLeader(const NightSnapshot& snapshot,
                         absl::Span<const string> team);

// Discussion rounds the team holds before the leader writes the plan.
int MafiaDiscussionRounds(int team_size);

// Parses the leader's text (a MafiaNightPlan in text format, possibly
// wrapped in other text) without validating any names.
absl::StatusOr<MafiaNightPlan> ParseMafiaNightPlan(const string& text);

// Fails unless the kill target is one of kill_targets. Every other field
// that is not valid is cleared: targets must be in other_targets, and a
// forge also needs a forgeable fake role.
absl::StatusOr<MafiaNightPlan> ValidateMafiaNightPlan(
    const MafiaNightPlan& plan, absl::Span<const string> kill_targets,
    absl::Span<const string> other_targets);

// One intent per capability holder: the kill by the leader, a block per
// mafia roleblocker, a frame per framer, a clean per janitor and a forge per
// forger. The plan must be validated.
vector<NightAction> ExpandMafiaNightPlan(const MafiaNightPlan& plan,
                                         const NightSnapshot& snapshot,
                                         absl::Span<const string> team,
                                         const string& leader);

// Runs the whole council for the night: discussion, the leader's plan, and
// the single kill fallback if the plan is unusable.
CollectorOutput CollectMafiaCouncilIntents(const NightSnapshot& snapshot,
                                           const AgentIo& io);

}  // namespace mafia

#endif  // SRC_MAFIA_COUNCIL_H_
