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

#ifndef SRC_NIGHT_ACTION_H_
#define SRC_NIGHT_ACTION_H_

#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "src/game_log.pb.h"

namespace mafia {

using std::optional;
using std::ostream;
using std::set;
using std::string;
using std::vector;

// One actor's unresolved request to affect one target tonight. The kind
// decides which of the extra fields are meaningful:
//   KILL:  source.
//   FORGE: fake_role.
struct NightAction {
  ActionKind kind = ACTION_KIND_UNSPECIFIED;
  string actor;
  string target;
  KillSource source = KILL_SOURCE_UNSPECIFIED;
  Role fake_role = ROLE_UNSPECIFIED;

  bool operator==(const NightAction& other) const = default;
};

ostream& operator<<(ostream& os, const NightAction& a);

// Syntactic sugar for creating night actions.
NightAction NewBlock(const string& actor, const string& target);
NightAction NewJail(const string& actor, const string& target);
NightAction NewSave(const string& actor, const string& target);
NightAction NewInvestigate(const string& actor, const string& target);
NightAction NewTrack(const string& actor, const string& target);
NightAction NewMafiaKill(const string& actor, const string& target);
NightAction NewVigilanteKill(const string& actor, const string& target);
NightAction NewFrame(const string& actor, const string& target);
NightAction NewClean(const string& actor, const string& target);
NightAction NewForge(const string& actor, const string& target, Role fake_role);

struct ResolvedKill {
  string actor, target;
  KillSource source = KILL_SOURCE_UNSPECIFIED;
  bool blocked = false;
  bool saved = false;
};

struct ResolvedInvestigation {
  string actor, target;
  InvestigationResult result = INVESTIGATION_RESULT_UNSPECIFIED;
};

struct ResolvedTrack {
  string actor, target;
  optional<string> visited;  // Empty for "no visit" (home or blocked).
};

struct DeathRevealOverride {
  string player;
  optional<Role> revealed_role;  // Empty when cleaned: role is unknown.
};

// The combined effect of one night. Rebuilt every night.
struct ResolvedNightActions {
  set<string> blocked_players;
  set<string> saved_players;
  vector<ResolvedKill> kills;
  set<string> deaths;
  vector<ResolvedInvestigation> investigations;
  vector<ResolvedTrack> tracker_results;
  set<string> bomb_retaliations;
  vector<DeathRevealOverride> death_reveal_overrides;

  const DeathRevealOverride* FindOverride(const string& player) const;
};

// "MAFIA" or "INNOCENT".
string InvestigationResultName(InvestigationResult result);
// Lower case verb used in logs, e.g. "investigate".
string ActionKindName(ActionKind kind);

}  // namespace mafia

#endif  // SRC_NIGHT_ACTION_H_
