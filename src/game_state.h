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

#ifndef SRC_GAME_STATE_H_
#define SRC_GAME_STATE_H_

#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/game_log.pb.h"
#include "src/util.h"

namespace mafia {

using std::string;
using std::unordered_map;
using std::vector;

struct Player {
  string name;
  Role role = ROLE_UNSPECIFIED;
  bool alive = true;
};

// The role list for a game of num_players, before it is dealt. Uses the
// explicit role counts if given, else role pool heuristics, else a minimal
// default; remaining seats are villagers.
absl::StatusOr<vector<Role>> BuildRoleList(const GameSetup& setup,
                                           int num_players);

// "cop, mafia x2, villager x3", sorted by role name.
string RoleSummary(absl::Span<const Role> roles);

// The mutable state of one game. Only the phase engine mutates it.
class GameState {
 public:
  // Shuffles the turn order, deals the roles and picks executioner targets,
  // all deterministically from the setup seeds.
  static absl::StatusOr<GameState> FromSetup(const GameSetup& setup);

  // Fixed assignment, turn order as given.
  GameState(absl::Span<const string> players,
            const unordered_map<string, Role>& roles);
  GameState& SetExecutionerTarget(const string& executioner,
                                  const string& target);
  GameState& SetSetup(const GameSetup& setup) {
    setup_ = setup;
    return *this;
  }

  const GameSetup& setup() const { return setup_; }
  Phase phase() const { return phase_; }
  void set_phase(Phase phase) { phase_ = phase; }
  int round() const { return round_; }
  void AdvanceRound() { ++round_; }

  const vector<string>& turn_order() const { return turn_order_; }
  bool IsPlayer(const string& name) const {
    return players_.find(name) != players_.end();
  }
  const Player& GetPlayer(const string& name) const;
  Role RoleOf(const string& name) const { return GetPlayer(name).role; }
  bool IsAlive(const string& name) const { return GetPlayer(name).alive; }
  // In turn order.
  vector<string> AliveNames() const;
  vector<Role> AliveRoles() const;
  unordered_map<string, Role> RolesByPlayer() const;
  vector<Role> AllRoles() const;  // In turn order.
  void KillPlayer(const string& name);

  const unordered_map<string, string>& executioner_targets() const {
    return executioner_targets_;
  }

  void AddToHistory(const Event& event) { history_.push_back(event); }
  const vector<Event>& history() const { return history_; }

  Team winner() const { return winner_; }
  void set_winner(Team winner) { winner_ = winner; }
  bool IsOver() const {
    return winner_ != TEAM_UNSPECIFIED || !abort_reason_.empty();
  }
  const vector<string>& neutral_winners() const { return neutral_winners_; }
  void AddNeutralWinner(const string& name);
  const string& abort_reason() const { return abort_reason_; }
  void set_abort_reason(const string& reason) { abort_reason_ = reason; }

  GameLog ToProto() const;
  void WriteToFile(const path& filename) const {
    WriteProtoToFile(ToProto(), filename);
  }

 private:
  GameSetup setup_;
  Phase phase_ = NIGHT;
  int round_ = 1;
  vector<string> turn_order_;
  unordered_map<string, Player> players_;
  unordered_map<string, string> executioner_targets_;
  vector<Event> history_;
  Team winner_ = TEAM_UNSPECIFIED;
  vector<string> neutral_winners_;
  string abort_reason_;
};

}  // namespace mafia

#endif  // SRC_GAME_STATE_H_
