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

#include "src/game_state.h"

#include <algorithm>
#include <map>
#include <set>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/agent.h"
#include "src/roles.h"

namespace mafia {

using std::map;
using std::set;

namespace {
absl::Status AddRoles(const set<Role>& allowed, Role role, int count,
                      map<Role, int>* counts) {
  if (count <= 0) {
    return absl::OkStatus();
  }
  if (!allowed.empty() && allowed.find(role) == allowed.end()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Role %s is not allowed by the role pool", RoleName(role)));
  }
  (*counts)[role] += count;
  return absl::OkStatus();
}
}  // namespace

absl::StatusOr<vector<Role>> BuildRoleList(const GameSetup& setup,
                                           int num_players) {
  set<Role> allowed;
  for (int role : setup.role_pool()) {
    allowed.insert(static_cast<Role>(role));
  }
  auto is_allowed = [&allowed](Role role) {
    return allowed.empty() || allowed.find(role) != allowed.end();
  };
  map<Role, int> counts;
  if (setup.role_counts_size() > 0) {
    for (const auto& rc : setup.role_counts()) {
      if (rc.role() == ROLE_UNSPECIFIED || rc.count() < 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid role count: ", rc.ShortDebugString()));
      }
      absl::Status s = AddRoles(allowed, rc.role(), rc.count(), &counts);
      if (!s.ok()) {
        return s;
      }
    }
  } else if (!allowed.empty()) {
    if (!is_allowed(MAFIA) && !is_allowed(GODFATHER)) {
      return absl::InvalidArgumentError(
          "The role pool needs a mafia or a godfather");
    }
    int num_mafia = std::max(1, num_players / 4);
    if (is_allowed(GODFATHER)) {
      ++counts[GODFATHER];
      --num_mafia;
    }
    if (num_mafia > 0 && is_allowed(MAFIA)) {
      counts[MAFIA] += num_mafia;
    }
    const std::pair<Role, int> kPowerRoles[] = {
        {COP, 5}, {DOCTOR, 5}, {ROLEBLOCKER, 6}, {VIGILANTE, 7}};
    for (const auto& [role, min_players] : kPowerRoles) {
      if (num_players >= min_players && is_allowed(role)) {
        ++counts[role];
      }
    }
  } else {
    counts[MAFIA] = std::max(1, num_players / 4);
    if (num_players >= 4) {
      ++counts[COP];
    }
  }

  int total = 0;
  for (const auto& [role, count] : counts) {
    total += count;
  }
  if (total > num_players) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Selected %d roles for only %d players", total, num_players));
  }
  const int remaining = num_players - total;
  if (remaining > 0 && !is_allowed(VILLAGER)) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Need %d filler roles but villager is not in the role pool",
        remaining));
  }
  counts[VILLAGER] += remaining;

  vector<Role> roles;
  for (const auto& [role, count] : counts) {
    roles.insert(roles.end(), count, role);
  }
  return roles;
}

string RoleSummary(absl::Span<const Role> roles) {
  map<string, int> counts;
  for (Role role : roles) {
    ++counts[RoleName(role)];
  }
  vector<string> parts;
  for (const auto& [name, count] : counts) {
    parts.push_back(count == 1 ? name
                               : absl::StrFormat("%s x%d", name, count));
  }
  return absl::StrJoin(parts, ", ");
}

absl::StatusOr<GameState> GameState::FromSetup(const GameSetup& setup) {
  vector<string> players(setup.players().begin(), setup.players().end());
  if (players.empty()) {
    return absl::InvalidArgumentError("A game needs players");
  }
  set<string> seen;
  for (const string& name : players) {
    if (name.empty()) {
      return absl::InvalidArgumentError("Player name cannot be empty");
    }
    if (absl::EqualsIgnoreCase(name, kSkip) ||
        absl::EqualsIgnoreCase(name, kNobody)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Reserved player name: ", name));
    }
    if (!seen.insert(name).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate player name: ", name));
    }
  }

  const int64_t order_seed = setup.has_player_order_seed()
      ? setup.player_order_seed() : setup.seed() + 1;
  std::mt19937_64 order_rng(order_seed);
  std::shuffle(players.begin(), players.end(), order_rng);

  std::mt19937_64 rng(setup.seed());
  unordered_map<string, Role> roles;
  if (setup.roles_size() > 0) {
    for (const auto& [name, role] : setup.roles()) {
      if (seen.find(name) == seen.end()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Forced role for unknown player ", name));
      }
      if (role == ROLE_UNSPECIFIED) {
        return absl::InvalidArgumentError(
            absl::StrCat("Forced role for ", name, " is unspecified"));
      }
    }
    for (const string& name : players) {
      const auto it = setup.roles().find(name);
      roles[name] = it == setup.roles().end() ? VILLAGER : it->second;
    }
  } else {
    absl::StatusOr<vector<Role>> role_list =
        BuildRoleList(setup, players.size());
    if (!role_list.ok()) {
      return role_list.status();
    }
    vector<string> seats = players;
    std::shuffle(seats.begin(), seats.end(), rng);
    std::shuffle(role_list->begin(), role_list->end(), rng);
    for (int i = 0; i < seats.size(); ++i) {
      roles[seats[i]] = (*role_list)[i];
    }
  }

  GameState g(players, roles);
  g.SetSetup(setup);
  for (const string& name : players) {
    if (roles[name] != EXECUTIONER) {
      continue;
    }
    vector<string> candidates;
    for (const string& other : players) {
      if (other != name && IsTownAligned(roles[other])) {
        candidates.push_back(other);
      }
    }
    if (candidates.empty()) {
      LOG(WARNING) << "No target available for executioner " << name;
      continue;
    }
    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    g.SetExecutionerTarget(name, candidates[pick(rng)]);
  }
  return g;
}

GameState::GameState(absl::Span<const string> players,
                     const unordered_map<string, Role>& roles) {
  for (const string& name : players) {
    CHECK(!name.empty()) << "Player name cannot be empty string";
    CHECK(!IsPlayer(name)) << "Duplicate player " << name;
    const auto it = roles.find(name);
    CHECK(it != roles.end()) << "No role assigned to " << name;
    turn_order_.push_back(name);
    players_[name] = {.name = name, .role = it->second};
  }
}

GameState& GameState::SetExecutionerTarget(const string& executioner,
                                           const string& target) {
  CHECK_EQ(RoleOf(executioner), EXECUTIONER)
      << executioner << " is not an executioner";
  CHECK(IsPlayer(target)) << "Invalid player name: " << target;
  CHECK_NE(executioner, target);
  executioner_targets_[executioner] = target;
  return *this;
}

const Player& GameState::GetPlayer(const string& name) const {
  const auto it = players_.find(name);
  CHECK(it != players_.end()) << "Invalid player name: " << name;
  return it->second;
}

vector<string> GameState::AliveNames() const {
  vector<string> alive;
  for (const string& name : turn_order_) {
    if (IsAlive(name)) {
      alive.push_back(name);
    }
  }
  return alive;
}

vector<Role> GameState::AliveRoles() const {
  vector<Role> alive;
  for (const string& name : turn_order_) {
    const Player& p = GetPlayer(name);
    if (p.alive) {
      alive.push_back(p.role);
    }
  }
  return alive;
}

unordered_map<string, Role> GameState::RolesByPlayer() const {
  unordered_map<string, Role> roles;
  for (const auto& [name, p] : players_) {
    roles[name] = p.role;
  }
  return roles;
}

vector<Role> GameState::AllRoles() const {
  vector<Role> roles;
  for (const string& name : turn_order_) {
    roles.push_back(RoleOf(name));
  }
  return roles;
}

void GameState::KillPlayer(const string& name) {
  const auto it = players_.find(name);
  CHECK(it != players_.end()) << "Invalid player name: " << name;
  CHECK(it->second.alive) << name << " is already dead";
  it->second.alive = false;
}

void GameState::AddNeutralWinner(const string& name) {
  CHECK(IsPlayer(name)) << "Invalid player name: " << name;
  if (std::find(neutral_winners_.begin(), neutral_winners_.end(), name) ==
      neutral_winners_.end()) {
    neutral_winners_.push_back(name);
  }
}

GameLog GameState::ToProto() const {
  GameLog log;
  *log.mutable_setup() = setup_;
  for (const string& name : turn_order_) {
    log.add_turn_order(name);
    (*log.mutable_player_roles())[name] = RoleOf(name);
  }
  for (const auto& [executioner, target] : executioner_targets_) {
    (*log.mutable_executioner_targets())[executioner] = target;
  }
  for (const Event& event : history_) {
    *log.add_events() = event;
  }
  log.set_winner(winner_);
  for (const string& name : neutral_winners_) {
    log.add_neutral_winners(name);
  }
  log.set_abort_reason(abort_reason_);
  log.set_rounds_played(round_);
  return log;
}

}  // namespace mafia
