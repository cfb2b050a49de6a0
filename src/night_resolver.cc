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

#include <algorithm>
#include <set>
#include <vector>

#include "ortools/base/logging.h"
#include "src/roles.h"

namespace mafia {
namespace {
using std::set;
using std::vector;

Role RoleOf(const unordered_map<string, Role>& roles, const string& player) {
  const auto it = roles.find(player);
  return it == roles.end() ? ROLE_UNSPECIFIED : it->second;
}

bool Contains(const set<string>& s, const string& v) {
  return s.find(v) != s.end();
}

bool IsBlockLike(const NightAction& a) {
  return a.kind == BLOCK || a.kind == JAIL;
}

// Splits the blockers into blocked and unblocked. A blocker is blocked once
// any unblocked blocker targets it, and unblocked once all of its blockers
// are known to be blocked. Whatever remains undecided is a cycle of mutual
// blocks, and everyone in it is blocked.
set<string> ResolveBlockedBlockers(absl::Span<const NightAction> actions) {
  set<string> remaining, blocked, unblocked;
  for (const auto& a : actions) {
    if (IsBlockLike(a)) {
      remaining.insert(a.actor);
    }
  }
  bool changed = true;
  while (changed) {
    changed = false;
    for (auto it = remaining.begin(); it != remaining.end();) {
      const string& actor = *it;
      bool any_unblocked = false, all_blocked = true;
      for (const auto& a : actions) {
        if (!IsBlockLike(a) || a.target != actor) {
          continue;
        }
        any_unblocked |= Contains(unblocked, a.actor);
        all_blocked &= Contains(blocked, a.actor);
      }
      if (any_unblocked) {
        blocked.insert(actor);
      } else if (all_blocked) {
        unblocked.insert(actor);
      } else {
        ++it;
        continue;
      }
      it = remaining.erase(it);
      changed = true;
    }
    if (!changed && !remaining.empty()) {
      VLOG(1) << "Blocking cycle among " << remaining.size() << " blockers";
      blocked.insert(remaining.begin(), remaining.end());
      remaining.clear();
    }
  }
  return blocked;
}

InvestigationResult Investigate(Role target_role, bool framed) {
  if (framed) {
    return READS_MAFIA;
  }
  return AppearsMafiaToInvestigation(target_role) ? READS_MAFIA
                                                  : READS_INNOCENT;
}
}  // namespace

ResolvedNightActions ResolveNightActions(
    absl::Span<const NightAction> actions,
    const unordered_map<string, Role>& roles,
    absl::Span<const string> alive_players) {
  ResolvedNightActions r;
  auto& blocked = r.blocked_players;
  const set<string> alive(alive_players.begin(), alive_players.end());

  // 1. Blocks and jails.
  const set<string> blocked_blockers = ResolveBlockedBlockers(actions);
  blocked.insert(blocked_blockers.begin(), blocked_blockers.end());
  for (const auto& a : actions) {
    if (!IsBlockLike(a) || Contains(blocked_blockers, a.actor)) {
      continue;
    }
    blocked.insert(a.target);
    if (a.kind == JAIL) {
      r.saved_players.insert(a.target);
    }
  }
  auto is_live = [&blocked](const NightAction& a) {
    return !Contains(blocked, a.actor);
  };

  // 2. Saves, and frames for the investigations below.
  set<string> framed;
  for (const auto& a : actions) {
    if (!is_live(a)) {
      continue;
    }
    if (a.kind == SAVE) {
      r.saved_players.insert(a.target);
    } else if (a.kind == FRAME) {
      framed.insert(a.target);
    }
  }

  // 3. Investigations.
  for (const auto& a : actions) {
    if (a.kind != INVESTIGATE || !is_live(a)) {
      continue;
    }
    r.investigations.push_back(
        {.actor = a.actor, .target = a.target,
         .result = Investigate(RoleOf(roles, a.target),
                               Contains(framed, a.target))});
  }

  // 4. Tracking. A blocked player has no live actions, so blocked and
  // stayed home look the same.
  for (size_t i = 0; i < actions.size(); ++i) {
    const NightAction& track = actions[i];
    if (track.kind != TRACK || !is_live(track)) {
      continue;
    }
    ResolvedTrack result = {.actor = track.actor, .target = track.target};
    for (size_t j = 0; j < actions.size(); ++j) {
      const NightAction& a = actions[j];
      if (j == i || a.actor != track.target || !is_live(a)) {
        continue;
      }
      result.visited = a.target;
      break;
    }
    r.tracker_results.push_back(result);
  }

  // 5. Kills.
  for (const auto& a : actions) {
    if (a.kind != KILL) {
      continue;
    }
    const bool kill_blocked = !is_live(a);
    r.kills.push_back(
        {.actor = a.actor, .target = a.target, .source = a.source,
         .blocked = kill_blocked,
         .saved = !kill_blocked && Contains(r.saved_players, a.target)});
  }

  // 6. and 7. Deaths, never of a mafia-aligned player.
  for (const auto& k : r.kills) {
    if (k.blocked || k.saved) {
      continue;
    }
    if (IsMafiaAligned(RoleOf(roles, k.target))) {
      VLOG(1) << "Dropping death of mafia-aligned " << k.target;
      continue;
    }
    r.deaths.insert(k.target);
  }

  // 8. Bomb retaliation hits the first successful attacker of the bomb.
  const set<string> victims = r.deaths;
  for (const string& victim : victims) {
    if (RoleOf(roles, victim) != BOMB) {
      continue;
    }
    const auto k = std::find_if(
        r.kills.begin(), r.kills.end(), [&victim](const ResolvedKill& k) {
          return k.target == victim && !k.blocked && !k.saved;
        });
    if (k == r.kills.end() || !Contains(alive, k->actor) ||
        Contains(r.saved_players, k->actor)) {
      continue;
    }
    r.bomb_retaliations.insert(k->actor);
    r.deaths.insert(k->actor);
  }

  // 9. Death reveal overrides.
  for (const string& dead : r.deaths) {
    const NightAction* forge = nullptr;
    const NightAction* clean = nullptr;
    for (const auto& a : actions) {
      if (a.target != dead || !is_live(a)) {
        continue;
      }
      if (a.kind == FORGE && forge == nullptr) {
        forge = &a;
      } else if (a.kind == CLEAN && clean == nullptr) {
        clean = &a;
      }
    }
    if (forge != nullptr) {
      r.death_reveal_overrides.push_back(
          {.player = dead, .revealed_role = forge->fake_role});
    } else if (clean != nullptr) {
      r.death_reveal_overrides.push_back({.player = dead});
    }
  }
  return r;
}

}  // namespace mafia
