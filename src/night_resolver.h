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

#ifndef SRC_NIGHT_RESOLVER_H_
#define SRC_NIGHT_RESOLVER_H_

#include <string>
#include <unordered_map>

#include "absl/types/span.h"
#include "src/game_log.pb.h"
#include "src/night_action.h"

namespace mafia {

using std::string;
using std::unordered_map;

// Derives the combined effect of a night's actions. The actions must be in
// canonical collector order: tracking reports the first successful action of
// the tracked player in that order.
//
// Passes, in order:
//   1. Blocks and jails. Blockers targeting each other are resolved to a
//      fixed point; a blocker caught in a cycle is blocked. Only unblocked
//      blocks apply. A jail also protects its target.
//   2. Saves.
//   3. Frames, then investigations. A frame reads MAFIA, even on the
//      Godfather.
//   4. Tracking.
//   5. Kills, every attempt recorded with blocked/saved flags.
//   6. Deaths: targets of at least one unblocked, unsaved kill.
//   7. Mafia-aligned players are removed from the deaths.
//   8. Bomb retaliation.
//   9. Death reveal overrides: forge beats clean.
//
// Never fails. Players missing from roles count as town and read innocent.
ResolvedNightActions ResolveNightActions(
    absl::Span<const NightAction> actions,
    const unordered_map<string, Role>& roles,
    absl::Span<const string> alive_players);

}  // namespace mafia

#endif  // SRC_NIGHT_RESOLVER_H_
