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

#include "src/night_action.h"

#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "src/roles.h"

namespace mafia {

ostream& operator<<(ostream& os, const NightAction& a) {
  os << absl::StrFormat("%s(%s->%s)", ActionKindName(a.kind), a.actor,
                        a.target);
  if (a.kind == KILL) {
    os << (a.source == VIGILANTE_KILL ? "[vigilante]" : "[mafia]");
  } else if (a.kind == FORGE) {
    os << "[" << RoleName(a.fake_role) << "]";
  }
  return os;
}

NightAction NewBlock(const string& actor, const string& target) {
  return {.kind = BLOCK, .actor = actor, .target = target};
}

NightAction NewJail(const string& actor, const string& target) {
  return {.kind = JAIL, .actor = actor, .target = target};
}

NightAction NewSave(const string& actor, const string& target) {
  return {.kind = SAVE, .actor = actor, .target = target};
}

NightAction NewInvestigate(const string& actor, const string& target) {
  return {.kind = INVESTIGATE, .actor = actor, .target = target};
}

NightAction NewTrack(const string& actor, const string& target) {
  return {.kind = TRACK, .actor = actor, .target = target};
}

NightAction NewMafiaKill(const string& actor, const string& target) {
  return {.kind = KILL, .actor = actor, .target = target,
          .source = MAFIA_KILL};
}

NightAction NewVigilanteKill(const string& actor, const string& target) {
  return {.kind = KILL, .actor = actor, .target = target,
          .source = VIGILANTE_KILL};
}

NightAction NewFrame(const string& actor, const string& target) {
  return {.kind = FRAME, .actor = actor, .target = target};
}

NightAction NewClean(const string& actor, const string& target) {
  return {.kind = CLEAN, .actor = actor, .target = target};
}

NightAction NewForge(const string& actor, const string& target,
                     Role fake_role) {
  return {.kind = FORGE, .actor = actor, .target = target,
          .fake_role = fake_role};
}

const DeathRevealOverride* ResolvedNightActions::FindOverride(
    const string& player) const {
  for (const auto& o : death_reveal_overrides) {
    if (o.player == player) {
      return &o;
    }
  }
  return nullptr;
}

string InvestigationResultName(InvestigationResult result) {
  return result == READS_MAFIA ? "MAFIA" : "INNOCENT";
}

string ActionKindName(ActionKind kind) {
  return absl::AsciiStrToLower(ActionKind_Name(kind));
}

}  // namespace mafia
