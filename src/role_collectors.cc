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

#include "src/role_collectors.h"

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "src/event_sink.h"
#include "src/roles.h"

namespace mafia {

Role NightSnapshot::RoleOf(const string& player) const {
  const auto it = roles.find(player);
  return it == roles.end() ? ROLE_UNSPECIFIED : it->second;
}

vector<string> NightSnapshot::HoldersOf(Role role) const {
  vector<string> holders;
  for (const string& name : alive) {
    if (RoleOf(name) == role) {
      holders.push_back(name);
    }
  }
  return holders;
}

vector<string> NightSnapshot::AliveMafiaTeam() const {
  vector<string> team;
  for (const string& name : alive) {
    if (IsMafiaAligned(RoleOf(name))) {
      team.push_back(name);
    }
  }
  return team;
}

vector<string> NightSnapshot::AliveNonMafia() const {
  vector<string> others;
  for (const string& name : alive) {
    if (!IsMafiaAligned(RoleOf(name))) {
      others.push_back(name);
    }
  }
  return others;
}

vector<string> ValidTargets(const NightSnapshot& snapshot,
                            const string& actor) {
  const bool self_ok = CanSelfTarget(snapshot.RoleOf(actor));
  vector<string> targets;
  for (const string& name : snapshot.alive) {
    if (name != actor || self_ok) {
      targets.push_back(name);
    }
  }
  return targets;
}

namespace {
// Describes the night decision of a town role with a single target.
struct TownAction {
  Role role;
  string title;  // As addressed in the prompt.
  string verb;  // "investigate", as in "Choose ONE player to investigate".
  string guidance;
  bool may_hold_fire = false;
  NightAction (*make_intent)(const string& actor, const string& target);
};

CollectorOutput CollectTownActions(const NightSnapshot& snapshot,
                                   const AgentIo& io,
                                   const TownAction& action) {
  CollectorOutput out;
  for (const string& holder : snapshot.HoldersOf(action.role)) {
    vector<string> options = ValidTargets(snapshot, holder);
    if (options.empty()) {
      continue;
    }
    if (action.may_hold_fire) {
      options.push_back(kNobody);
    }
    const string situation = absl::StrFormat(
        "Night %d. You are the %s.\nAlive players: %s.\n\n"
        "Choose ONE player to %s tonight%s.\n%s",
        snapshot.round, action.title, absl::StrJoin(snapshot.alive, ", "),
        action.verb, action.may_hold_fire ? ", or 'nobody' to hold fire" : "",
        action.guidance);
    const string target = io.Decide(holder, situation, options);
    if (target.empty() || target == kNobody) {
      continue;
    }
    out.intents.push_back(action.make_intent(holder, target));
    Event notice = NewEvent(ACTION, PRIVATE, holder,
                            absl::StrFormat("chose to %s %s", action.verb,
                                            target));
    (*notice.mutable_metadata())["target"] = target;
    (*notice.mutable_metadata())["role"] = RoleName(action.role);
    out.notices.push_back(notice);
  }
  return out;
}
}  // namespace

CollectorOutput CollectJailActions(const NightSnapshot& snapshot,
                                   const AgentIo& io) {
  return CollectTownActions(snapshot, io, {
      .role = JAILKEEPER, .title = "Jailkeeper", .verb = "jail",
      .guidance = "Jailing protects AND blocks the target: they cannot act "
                  "and cannot be killed tonight.",
      .make_intent = NewJail});
}

CollectorOutput CollectBlockActions(const NightSnapshot& snapshot,
                                    const AgentIo& io) {
  return CollectTownActions(snapshot, io, {
      .role = ROLEBLOCKER, .title = "Roleblocker", .verb = "block",
      .guidance = "A blocked player's night action has no effect.",
      .make_intent = NewBlock});
}

CollectorOutput CollectCopActions(const NightSnapshot& snapshot,
                                  const AgentIo& io) {
  return CollectTownActions(snapshot, io, {
      .role = COP, .title = "Cop", .verb = "investigate",
      .guidance = "If you are blocked, your investigation will not work. "
                  "Framed players appear MAFIA.",
      .make_intent = NewInvestigate});
}

CollectorOutput CollectDoctorActions(const NightSnapshot& snapshot,
                                     const AgentIo& io) {
  return CollectTownActions(snapshot, io, {
      .role = DOCTOR, .title = "Doctor", .verb = "save",
      .guidance = "You may save yourself.",
      .make_intent = NewSave});
}

CollectorOutput CollectVigilanteActions(const NightSnapshot& snapshot,
                                        const AgentIo& io) {
  return CollectTownActions(snapshot, io, {
      .role = VIGILANTE, .title = "Vigilante", .verb = "shoot",
      .guidance = "If you are blocked, you will be told so.",
      .may_hold_fire = true,
      .make_intent = NewVigilanteKill});
}

CollectorOutput CollectTrackerActions(const NightSnapshot& snapshot,
                                      const AgentIo& io) {
  return CollectTownActions(snapshot, io, {
      .role = TRACKER, .title = "Tracker", .verb = "track",
      .guidance = "You will learn whom your target visited, if anyone.",
      .make_intent = NewTrack});
}

}  // namespace mafia
