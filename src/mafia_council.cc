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

#include "src/mafia_council.h"

#include <algorithm>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/event_sink.h"
#include "src/roles.h"
#include "src/util.h"

namespace mafia {

namespace {
bool Contains(absl::Span<const string> names, const string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

string Describe(const NightAction& intent) {
  switch (intent.kind) {
    case KILL:
      return absl::StrCat("chose to kill ", intent.target);
    case BLOCK:
      return absl::StrCat("chose to block ", intent.target);
    case FRAME:
      return absl::StrCat("chose to frame ", intent.target);
    case CLEAN:
      return absl::StrCat("chose to clean ", intent.target, " if killed");
    case FORGE:
      return absl::StrFormat("chose to forge %s as %s if killed",
                             intent.target, RoleName(intent.fake_role));
    default:
      return absl::StrCat("chose to ", ActionKindName(intent.kind), " ",
                          intent.target);
  }
}

Event FactionActionEvent(const NightAction& intent, Role actor_role) {
  Event e = NewFactionEvent(ACTION, intent.actor, Describe(intent));
  (*e.mutable_metadata())["target"] = intent.target;
  (*e.mutable_metadata())["role"] = RoleName(actor_role);
  if (intent.kind == FORGE) {
    (*e.mutable_metadata())["fake_role"] = RoleName(intent.fake_role);
  }
  return e;
}

// Each member speaks in turn. Returns the transcript, which the leader
// sees when writing the plan.
vector<string> RunDiscussion(const NightSnapshot& snapshot, const AgentIo& io,
                             absl::Span<const string> team,
                             CollectorOutput* out) {
  vector<string> transcript;
  const int rounds = MafiaDiscussionRounds(team.size());
  if (rounds == 0) {
    return transcript;
  }
  out->notices.push_back(NewFactionEvent(
      SYSTEM, "", "Mafia team is discussing night strategy..."));
  for (int r = 1; r <= rounds; ++r) {
    for (const string& member : team) {
      vector<string> others;
      for (const string& m : team) {
        if (m != member) {
          others.push_back(m);
        }
      }
      const string situation = absl::StrFormat(
          "Night %d Mafia Discussion (Round %d/%d).\nTeammates: %s.\n"
          "Alive players: %s.\nDiscuss who to kill, and who to block, "
          "frame, clean or forge if your team can.\n"
          "If you have nothing new to add, reply with the single word "
          "\"SKIP\".\nDiscussion so far:\n%s",
          snapshot.round, r, rounds, absl::StrJoin(others, ", "),
          absl::StrJoin(snapshot.alive, ", "),
          transcript.empty() ? "(nothing yet)"
                             : absl::StrJoin(transcript, "\n"));
      const string message = io.Respond(member, situation);
      if (absl::EqualsIgnoreCase(message, kSkipResponse)) {
        continue;
      }
      transcript.push_back(absl::StrCat(member, ": ", message));
      Event chat = NewFactionEvent(FACTION_CHAT, member, message);
      (*chat.mutable_metadata())["role"] = RoleName(snapshot.RoleOf(member));
      out->notices.push_back(chat);
    }
  }
  return transcript;
}

string PlanSituation(const NightSnapshot& snapshot,
                     absl::Span<const string> team,
                     absl::Span<const string> kill_targets,
                     absl::Span<const string> other_targets,
                     absl::Span<const string> transcript) {
  auto has = [&snapshot, &team](Role role) {
    return std::any_of(team.begin(), team.end(), [&](const string& m) {
      return snapshot.RoleOf(m) == role;
    });
  };
  vector<string> forgeable;
  for (Role role : ForgeableRoles()) {
    forgeable.push_back(RoleName(role));
  }
  string fields = "kill_target: \"<player>\"\n";
  if (has(MAFIA_ROLEBLOCKER)) {
    absl::StrAppend(&fields, "block_target: \"<player>\"  # optional\n");
  }
  if (has(FRAMER)) {
    absl::StrAppend(&fields, "frame_target: \"<player>\"  # optional\n");
  }
  if (has(JANITOR)) {
    absl::StrAppend(&fields, "clean_target: \"<player>\"  # optional\n");
  }
  if (has(FORGER)) {
    absl::StrAppend(&fields, "forge_target: \"<player>\"  # optional\n",
                    "fake_role: \"<role>\"  # required with forge_target, "
                    "one of: ", absl::StrJoin(forgeable, ", "), "\n");
  }
  return absl::StrFormat(
      "Night %d. You are leading the Mafia team's night actions.\n"
      "Alive players: %s.\nValid kill targets: %s.\n"
      "Valid targets for the other actions: %s.\n"
      "Team discussion:\n%s\n\n"
      "Reply with the plan in protobuf text format, inside braces:\n{\n%s}",
      snapshot.round, absl::StrJoin(snapshot.alive, ", "),
      absl::StrJoin(kill_targets, ", "), absl::StrJoin(other_targets, ", "),
      transcript.empty() ? "(none)" : absl::StrJoin(transcript, "\n"),
      fields);
}
}  // namespace

string ChooseMafiaLeader(const NightSnapshot& snapshot,
                         absl::Span<const string> team) {
  for (Role role : {GODFATHER, MAFIA}) {
    for (const string& member : team) {
      if (snapshot.RoleOf(member) == role) {
        return member;
      }
    }
  }
  return team.empty() ? "" : team.front();
}

int MafiaDiscussionRounds(int team_size) {
  if (team_size < 2) {
    return 0;
  }
  return team_size >= 3 ? 2 : 1;
}

absl::StatusOr<MafiaNightPlan> ParseMafiaNightPlan(const string& text) {
  MafiaNightPlan plan;
  absl::Status status = ParseTextProto(OutermostBraces(text), &plan);
  if (!status.ok()) {
    return status;
  }
  return plan;
}

absl::StatusOr<MafiaNightPlan> ValidateMafiaNightPlan(
    const MafiaNightPlan& plan, absl::Span<const string> kill_targets,
    absl::Span<const string> other_targets) {
  if (!Contains(kill_targets, plan.kill_target())) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid kill target \"", plan.kill_target(), "\""));
  }
  MafiaNightPlan valid;
  valid.set_kill_target(plan.kill_target());
  if (Contains(other_targets, plan.block_target())) {
    valid.set_block_target(plan.block_target());
  }
  if (Contains(other_targets, plan.frame_target())) {
    valid.set_frame_target(plan.frame_target());
  }
  if (Contains(other_targets, plan.clean_target())) {
    valid.set_clean_target(plan.clean_target());
  }
  const Role fake_role = RoleFromName(
      string(absl::StripAsciiWhitespace(plan.fake_role())));
  if (Contains(other_targets, plan.forge_target()) &&
      IsForgeableRole(fake_role)) {
    valid.set_forge_target(plan.forge_target());
    valid.set_fake_role(RoleName(fake_role));
  }
  return valid;
}

vector<NightAction> ExpandMafiaNightPlan(const MafiaNightPlan& plan,
                                         const NightSnapshot& snapshot,
                                         absl::Span<const string> team,
                                         const string& leader) {
  vector<NightAction> intents;
  CHECK(!plan.kill_target().empty()) << "Expanding an unvalidated plan";
  intents.push_back(NewMafiaKill(leader, plan.kill_target()));
  for (const string& member : team) {
    const Role role = snapshot.RoleOf(member);
    if (role == MAFIA_ROLEBLOCKER && !plan.block_target().empty()) {
      intents.push_back(NewBlock(member, plan.block_target()));
    } else if (role == FRAMER && !plan.frame_target().empty()) {
      intents.push_back(NewFrame(member, plan.frame_target()));
    } else if (role == JANITOR && !plan.clean_target().empty()) {
      intents.push_back(NewClean(member, plan.clean_target()));
    } else if (role == FORGER && !plan.forge_target().empty()) {
      intents.push_back(NewForge(member, plan.forge_target(),
                                 RoleFromName(plan.fake_role())));
    }
  }
  return intents;
}

CollectorOutput CollectMafiaCouncilIntents(const NightSnapshot& snapshot,
                                           const AgentIo& io) {
  CollectorOutput out;
  const vector<string> team = snapshot.AliveMafiaTeam();
  const vector<string> kill_targets = snapshot.AliveNonMafia();
  if (team.empty() || kill_targets.empty()) {
    return out;
  }
  const vector<string>& other_targets = kill_targets;
  const vector<string> transcript = RunDiscussion(snapshot, io, team, &out);

  const string leader = ChooseMafiaLeader(snapshot, team);
  const string reply = io.Respond(
      leader,
      PlanSituation(snapshot, team, kill_targets, other_targets, transcript));
  absl::StatusOr<MafiaNightPlan> plan = ParseMafiaNightPlan(reply);
  if (plan.ok()) {
    plan = ValidateMafiaNightPlan(*plan, kill_targets, other_targets);
  }
  if (plan.ok()) {
    VLOG(1) << "Mafia night plan by " << leader << ": "
            << plan->ShortDebugString();
    for (const NightAction& intent :
         ExpandMafiaNightPlan(*plan, snapshot, team, leader)) {
      out.notices.push_back(
          FactionActionEvent(intent, snapshot.RoleOf(intent.actor)));
      out.intents.push_back(intent);
    }
    return out;
  }

  LOG(WARNING) << "Mafia leader " << leader
               << " plan unusable, falling back to a kill decision: "
               << plan.status();
  Event fallback = NewFactionEvent(
      SYSTEM, leader,
      "Mafia leader plan parsing failed, falling back to simple kill "
      "decision");
  (*fallback.mutable_metadata())["error"] = string(plan.status().message());
  out.notices.push_back(fallback);
  const string target = io.Decide(
      leader,
      absl::StrFormat("Night %d. You are leading the Mafia kill. Choose a "
                      "target.\nNote: If you are blocked, the Mafia kill "
                      "fails.", snapshot.round),
      kill_targets);
  const NightAction kill = NewMafiaKill(leader, target);
  out.notices.push_back(FactionActionEvent(kill, snapshot.RoleOf(leader)));
  out.intents.push_back(kill);
  return out;
}

}  // namespace mafia
