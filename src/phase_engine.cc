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

#include "src/phase_engine.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <set>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "ortools/base/logging.h"
#include "src/mafia_council.h"
#include "src/night_resolver.h"
#include "src/roles.h"
#include "src/win_evaluator.h"

namespace mafia {

using std::set;

namespace {
bool Contains(absl::Span<const string> names, const string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

bool IsSkip(const string& text) {
  return absl::EqualsIgnoreCase(absl::StripAsciiWhitespace(text),
                                kSkipResponse);
}

string BlockedNotice(ActionKind kind) {
  switch (kind) {
    case INVESTIGATE:
      return "You were blocked and could not investigate!";
    case SAVE:
      return "You were blocked and could not save anyone!";
    case KILL:
      return "You were blocked and could not perform the kill!";
    case CLEAN:
      return "You were blocked and could not clean!";
    case FORGE:
      return "You were blocked and could not forge!";
    default:
      return absl::StrFormat("You were blocked and could not %s anyone!",
                             ActionKindName(kind));
  }
}
}  // namespace

string CollectorName(CollectorId id) {
  switch (id) {
    case CollectorId::kJail:
      return "jail";
    case CollectorId::kBlock:
      return "block";
    case CollectorId::kMafiaCouncil:
      return "mafia_council";
    case CollectorId::kCop:
      return "cop";
    case CollectorId::kDoctor:
      return "doctor";
    case CollectorId::kVigilante:
      return "vigilante";
    case CollectorId::kTracker:
      return "tracker";
  }
  return "unknown";
}

CollectorOutput RunCollector(CollectorId id, const NightSnapshot& snapshot,
                             const AgentIo& io) {
  switch (id) {
    case CollectorId::kJail:
      return CollectJailActions(snapshot, io);
    case CollectorId::kBlock:
      return CollectBlockActions(snapshot, io);
    case CollectorId::kMafiaCouncil:
      return CollectMafiaCouncilIntents(snapshot, io);
    case CollectorId::kCop:
      return CollectCopActions(snapshot, io);
    case CollectorId::kDoctor:
      return CollectDoctorActions(snapshot, io);
    case CollectorId::kVigilante:
      return CollectVigilanteActions(snapshot, io);
    case CollectorId::kTracker:
      return CollectTrackerActions(snapshot, io);
  }
  LOG(FATAL) << "Unknown collector " << static_cast<int>(id);
  return {};
}

vector<CollectorOutput> CollectNightActions(const NightSnapshot& snapshot,
                                            const AgentIo& io) {
  vector<std::future<CollectorOutput>> futures;
  for (CollectorId id : kCanonicalCollectorOrder) {
    futures.push_back(std::async(std::launch::async, RunCollector, id,
                                 std::cref(snapshot), std::cref(io)));
  }
  vector<CollectorOutput> outputs;
  for (auto& f : futures) {
    outputs.push_back(f.get());
  }
  return outputs;
}

vector<NightAction> FilterStaleIntents(absl::Span<const NightAction> intents,
                                       absl::Span<const string> alive) {
  vector<NightAction> fresh;
  for (const NightAction& intent : intents) {
    if (Contains(alive, intent.actor) && Contains(alive, intent.target)) {
      fresh.push_back(intent);
    } else {
      VLOG(1) << "Dropping stale intent " << intent;
    }
  }
  return fresh;
}

optional<BackupShot> ReassignBlockedMafiaKill(
    const ResolvedNightActions& resolved, absl::Span<const string> alive_mafia,
    vector<NightAction>* intents) {
  const auto blocked = std::find_if(
      resolved.kills.begin(), resolved.kills.end(), [](const ResolvedKill& k) {
        return k.source == MAFIA_KILL && k.blocked;
      });
  if (blocked == resolved.kills.end()) {
    return std::nullopt;
  }
  for (const string& member : alive_mafia) {
    if (member == blocked->actor ||
        resolved.blocked_players.count(member) > 0) {
      continue;
    }
    for (NightAction& intent : *intents) {
      if (intent.kind == KILL && intent.source == MAFIA_KILL &&
          intent.actor == blocked->actor && intent.target == blocked->target) {
        intent.actor = member;
        return BackupShot{.blocked_shooter = blocked->actor,
                          .backup_shooter = member,
                          .target = blocked->target};
      }
    }
    return std::nullopt;
  }
  return std::nullopt;
}

DiscussionMessage ParseDiscussionMessage(const string& message) {
  bool vote = false, unvote = false;
  vector<string> lines;
  for (absl::string_view line : absl::StrSplit(message, '\n')) {
    const string token =
        absl::AsciiStrToUpper(absl::StripAsciiWhitespace(line));
    if (token == kVoteSkipDiscussion) {
      vote = true;
    } else if (token == kUnvoteSkipDiscussion) {
      unvote = true;
    } else {
      lines.push_back(string(line));
    }
  }
  DiscussionMessage result;
  result.text = string(absl::StripAsciiWhitespace(absl::StrJoin(lines, "\n")));
  if (unvote) {
    result.vote = SkipVote::kUnvote;
  } else if (vote) {
    result.vote = SkipVote::kVote;
  }
  return result;
}

VoteTally TallyVotes(absl::Span<const pair<string, string>> votes) {
  VoteTally tally;
  for (const auto& [voter, choice] : votes) {
    ++tally.counts[choice];
  }
  int top = 0;
  string leader;
  bool tie = false;
  for (const auto& [choice, count] : tally.counts) {
    if (count > top) {
      top = count;
      leader = choice;
      tie = false;
    } else if (count == top) {
      tie = true;
    }
  }
  tally.tie = tie;
  if (top > 0 && !tie && leader != kSkip) {
    tally.eliminated = leader;
  }
  return tally;
}

string FormatVoteTally(const map<string, int>& counts) {
  if (counts.empty()) {
    return "(no votes)";
  }
  vector<pair<string, int>> entries(counts.begin(), counts.end());
  std::stable_sort(entries.begin(), entries.end(),
                   [](const pair<string, int>& a, const pair<string, int>& b) {
                     return a.second > b.second;
                   });
  return absl::StrJoin(entries, ", ", absl::PairFormatter(": "));
}

OpenDiscussionLimits OpenDiscussionLimitsFromSetup(const GameSetup& setup) {
  OpenDiscussionLimits limits;
  if (setup.has_open_discussion_per_player()) {
    limits.per_player = setup.open_discussion_per_player();
  }
  if (setup.has_open_discussion_round_bonus()) {
    limits.round_bonus = setup.open_discussion_round_bonus();
  }
  if (setup.has_open_discussion_floor()) {
    limits.floor = setup.open_discussion_floor();
  }
  if (setup.has_open_discussion_cap()) {
    limits.cap = setup.open_discussion_cap();
  }
  return limits;
}

int OpenDiscussionMessageBudget(int alive_count, int day, int planned_rounds,
                                const OpenDiscussionLimits& limits) {
  alive_count = std::max(alive_count, 0);
  day = std::max(day, 1);
  planned_rounds = std::max(planned_rounds, 1);
  const int floor = std::max(limits.floor, 0);
  const int cap = std::max(limits.cap, floor);
  const double progress = planned_rounds > 1
      ? std::min(1.0, static_cast<double>(day - 1) / (planned_rounds - 1))
      : 0.0;
  const double per_player = std::max(limits.per_player, 0.0) +
                            std::max(limits.round_bonus, 0.0) * progress;
  const int budget = static_cast<int>(std::lround(alive_count * per_player));
  return std::clamp(budget, floor, cap);
}

PhaseEngine::PhaseEngine(GameState state, const AgentIo* io, EventSink* sink)
    : state_(std::move(state)), io_(io), sink_(sink) {
  CHECK(io_ != nullptr);
  CHECK(sink_ != nullptr);
  open_discussion_limits_ = OpenDiscussionLimitsFromSetup(state_.setup());
}

void PhaseEngine::Record(Event event) {
  event.set_round(state_.round());
  event.set_phase(state_.phase());
  if (event.visibility() == VISIBILITY_UNSPECIFIED) {
    event.set_visibility(PUBLIC);
  }
  state_.AddToHistory(event);
  sink_->Emit(event);
  switch (event.visibility()) {
    case PUBLIC:
      for (const string& name : state_.AliveNames()) {
        io_->Observe(name, event);
      }
      break;
    case PRIVATE:
      io_->Observe(event.actor(), event);
      break;
    case FACTION:
      for (const string& name : state_.AliveNames()) {
        if (IsMafiaAligned(state_.RoleOf(name))) {
          io_->Observe(name, event);
        }
      }
      break;
    default:
      break;
  }
}

void PhaseEngine::Run() {
  AnnounceStart();
  while (PlayRound()) {}
  state_.set_phase(GAME_OVER);
  if (state_.winner() == TEAM_UNSPECIFIED) {
    Record(NewPublicEvent(
        SYSTEM, absl::StrCat("Game aborted: ", state_.abort_reason())));
    return;
  }
  Event win = NewPublicEvent(
      WIN, absl::StrCat("Game Over! Winners: ", TeamName(state_.winner())));
  (*win.mutable_metadata())["winner"] = TeamName(state_.winner());
  if (!state_.neutral_winners().empty()) {
    (*win.mutable_metadata())["neutral_winners"] =
        absl::StrJoin(state_.neutral_winners(), ", ");
  }
  Record(win);
  LOG(INFO) << "Game over after " << state_.round() << " rounds, winners: "
            << TeamName(state_.winner());
  if (state_.setup().post_game_reflections()) {
    RunPostGameReflections();
  }
}

absl::Status PhaseEngine::RunPhase(
    const string& name, const std::function<absl::Status()>& phase) {
  VLOG(1) << "Round " << state_.round() << ": " << name << " phase";
  absl::Status status;
  try {
    status = phase();
  } catch (const std::exception& e) {
    status = absl::InternalError(e.what());
  }
  if (!status.ok()) {
    state_.set_abort_reason(
        absl::StrCat(name, " phase failed: ", status.message()));
    LOG(ERROR) << "Engine abort: " << state_.abort_reason();
  }
  return status;
}

bool PhaseEngine::PlayRound() {
  if (state_.IsOver()) {
    return false;
  }
  state_.set_phase(NIGHT);
  if (!RunPhase("night", [this] { return RunNight(); }).ok()) {
    return false;
  }
  if (CheckWin()) {
    return false;
  }
  state_.set_phase(DAY_DISCUSSION);
  if (!RunPhase("day discussion", [this] { return RunDayDiscussion(); })
      .ok()) {
    return false;
  }
  state_.set_phase(DAY_VOTING);
  if (!RunPhase("day voting", [this] { return RunDayVoting(); }).ok()) {
    return false;
  }
  if (CheckWin()) {
    return false;
  }
  const int max_rounds = state_.setup().max_rounds();
  if (max_rounds > 0 && state_.round() >= max_rounds) {
    state_.set_abort_reason("round limit reached");
    LOG(WARNING) << "Stopping after " << max_rounds << " rounds";
    return false;
  }
  state_.AdvanceRound();
  return true;
}

bool PhaseEngine::CheckWin() {
  if (state_.IsOver()) {
    return true;
  }
  const Team winner = CheckWinner(state_.AliveRoles());
  if (winner == TEAM_UNSPECIFIED) {
    return false;
  }
  state_.set_winner(winner);
  return true;
}

void PhaseEngine::AnnounceStart() {
  Record(NewPublicEvent(SYSTEM, absl::StrCat(
      "Available roles this game: ", RoleSummary(state_.AllRoles()))));
  vector<string> masons;
  for (const string& name : state_.turn_order()) {
    const Role role = state_.RoleOf(name);
    Event e = NewPrivateEvent(
        name, absl::StrCat("Your role is ", RoleName(role), "."));
    (*e.mutable_metadata())["role"] = RoleName(role);
    (*e.mutable_metadata())["team"] = TeamName(TeamOf(role));
    Record(e);
    if (role == MASON) {
      masons.push_back(name);
    }
  }
  if (masons.size() > 1) {
    for (const string& mason : masons) {
      vector<string> others;
      for (const string& m : masons) {
        if (m != mason) {
          others.push_back(m);
        }
      }
      Record(NewPrivateEvent(mason, absl::StrFormat(
          "You are a Mason. The other Mason(s) are: %s. You know they are "
          "town-aligned.", absl::StrJoin(others, ", "))));
    }
  }
  for (const string& name : state_.turn_order()) {
    const auto it = state_.executioner_targets().find(name);
    if (it != state_.executioner_targets().end()) {
      Record(NewPrivateEvent(name, absl::StrFormat(
          "Your target is %s. You win if %s is eliminated by day vote.",
          it->second, it->second)));
    }
  }
  Record(NewPublicEvent(SYSTEM, "Game Starting..."));
}

absl::Status PhaseEngine::RunNight() {
  Record(NewPublicEvent(PHASE_CHANGE,
                        absl::StrFormat("--- Night %d ---", state_.round())));
  const NightSnapshot snapshot = {.round = state_.round(),
                                  .alive = state_.AliveNames(),
                                  .roles = state_.RolesByPlayer()};
  vector<NightAction> intents;
  for (const CollectorOutput& out : CollectNightActions(snapshot, *io_)) {
    for (const Event& notice : out.notices) {
      Record(notice);
    }
    intents.insert(intents.end(), out.intents.begin(), out.intents.end());
  }
  const vector<string> alive = state_.AliveNames();
  intents = FilterStaleIntents(intents, alive);
  const vector<NightAction> submitted = intents;
  ResolvedNightActions resolved =
      ResolveNightActions(intents, snapshot.roles, alive);
  const optional<BackupShot> backup =
      ReassignBlockedMafiaKill(resolved, snapshot.AliveMafiaTeam(), &intents);
  if (backup.has_value()) {
    resolved = ResolveNightActions(intents, snapshot.roles, alive);
    Event e = NewFactionEvent(ACTION, backup->backup_shooter, absl::StrFormat(
        "Primary shooter %s was blocked. Backup shooter %s performed the kill "
        "on %s.", backup->blocked_shooter, backup->backup_shooter,
        backup->target));
    (*e.mutable_metadata())["target"] = backup->target;
    (*e.mutable_metadata())["role"] =
        RoleName(snapshot.RoleOf(backup->backup_shooter));
    Record(e);
  }
  for (const string& name : resolved.deaths) {
    if (!Contains(alive, name)) {
      return absl::InternalError(
          absl::StrCat("Resolved death of a player not alive: ", name));
    }
  }
  ReportNight(submitted, resolved);
  return absl::OkStatus();
}

void PhaseEngine::ReportNight(absl::Span<const NightAction> intents,
                              const ResolvedNightActions& resolved) {
  const int night = state_.round();
  for (const auto& inv : resolved.investigations) {
    Event e = NewEvent(ACTION, PRIVATE, inv.actor, absl::StrFormat(
        "Investigation result (night %d): %s is %s.", night, inv.target,
        InvestigationResultName(inv.result)));
    (*e.mutable_metadata())["target"] = inv.target;
    (*e.mutable_metadata())["result"] = InvestigationResultName(inv.result);
    Record(e);
  }
  for (const auto& track : resolved.tracker_results) {
    Event e = NewEvent(ACTION, PRIVATE, track.actor,
        track.visited.has_value()
        ? absl::StrFormat("Tracking result (night %d): %s visited %s.",
                          night, track.target, *track.visited)
        : absl::StrFormat("Tracking result (night %d): %s did not visit "
                          "anyone.", night, track.target));
    (*e.mutable_metadata())["target"] = track.target;
    (*e.mutable_metadata())["visited"] = track.visited.value_or("");
    Record(e);
  }
  for (const NightAction& intent : intents) {
    if (resolved.blocked_players.count(intent.actor) > 0) {
      Record(NewPrivateEvent(intent.actor, BlockedNotice(intent.kind)));
    }
  }
  for (const ResolvedKill& kill : resolved.kills) {
    if (kill.blocked || !kill.saved) {
      continue;
    }
    Event e = NewPublicEvent(SYSTEM, kill.source == MAFIA_KILL
        ? absl::StrFormat("Mafia tried to kill %s, but they were saved!",
                          kill.target)
        : absl::StrFormat("Vigilante tried to shoot %s, but they were saved!",
                          kill.target));
    (*e.mutable_metadata())["target"] = kill.target;
    (*e.mutable_metadata())["source"] = KillSource_Name(kill.source);
    Record(e);
  }

  Event summary = NewEvent(SYSTEM, HIDDEN, "", "Night resolution");
  auto& metadata = *summary.mutable_metadata();
  metadata["blocked"] = absl::StrJoin(resolved.blocked_players, ", ");
  metadata["saved"] = absl::StrJoin(resolved.saved_players, ", ");
  metadata["deaths"] = absl::StrJoin(resolved.deaths, ", ");
  metadata["bomb_retaliations"] =
      absl::StrJoin(resolved.bomb_retaliations, ", ");
  Record(summary);

  last_night_deaths_.assign(resolved.deaths.begin(), resolved.deaths.end());
  for (const string& name : resolved.deaths) {
    const bool bomb = resolved.bomb_retaliations.count(name) > 0;
    KillPlayer(name, resolved.FindOverride(name), bomb ? "bomb" : "night");
    Record(NewPublicEvent(SYSTEM, bomb
        ? absl::StrCat(name, " was caught in a bomb blast during the night.")
        : absl::StrCat(name, " died during the night.")));
  }
  if (resolved.deaths.empty() && resolved.kills.empty()) {
    Record(NewPublicEvent(SYSTEM, "Peaceful night. No attempts were made."));
  }
}

void PhaseEngine::KillPlayer(const string& name,
                             const DeathRevealOverride* reveal,
                             const string& cause) {
  state_.KillPlayer(name);
  optional<Role> revealed = state_.RoleOf(name);
  if (reveal != nullptr) {
    revealed = reveal->revealed_role;
  }
  Event e = NewEvent(DEATH, PUBLIC, name, revealed.has_value()
      ? absl::StrCat("has died. Their role was ", RoleName(*revealed), ".")
      : "has died. Their role is unknown.");
  (*e.mutable_metadata())["role"] =
      revealed.has_value() ? RoleName(*revealed) : "unknown";
  (*e.mutable_metadata())["cause"] = cause;
  Record(e);
}

absl::Status PhaseEngine::RunDayDiscussion() {
  const int day = state_.round();
  Record(NewPublicEvent(PHASE_CHANGE,
                        absl::StrFormat("--- Day %d Discussion ---", day)));
  const vector<string> alive = state_.AliveNames();
  const int num_alive = alive.size();
  const int majority = num_alive / 2 + 1;
  string yesterday = "(none yet)";
  if (day > 1) {
    yesterday = last_vote_tally_.has_value()
        ? FormatVoteTally(*last_vote_tally_) : "(no vote data)";
  }
  Record(NewPublicEvent(SYSTEM, absl::StrFormat(
      "Recap:\n- Alive: %s\n- Last night deaths: %s\n- Yesterday's votes: %s",
      alive.empty() ? "(none)" : absl::StrJoin(alive, ", "),
      last_night_deaths_.empty() ? "none"
                                 : absl::StrJoin(last_night_deaths_, ", "),
      yesterday)));
  const int budget = OpenDiscussionMessageBudget(
      num_alive, day, state_.setup().max_rounds(), open_discussion_limits_);
  VLOG(1) << "Discussion: question round (" << num_alive
          << " turns), open discussion (at most " << budget
          << " messages), pre-vote statements (" << num_alive << " turns)";

  enum class Turn { kSpoke, kPassed, kEnded };
  set<string> skip_votes;
  string previous_speaker = "none";
  // Asks one player to speak, applies their skip-discussion vote and
  // publishes their message.
  auto speak = [&](int index, const string& stage,
                   const string& instruction) {
    const string& name = alive[index];
    const string situation = absl::StrFormat(
        "Day %d, %s. This is your public speaking turn. Speak as %s.\n"
        "Alive players: %s.\nSpeaking order: %s.\n"
        "Your position: %d/%d. Next speaker: %s. Previous speaker: %s.\n"
        "Skip-discussion votes: %d/%d (need %d). You currently: %s.\n"
        "Put %s on its own line to vote to end the discussion, or %s to "
        "retract your vote.\n%s",
        day, stage, name, absl::StrJoin(alive, ", "),
        absl::StrJoin(alive, " -> "), index + 1, num_alive,
        alive[(index + 1) % num_alive], previous_speaker, skip_votes.size(),
        num_alive, majority,
        skip_votes.count(name) > 0 ? "voted" : "not voted",
        kVoteSkipDiscussion, kUnvoteSkipDiscussion, instruction);
    const DiscussionMessage message =
        ParseDiscussionMessage(io_->Respond(name, situation));
    if (message.vote == SkipVote::kVote && skip_votes.insert(name).second) {
      Event vote = NewEvent(VOTE, PUBLIC, name, "voted to skip discussion");
      (*vote.mutable_metadata())["vote"] = "skip_discussion";
      Record(vote);
    } else if (message.vote == SkipVote::kUnvote &&
               skip_votes.erase(name) > 0) {
      Event vote = NewEvent(VOTE, PUBLIC, name,
                            "retracted skip-discussion vote");
      (*vote.mutable_metadata())["vote"] = "skip_discussion";
      (*vote.mutable_metadata())["retracted"] = "true";
      Record(vote);
    }
    if (skip_votes.size() >= majority) {
      Record(NewPublicEvent(SYSTEM, absl::StrFormat(
          "Discussion ended early: %d/%d players voted to skip discussion "
          "(majority reached).", skip_votes.size(), num_alive)));
      return Turn::kEnded;
    }
    if (message.text.empty() || IsSkip(message.text)) {
      return Turn::kPassed;
    }
    Record(NewEvent(CHAT, PUBLIC, name, message.text));
    previous_speaker = name;
    return Turn::kSpoke;
  };

  for (int i = 0; i < num_alive; ++i) {
    if (speak(i, "question round",
              "Ask one targeted question to a specific living player, about "
              "alignment, motives, votes or night actions. If you cannot, "
              "reply with the single word \"SKIP\".") == Turn::kEnded) {
      return absl::OkStatus();
    }
  }

  // An empty message counts as a pass, so that the discussion always ends.
  int sent = 0, passes = 0;
  for (int turn = 0; sent < budget && passes < num_alive; ++turn) {
    const string stage = absl::StrFormat(
        "open discussion (%d/%d messages used)", sent, budget);
    switch (speak(turn % num_alive, stage,
                  "Move the game forward with a concrete claim, inference or "
                  "question. If you have nothing useful to add, reply with "
                  "the single word \"SKIP\".")) {
      case Turn::kEnded:
        return absl::OkStatus();
      case Turn::kPassed:
        ++passes;
        break;
      case Turn::kSpoke:
        passes = 0;
        ++sent;
        break;
    }
  }
  Record(NewPublicEvent(SYSTEM, passes >= num_alive
      ? "Open discussion ended (silence settled over the town)."
      : "Open discussion ended (message limit reached)."));

  for (int i = 0; i < num_alive; ++i) {
    if (speak(i, "pre-vote statement",
              "This is your final statement before voting. Name your top "
              "suspect with a concrete reason, or reply \"SKIP\" if you have "
              "no read.") == Turn::kEnded) {
      return absl::OkStatus();
    }
  }
  Record(NewPublicEvent(SYSTEM,
                        "Discussion ended (pre-vote statements complete)."));
  return absl::OkStatus();
}

absl::Status PhaseEngine::RunDayVoting() {
  const int day = state_.round();
  Record(NewPublicEvent(PHASE_CHANGE,
                        absl::StrFormat("--- Day %d Voting ---", day)));
  const vector<string> alive = state_.AliveNames();
  vector<string> options = alive;
  options.push_back(kSkip);
  const string situation = absl::StrFormat(
      "Day %d voting. Choose a player to eliminate or 'skip'.", day);

  vector<std::future<string>> futures;
  for (const string& voter : alive) {
    futures.push_back(std::async(std::launch::async,
        [this, voter, &situation, &options] {
          return io_->Decide(voter, situation, options);
        }));
  }
  vector<pair<string, string>> ballots;
  for (int i = 0; i < alive.size(); ++i) {
    ballots.push_back({alive[i], futures[i].get()});
  }
  std::sort(ballots.begin(), ballots.end());

  vector<pair<string, string>> votes;
  for (const auto& [voter, choice] : ballots) {
    if (choice != kSkip && !Contains(alive, choice)) {
      Record(NewPublicEvent(SYSTEM, absl::StrFormat(
          "%s voted for invalid target \"%s\", vote discarded.", voter,
          choice)));
      continue;
    }
    Event vote = NewEvent(VOTE, PUBLIC, voter,
                          absl::StrCat("voted for ", choice));
    (*vote.mutable_metadata())["vote"] = choice;
    Record(vote);
    votes.push_back({voter, choice});
  }

  const VoteTally tally = TallyVotes(votes);
  last_vote_tally_ = tally.counts;
  if (!tally.eliminated.has_value()) {
    Record(NewPublicEvent(SYSTEM, absl::StrFormat(
        "Vote result: %s. No one was eliminated.", tally.tie ? "Tie" : "Skip")));
    return absl::OkStatus();
  }
  const string& eliminated = *tally.eliminated;
  Record(NewPublicEvent(SYSTEM, absl::StrFormat(
      "The town has voted to eliminate %s with %d votes.", eliminated,
      tally.counts.at(eliminated))));
  EliminateByVote(eliminated);
  return absl::OkStatus();
}

void PhaseEngine::EliminateByVote(const string& name) {
  const Role role = state_.RoleOf(name);
  KillPlayer(name, nullptr, "vote");
  const bool ends_game = state_.setup().neutral_win_ends_game();
  const vector<NeutralWin> winners = NeutralWinnersOnElimination(
      name, role, state_.executioner_targets(), state_.AliveNames());
  for (const NeutralWin& win : winners) {
    state_.AddNeutralWinner(win.player);
    if (win.role == JESTER) {
      Record(NewPublicEvent(SYSTEM, absl::StrCat(
          name, " (Jester) wins by being eliminated!",
          ends_game ? "" : " The game continues.")));
    } else {
      Record(NewPrivateEvent(win.player, absl::StrFormat(
          "Your target %s was eliminated by day vote. You have achieved "
          "your win condition!", name)));
    }
  }
  if (!winners.empty() && ends_game) {
    state_.set_winner(TEAM_NEUTRAL);
  }
}

void PhaseEngine::RunPostGameReflections() {
  Record(NewPublicEvent(SYSTEM, "--- Post-game reflections ---"));
  for (const string& name : state_.turn_order()) {
    const Role role = state_.RoleOf(name);
    const string situation = absl::StrFormat(
        "The game is over. Winners: %s. Your role was %s, and you %s.\n"
        "Reflect briefly on the game: what worked, and what you would do "
        "differently. Reply \"SKIP\" to pass.",
        TeamName(state_.winner()), RoleName(role),
        state_.IsAlive(name) ? "survived" : "died");
    const string text = io_->Respond(name, situation);
    if (IsSkip(text)) {
      continue;
    }
    Event e = NewEvent(REFLECTION, PUBLIC, name, text);
    (*e.mutable_metadata())["role"] = RoleName(role);
    Record(e);
  }
}

}  // namespace mafia
