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

#ifndef SRC_PHASE_ENGINE_H_
#define SRC_PHASE_ENGINE_H_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "src/agent.h"
#include "src/event_sink.h"
#include "src/game_log.pb.h"
#include "src/game_state.h"
#include "src/night_action.h"
#include "src/role_collectors.h"

namespace mafia {

using std::map;
using std::optional;
using std::pair;
using std::string;
using std::vector;

// The night collectors, in the order their intents are merged.
enum class CollectorId {
  kJail, kBlock, kMafiaCouncil, kCop, kDoctor, kVigilante, kTracker
};

const CollectorId kCanonicalCollectorOrder[] = {
    CollectorId::kJail, CollectorId::kBlock, CollectorId::kMafiaCouncil,
    CollectorId::kCop, CollectorId::kDoctor, CollectorId::kVigilante,
    CollectorId::kTracker
};

string CollectorName(CollectorId id);
CollectorOutput RunCollector(CollectorId id, const NightSnapshot& snapshot,
                             const AgentIo& io);

// Runs all collectors concurrently and joins them. The outputs are in
// canonical order, whatever order the collectors finish in.
vector<CollectorOutput> CollectNightActions(const NightSnapshot& snapshot,
                                            const AgentIo& io);

// Drops intents whose actor or target is no longer alive.
vector<NightAction> FilterStaleIntents(absl::Span<const NightAction> intents,
                                       absl::Span<const string> alive);

struct BackupShot {
  string blocked_shooter;
  string backup_shooter;
  string target;
};

// When the mafia kill was blocked, hands it to the first living mafia member
// (in turn order) other than the shooter who was not blocked, by rewriting
// the actor of the kill intent. Returns nothing when nobody can take over.
optional<BackupShot> ReassignBlockedMafiaKill(
    const ResolvedNightActions& resolved, absl::Span<const string> alive_mafia,
    vector<NightAction>* intents);

const char kVoteSkipDiscussion[] = "VOTE_SKIP_DISCUSSION";
const char kUnvoteSkipDiscussion[] = "UNVOTE_SKIP_DISCUSSION";

enum class SkipVote { kNone, kVote, kUnvote };

struct DiscussionMessage {
  string text;  // With the vote token lines removed.
  SkipVote vote = SkipVote::kNone;
};

// Unvote wins when a message has both tokens.
DiscussionMessage ParseDiscussionMessage(const string& message);

struct VoteTally {
  map<string, int> counts;  // Includes "skip".
  optional<string> eliminated;
  bool tie = false;
};

// The option with a strict plurality is eliminated, unless it is "skip".
VoteTally TallyVotes(absl::Span<const pair<string, string>> votes);

// "Alice: 2, skip: 1", most votes first.
string FormatVoteTally(const map<string, int>& counts);

struct OpenDiscussionLimits {
  double per_player = 1.2;
  double round_bonus = 1.0;
  int floor = 8;
  int cap = 60;
};

OpenDiscussionLimits OpenDiscussionLimitsFromSetup(const GameSetup& setup);

// Message budget of the open discussion. The per player share grows from
// per_player on day 1 to per_player + round_bonus on day planned_rounds.
int OpenDiscussionMessageBudget(int alive_count, int day, int planned_rounds,
                                const OpenDiscussionLimits& limits);

// Drives a game through Night -> Day Discussion -> Day Voting rounds until
// a team wins or the game aborts. The day discussion runs a question round,
// an open discussion until silence or the message budget, and pre-vote
// statements. Collectors read an immutable snapshot; only
// the engine mutates the game state, and only between agent calls.
class PhaseEngine {
 public:
  // The io and sink are not owned.
  PhaseEngine(GameState state, const AgentIo* io, EventSink* sink);

  // Plays the whole game, start notices and post-game reflections included.
  void Run();
  // Returns whether the game goes on.
  bool PlayRound();

  absl::Status RunNight();
  absl::Status RunDayDiscussion();
  absl::Status RunDayVoting();
  void AnnounceStart();
  void RunPostGameReflections();

  const GameState& state() const { return state_; }

  // Stamps the event with the current time, appends it to the history,
  // emits it, and shows it to the players that can see it.
  void Record(Event event);

 private:
  absl::Status RunPhase(const string& name,
                        const std::function<absl::Status()>& phase);
  bool CheckWin();
  void ReportNight(absl::Span<const NightAction> intents,
                   const ResolvedNightActions& resolved);
  void KillPlayer(const string& name, const DeathRevealOverride* reveal,
                  const string& cause);
  void EliminateByVote(const string& name);

  GameState state_;
  const AgentIo* io_;
  EventSink* sink_;
  OpenDiscussionLimits open_discussion_limits_;
  vector<string> last_night_deaths_;
  optional<map<string, int>> last_vote_tally_;
};

}  // namespace mafia

#endif  // SRC_PHASE_ENGINE_H_
