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

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/time/time.h"
#include "ortools/base/logging.h"
#include "src/agent.h"
#include "src/event_sink.h"
#include "src/game_state.h"
#include "src/phase_engine.h"
#include "src/roles.h"
#include "src/util.h"

using std::string;

// All files below are in text proto format.
ABSL_FLAG(string, game_setup, "", "Game setup file path.");
ABSL_FLAG(string, output_game_log, "", "Optional game log output file.");
ABSL_FLAG(int64_t, seed, -1,
          "Overrides the setup seed when non-negative.");
ABSL_FLAG(bool, dry_run_agents, true,
          "Play with seeded random agents. Otherwise no player has an agent, "
          "and every decision takes the safe fallback.");
ABSL_FLAG(bool, log_events, true, "Mirror every game event to the log.");

namespace mafia {

void Run() {
  const string game_setup = absl::GetFlag(FLAGS_game_setup);
  CHECK(!game_setup.empty()) << "--game_setup should be a valid path";
  GameSetup setup;
  ReadProtoFromFile(game_setup, &setup);
  const int64_t seed = absl::GetFlag(FLAGS_seed);
  if (seed >= 0) {
    setup.set_seed(seed);
  }
  absl::StatusOr<GameState> state = GameState::FromSetup(setup);
  CHECK(state.ok()) << "Invalid game setup: " << state.status();

  unordered_map<string, unique_ptr<Agent>> agents;
  if (absl::GetFlag(FLAGS_dry_run_agents)) {
    int i = 0;
    for (const string& name : state->turn_order()) {
      agents[name] = std::make_unique<RandomAgent>(setup.seed() * 1009 + i++);
    }
  }
  AgentIoOptions io_options;
  if (setup.agent_max_attempts() > 0) {
    io_options.max_attempts = setup.agent_max_attempts();
  }
  if (setup.decision_timeout_ms() > 0) {
    io_options.decision_timeout =
        absl::Milliseconds(setup.decision_timeout_ms());
  }
  if (setup.response_timeout_ms() > 0) {
    io_options.response_timeout =
        absl::Milliseconds(setup.response_timeout_ms());
  }
  AgentIo io(std::move(agents), io_options);

  LoggingEventSink logging_sink;
  vector<EventSink*> sinks;
  if (absl::GetFlag(FLAGS_log_events)) {
    sinks.push_back(&logging_sink);
  }
  TeeEventSink sink(sinks);

  PhaseEngine engine(*std::move(state), &io, &sink);
  engine.Run();
  const GameState& g = engine.state();
  if (g.winner() != TEAM_UNSPECIFIED) {
    LOG(INFO) << "Winners: " << TeamName(g.winner());
  } else {
    LOG(WARNING) << "Game aborted: " << g.abort_reason();
  }
  const string output_game_log = absl::GetFlag(FLAGS_output_game_log);
  if (!output_game_log.empty()) {
    g.WriteToFile(output_game_log);
  }
}
}  // namespace mafia

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  mafia::Run();
  return 0;
}
