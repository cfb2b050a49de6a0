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

#ifndef SRC_AGENT_H_
#define SRC_AGENT_H_

#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "src/game_log.pb.h"

namespace mafia {

using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::unordered_map;

const char kSkip[] = "skip";
const char kNobody[] = "nobody";
const char kSkipResponse[] = "SKIP";

// The decision-making backend of one player. Calls may block for a long
// time or throw. The same agent is never called from two threads at once.
class Agent {
 public:
  virtual ~Agent() = default;
  // Should return one of the options.
  virtual absl::StatusOr<string> Decide(const string& situation,
                                        absl::Span<const string> options) = 0;
  // Free text.
  virtual absl::StatusOr<string> Respond(const string& situation) = 0;
  // Events the player gets to see.
  virtual void Observe(const Event& event) {}
};

// Picks uniformly at random and never talks. Deterministic given the seed.
class RandomAgent : public Agent {
 public:
  explicit RandomAgent(uint64_t seed) : rng_(seed) {}
  absl::StatusOr<string> Decide(const string& situation,
                                absl::Span<const string> options) override;
  absl::StatusOr<string> Respond(const string& situation) override {
    return string(kSkipResponse);
  }

 private:
  std::mt19937_64 rng_;
};

struct AgentIoOptions {
  int max_attempts = 2;
  // Per attempt. Must be positive; absl::InfiniteDuration() waits forever.
  absl::Duration decision_timeout = absl::Seconds(60);
  absl::Duration response_timeout = absl::Seconds(90);
};

// Wraps the agents with deadlines, retries and safe fallbacks, so that
// callers always get a usable answer. A call that throws or runs past its
// deadline counts as a failed attempt. A timed out call keeps running in
// the background, and holds the agent until it returns.
class AgentIo {
 public:
  AgentIo(unordered_map<string, unique_ptr<Agent>> agents,
          const AgentIoOptions& options);

  // Returns one of the options (matched case insensitively), or the safe
  // fallback after max_attempts failures. Empty options return "".
  string Decide(const string& actor, const string& situation,
                absl::Span<const string> options) const;
  // Returns a non-empty trimmed response, or "SKIP".
  string Respond(const string& actor, const string& situation) const;
  // Skipped when the agent is still busy with a timed out call.
  void Observe(const string& player, const Event& event) const;

 private:
  struct Slot {
    unique_ptr<Agent> agent;
    std::mutex mu;
  };
  using AgentCall = std::function<absl::StatusOr<string>(Agent*)>;

  shared_ptr<Slot> FindSlot(const string& player) const;
  static absl::StatusOr<string> CallWithDeadline(shared_ptr<Slot> slot,
                                                 absl::Duration timeout,
                                                 AgentCall call);

  unordered_map<string, shared_ptr<Slot>> agents_;
  AgentIoOptions options_;
};

// "skip" if offered, else "nobody" if offered, else the first option.
string PickSafeFallback(absl::Span<const string> options);

}  // namespace mafia

#endif  // SRC_AGENT_H_
