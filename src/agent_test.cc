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

#include "src/agent.h"

#include <future>
#include <memory>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/event_sink.h"
#include "src/mock_agent.h"

namespace mafia {
namespace {

using std::vector;
using testing::_;
using testing::Return;
using testing::Throw;

const vector<string> kOptions = {"Alice", "Bob", "skip"};

TEST(AgentIo, ReturnsValidChoice) {
  unordered_map<string, unique_ptr<Agent>> agents;
  auto* alice = AddMockAgent("Alice", &agents);
  EXPECT_CALL(*alice, Decide("Pick", _))
      .WillOnce(Return(absl::StatusOr<string>("Bob")));
  AgentIo io(std::move(agents), {});
  EXPECT_EQ(io.Decide("Alice", "Pick", kOptions), "Bob");
}

TEST(AgentIo, MatchesOptionsIgnoringCaseAndSpaces) {
  unordered_map<string, unique_ptr<Agent>> agents;
  auto* alice = AddMockAgent("Alice", &agents);
  EXPECT_CALL(*alice, Decide(_, _))
      .WillOnce(Return(absl::StatusOr<string>("  bob\n")));
  AgentIo io(std::move(agents), {});
  EXPECT_EQ(io.Decide("Alice", "Pick", kOptions), "Bob");
}

TEST(AgentIo, RetriesFailedCalls) {
  unordered_map<string, unique_ptr<Agent>> agents;
  auto* alice = AddMockAgent("Alice", &agents);
  EXPECT_CALL(*alice, Decide(_, _))
      .WillOnce(Return(absl::StatusOr<string>(
          absl::DeadlineExceededError("timed out"))))
      .WillOnce(Return(absl::StatusOr<string>("Alice")));
  AgentIo io(std::move(agents), {.max_attempts = 2});
  EXPECT_EQ(io.Decide("Alice", "Pick", kOptions), "Alice");
}

TEST(AgentIo, FallsBackAfterMaxAttempts) {
  unordered_map<string, unique_ptr<Agent>> agents;
  auto* alice = AddMockAgent("Alice", &agents);
  EXPECT_CALL(*alice, Decide(_, _))
      .Times(9)
      .WillRepeatedly(Return(absl::StatusOr<string>("Mallory")));
  AgentIo io(std::move(agents), {.max_attempts = 3});
  EXPECT_EQ(io.Decide("Alice", "Pick", kOptions), "skip");
  EXPECT_EQ(io.Decide("Alice", "Pick", {"Bob", "nobody"}), "nobody");
  EXPECT_EQ(io.Decide("Alice", "Pick", {"Bob", "Carol"}), "Bob");
}

TEST(AgentIo, TimeoutFallsBack) {
  unordered_map<string, unique_ptr<Agent>> agents;
  auto* alice = AddMockAgent("Alice", &agents);
  EXPECT_CALL(*alice, Decide(_, _))
      .WillRepeatedly(Return(absl::StatusOr<string>(
          absl::DeadlineExceededError("timed out"))));
  EXPECT_CALL(*alice, Respond(_))
      .WillRepeatedly(Return(absl::StatusOr<string>(
          absl::DeadlineExceededError("timed out"))));
  AgentIo io(std::move(agents), {});
  EXPECT_EQ(io.Decide("Alice", "Pick", kOptions), "skip");
  EXPECT_EQ(io.Respond("Alice", "Talk"), "SKIP");
}

TEST(AgentIo, UnknownPlayerGetsFallback) {
  AgentIo io({}, {});
  EXPECT_EQ(io.Decide("Zed", "Pick", kOptions), "skip");
  EXPECT_EQ(io.Decide("Zed", "Pick", {"Bob", "Carol"}), "Bob");
  EXPECT_EQ(io.Decide("Zed", "Pick", {}), "");
  EXPECT_EQ(io.Respond("Zed", "Talk"), "SKIP");
}

TEST(AgentIo, ThrowingAgentFallsBack) {
  unordered_map<string, unique_ptr<Agent>> agents;
  auto* alice = AddMockAgent("Alice", &agents);
  EXPECT_CALL(*alice, Decide(_, _))
      .Times(2)
      .WillRepeatedly(Throw(std::runtime_error("agent crashed")));
  EXPECT_CALL(*alice, Respond(_))
      .WillOnce(Throw(std::runtime_error("agent crashed")))
      .WillOnce(Return(absl::StatusOr<string>("Still here.")));
  AgentIo io(std::move(agents), {.max_attempts = 2});
  EXPECT_EQ(io.Decide("Alice", "Pick", kOptions), "skip");
  EXPECT_EQ(io.Respond("Alice", "Talk"), "Still here.");
}

TEST(AgentIo, ThrowingAgentFallsBackWithoutDeadline) {
  unordered_map<string, unique_ptr<Agent>> agents;
  auto* alice = AddMockAgent("Alice", &agents);
  EXPECT_CALL(*alice, Decide(_, _))
      .WillOnce(Throw(std::logic_error("bad state")))
      .WillOnce(Return(absl::StatusOr<string>("Bob")));
  AgentIo io(std::move(agents),
             {.decision_timeout = absl::InfiniteDuration(),
              .response_timeout = absl::InfiniteDuration()});
  EXPECT_EQ(io.Decide("Alice", "Pick", kOptions), "Bob");
}

// Blocks every call until released.
class StuckAgent : public Agent {
 public:
  explicit StuckAgent(std::shared_future<void> release)
      : release_(std::move(release)) {}
  absl::StatusOr<string> Decide(const string& situation,
                                absl::Span<const string> options) override {
    release_.wait();
    return options.front();
  }
  absl::StatusOr<string> Respond(const string& situation) override {
    release_.wait();
    return string("Too late.");
  }

 private:
  std::shared_future<void> release_;
};

TEST(AgentIo, SlowAgentMissesDeadline) {
  std::promise<void> release;
  unordered_map<string, unique_ptr<Agent>> agents;
  agents["Alice"] =
      std::make_unique<StuckAgent>(release.get_future().share());
  AgentIo io(std::move(agents),
             {.max_attempts = 2,
              .decision_timeout = absl::Milliseconds(20),
              .response_timeout = absl::Milliseconds(20)});
  EXPECT_EQ(io.Decide("Alice", "Pick", kOptions), "skip");
  EXPECT_EQ(io.Decide("Alice", "Pick", {"Bob", "Carol"}), "Bob");
  EXPECT_EQ(io.Respond("Alice", "Talk"), "SKIP");
  // The agent is still busy, so this does not block.
  io.Observe("Alice", NewPrivateEvent("Alice", "Your role is cop."));
  release.set_value();
}

TEST(AgentIo, RespondTrimsAndRetriesEmpty) {
  unordered_map<string, unique_ptr<Agent>> agents;
  auto* alice = AddMockAgent("Alice", &agents);
  EXPECT_CALL(*alice, Respond("Talk"))
      .WillOnce(Return(absl::StatusOr<string>("   ")))
      .WillOnce(Return(absl::StatusOr<string>(" I suspect Bob. \n")));
  AgentIo io(std::move(agents), {});
  EXPECT_EQ(io.Respond("Alice", "Talk"), "I suspect Bob.");
}

TEST(AgentIo, ObserveReachesOnlyThatPlayer) {
  unordered_map<string, unique_ptr<Agent>> agents;
  auto* alice = AddMockAgent("Alice", &agents);
  auto* bob = AddMockAgent("Bob", &agents);
  EXPECT_CALL(*alice, Observe(_)).Times(1);
  EXPECT_CALL(*bob, Observe(_)).Times(0);
  AgentIo io(std::move(agents), {});
  io.Observe("Alice", NewPrivateEvent("Alice", "Your role is cop."));
  io.Observe("Zed", NewPrivateEvent("Zed", "Nobody hears this."));
}

TEST(PickSafeFallback, PrefersSkipThenNobody) {
  EXPECT_EQ(PickSafeFallback({"A", "nobody", "skip"}), "skip");
  EXPECT_EQ(PickSafeFallback({"A", "Skip"}), "Skip");
  EXPECT_EQ(PickSafeFallback({"A", "nobody"}), "nobody");
  EXPECT_EQ(PickSafeFallback({"A", "B"}), "A");
  EXPECT_EQ(PickSafeFallback({}), "");
}

TEST(RandomAgent, SeededChoicesRepeat) {
  RandomAgent a(7), b(7);
  std::set<string> seen;
  for (int i = 0; i < 50; ++i) {
    absl::StatusOr<string> x = a.Decide("Pick", kOptions);
    absl::StatusOr<string> y = b.Decide("Pick", kOptions);
    ASSERT_TRUE(x.ok());
    ASSERT_TRUE(y.ok());
    EXPECT_EQ(*x, *y);
    seen.insert(*x);
  }
  EXPECT_THAT(seen, testing::IsSubsetOf(kOptions));
  EXPECT_FALSE(a.Decide("Pick", {}).ok());
  EXPECT_EQ(*a.Respond("Talk"), "SKIP");
}

}  // namespace
}  // namespace mafia
