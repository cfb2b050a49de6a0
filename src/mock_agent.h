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

#ifndef SRC_MOCK_AGENT_H_
#define SRC_MOCK_AGENT_H_

#include <memory>
#include <string>
#include <unordered_map>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "gmock/gmock.h"
#include "src/agent.h"

namespace mafia {

class MockAgent : public Agent {
 public:
  MOCK_METHOD(absl::StatusOr<string>, Decide,
              (const string& situation, absl::Span<const string> options),
              (override));
  MOCK_METHOD(absl::StatusOr<string>, Respond, (const string& situation),
              (override));
  MOCK_METHOD(void, Observe, (const Event& event), (override));
};

// Adds a nice mock agent for the player to agents, and returns it. The
// agents own the mock.
inline testing::NiceMock<MockAgent>* AddMockAgent(
    const string& player, unordered_map<string, unique_ptr<Agent>>* agents) {
  auto agent = std::make_unique<testing::NiceMock<MockAgent>>();
  testing::NiceMock<MockAgent>* result = agent.get();
  (*agents)[player] = std::move(agent);
  return result;
}

}  // namespace mafia

#endif  // SRC_MOCK_AGENT_H_
