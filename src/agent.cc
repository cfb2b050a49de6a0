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

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <thread>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"

namespace mafia {

using std::vector;

absl::StatusOr<string> RandomAgent::Decide(
    const string& situation, absl::Span<const string> options) {
  if (options.empty()) {
    return absl::InvalidArgumentError("Nothing to decide between");
  }
  std::uniform_int_distribution<size_t> pick(0, options.size() - 1);
  return options[pick(rng_)];
}

AgentIo::AgentIo(unordered_map<string, unique_ptr<Agent>> agents,
                 const AgentIoOptions& options)
    : options_(options) {
  CHECK_GE(options_.max_attempts, 1);
  CHECK_GT(options_.decision_timeout, absl::ZeroDuration());
  CHECK_GT(options_.response_timeout, absl::ZeroDuration());
  for (auto& [player, agent] : agents) {
    auto slot = std::make_shared<Slot>();
    slot->agent = std::move(agent);
    agents_[player] = std::move(slot);
  }
}

shared_ptr<AgentIo::Slot> AgentIo::FindSlot(const string& player) const {
  const auto it = agents_.find(player);
  return it == agents_.end() ? nullptr : it->second;
}

absl::StatusOr<string> AgentIo::CallWithDeadline(shared_ptr<Slot> slot,
                                                 absl::Duration timeout,
                                                 AgentCall call) {
  // The slot is shared with the task, so a call that outlives its deadline
  // (or this AgentIo) still has a live agent.
  auto run = [slot, call = std::move(call)]() -> absl::StatusOr<string> {
    std::lock_guard<std::mutex> lock(slot->mu);
    return call(slot->agent.get());
  };
  try {
    if (timeout == absl::InfiniteDuration()) {
      return run();
    }
    std::packaged_task<absl::StatusOr<string>()> task(std::move(run));
    std::future<absl::StatusOr<string>> result = task.get_future();
    std::thread(std::move(task)).detach();
    if (result.wait_for(absl::ToChronoNanoseconds(timeout)) !=
        std::future_status::ready) {
      return absl::DeadlineExceededError(
          absl::StrCat("No answer within ", absl::FormatDuration(timeout)));
    }
    return result.get();
  } catch (const std::exception& e) {
    return absl::UnknownError(absl::StrCat("Agent threw: ", e.what()));
  }
}

string AgentIo::Decide(const string& actor, const string& situation,
                       absl::Span<const string> options) const {
  if (options.empty()) {
    return "";
  }
  shared_ptr<Slot> slot = FindSlot(actor);
  if (slot == nullptr) {
    return PickSafeFallback(options);
  }
  const vector<string> offered(options.begin(), options.end());
  for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    absl::StatusOr<string> choice = CallWithDeadline(
        slot, options_.decision_timeout,
        [situation, offered](Agent* agent) {
          return agent->Decide(situation, offered);
        });
    absl::Status status = choice.status();
    if (choice.ok()) {
      const string trimmed(absl::StripAsciiWhitespace(*choice));
      const auto exact = std::find(options.begin(), options.end(), *choice);
      if (exact != options.end()) {
        return *exact;
      }
      for (const string& option : options) {
        if (absl::EqualsIgnoreCase(option, trimmed)) {
          return option;
        }
      }
      status = absl::InvalidArgumentError("Invalid choice \"" + *choice + "\"");
    }
    LOG(WARNING) << actor << " decision failed (attempt " << attempt << "/"
                 << options_.max_attempts << "): " << status;
  }
  return PickSafeFallback(options);
}

string AgentIo::Respond(const string& actor, const string& situation) const {
  shared_ptr<Slot> slot = FindSlot(actor);
  if (slot == nullptr) {
    return kSkipResponse;
  }
  for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    absl::StatusOr<string> text = CallWithDeadline(
        slot, options_.response_timeout,
        [situation](Agent* agent) { return agent->Respond(situation); });
    absl::Status status = text.status();
    if (text.ok()) {
      const string trimmed(absl::StripAsciiWhitespace(*text));
      if (!trimmed.empty()) {
        return trimmed;
      }
      status = absl::InvalidArgumentError("Empty response");
    }
    LOG(WARNING) << actor << " response failed (attempt " << attempt << "/"
                 << options_.max_attempts << "): " << status;
  }
  return kSkipResponse;
}

void AgentIo::Observe(const string& player, const Event& event) const {
  shared_ptr<Slot> slot = FindSlot(player);
  if (slot == nullptr) {
    return;
  }
  std::unique_lock<std::mutex> lock(slot->mu, std::try_to_lock);
  if (!lock.owns_lock()) {
    LOG(WARNING) << player << " is busy, dropping event: "
                 << event.content();
    return;
  }
  try {
    slot->agent->Observe(event);
  } catch (const std::exception& e) {
    LOG(WARNING) << player << " failed to observe an event: " << e.what();
  }
}

string PickSafeFallback(absl::Span<const string> options) {
  for (const char* preferred : {kSkip, kNobody}) {
    for (const string& option : options) {
      if (absl::EqualsIgnoreCase(option, preferred)) {
        return option;
      }
    }
  }
  return options.empty() ? "" : options.front();
}

}  // namespace mafia
