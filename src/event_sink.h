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

#ifndef SRC_EVENT_SINK_H_
#define SRC_EVENT_SINK_H_

#include <string>
#include <vector>

#include "src/game_log.pb.h"

namespace mafia {

using std::string;
using std::vector;

// Receives every structured game event, in order. Only called from the
// phase engine's control flow.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void Emit(const Event& event) = 0;
};

// Appends events to a GameLog proto.
class GameLogSink : public EventSink {
 public:
  explicit GameLogSink(GameLog* log) : log_(log) {}
  void Emit(const Event& event) override { *log_->add_events() = event; }

 private:
  GameLog* log_;  // Not owned.
};

// Mirrors events to the operational log.
class LoggingEventSink : public EventSink {
 public:
  void Emit(const Event& event) override;
};

// Forwards every event to each of the sinks.
class TeeEventSink : public EventSink {
 public:
  explicit TeeEventSink(vector<EventSink*> sinks) : sinks_(sinks) {}
  void Emit(const Event& event) override {
    for (EventSink* sink : sinks_) {
      sink->Emit(event);
    }
  }

 private:
  vector<EventSink*> sinks_;  // Not owned.
};

// Syntactic sugar for building events.
Event NewEvent(EventKind kind, Visibility visibility, const string& actor,
               const string& content);
Event NewPublicEvent(EventKind kind, const string& content);
Event NewPrivateEvent(const string& player, const string& content);
Event NewFactionEvent(EventKind kind, const string& actor,
                      const string& content);

// One line, e.g. "[night 2] DEATH Bob: has died. Their role was cop."
string EventDebugString(const Event& event);

}  // namespace mafia

#endif  // SRC_EVENT_SINK_H_
