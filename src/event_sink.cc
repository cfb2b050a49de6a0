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

#include "src/event_sink.h"

#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"

namespace mafia {

void LoggingEventSink::Emit(const Event& event) {
  LOG(INFO) << EventDebugString(event);
}

Event NewEvent(EventKind kind, Visibility visibility, const string& actor,
               const string& content) {
  Event e;
  e.set_kind(kind);
  e.set_visibility(visibility);
  e.set_actor(actor);
  e.set_content(content);
  return e;
}

Event NewPublicEvent(EventKind kind, const string& content) {
  return NewEvent(kind, PUBLIC, "", content);
}

Event NewPrivateEvent(const string& player, const string& content) {
  return NewEvent(SYSTEM, PRIVATE, player, content);
}

Event NewFactionEvent(EventKind kind, const string& actor,
                      const string& content) {
  return NewEvent(kind, FACTION, actor, content);
}

string EventDebugString(const Event& event) {
  const string time = absl::StrFormat(
      "%s %d", absl::AsciiStrToLower(Phase_Name(event.phase())),
      event.round());
  const string who = event.actor().empty() ? "" : " " + event.actor();
  const string scope =
      event.visibility() == PUBLIC ? "" :
      absl::StrFormat(" (%s)",
                      absl::AsciiStrToLower(Visibility_Name(
                          event.visibility())));
  return absl::StrFormat("[%s] %s%s%s: %s", time,
                         EventKind_Name(event.kind()), scope, who,
                         event.content());
}

}  // namespace mafia
