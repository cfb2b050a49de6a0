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

#ifndef SRC_UTIL_H_
#define SRC_UTIL_H_

#include <filesystem>
#include <string>

#include "absl/status/status.h"
#include "google/protobuf/message.h"

namespace mafia {
using google::protobuf::Message;
using std::filesystem::path;
using std::string;

// Text format proto files.
void ReadProtoFromFile(const path& filename, Message* msg);
void WriteProtoToFile(const Message& msg, const path& filename);

// Parses a text format proto, e.g. an agent-authored plan. Unlike the file
// helpers this does not crash on bad input.
absl::Status ParseTextProto(const string& text, Message* msg);

// Returns the contents of the outermost {...} block of text, or the whole
// text if it has no braces.
string OutermostBraces(const string& text);
}  // namespace mafia

#endif  // SRC_UTIL_H_
