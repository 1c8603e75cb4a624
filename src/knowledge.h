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

#ifndef SRC_KNOWLEDGE_H_
#define SRC_KNOWLEDGE_H_

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace mafia {

using std::map;
using std::pair;
using std::string;

// What a player learned about another player. Empty fields are unknown.
struct Fact {
  string alignment;
  string role;

  bool Empty() const { return alignment.empty() && role.empty(); }
  bool Complete() const { return !alignment.empty() && !role.empty(); }
  static Fact Alignment(const string& alignment) {
    return {.alignment = alignment};
  }
  static Fact Role(const string& role) { return {.role = role}; }
};

bool operator==(const Fact& l, const Fact& r);

// Per-player knowledge of other players' identities. Knowledge only grows:
// a learned field is never cleared nor overwritten.
class Knowledge {
 public:
  void Learn(int observer, int subject, const Fact& fact);
  std::optional<Fact> Knows(int observer, int subject) const;

 private:
  map<pair<int, int>, Fact> facts_;
};
}  // namespace mafia

#endif  // SRC_KNOWLEDGE_H_
