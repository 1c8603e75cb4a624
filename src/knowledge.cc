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

#include "src/knowledge.h"

#include "ortools/base/logging.h"

namespace mafia {

bool operator==(const Fact& l, const Fact& r) {
  return l.alignment == r.alignment && l.role == r.role;
}

void Knowledge::Learn(int observer, int subject, const Fact& fact) {
  CHECK_GE(observer, 0);
  CHECK_GE(subject, 0);
  if (observer == subject || fact.Empty()) {
    return;
  }
  Fact& known = facts_[{observer, subject}];
  if (known.alignment.empty()) {
    known.alignment = fact.alignment;
  }
  if (known.role.empty()) {
    known.role = fact.role;
  }
}

std::optional<Fact> Knowledge::Knows(int observer, int subject) const {
  const auto it = facts_.find({observer, subject});
  if (it == facts_.end()) {
    return std::nullopt;
  }
  return it->second;
}
}  // namespace mafia
