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

#include "src/game_time.h"

namespace mafia {

ostream& operator<<(ostream& os, const Time& t) {
  os << string(t);
  return os;
}
bool operator<(const Time& l, const Time& r) {
  return l.count < r.count || (l.count == r.count && l.is_day && !r.is_day);
}
bool operator>(const Time& l, const Time& r) { return r < l; }
bool operator<=(const Time& l, const Time& r) { return !(r < l); }
bool operator>=(const Time& l, const Time& r) { return !(l < r); }
bool operator==(const Time& l, const Time& r) {
  return l.is_day == r.is_day && l.count == r.count;
}
bool operator!=(const Time& l, const Time& r) { return !(l == r); }
}  // namespace mafia
