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

#ifndef SRC_GAME_TIME_H_
#define SRC_GAME_TIME_H_

#include <iostream>
#include <string>

#include "absl/strings/str_format.h"
#include "src/game_log.pb.h"

namespace mafia {

using std::ostream;
using std::string;

// In-game current time. Day x is followed by Night x, which is followed by
// Day x + 1, etc.
struct Time {
  bool is_day = true;
  int count = 0;
  bool Initialized() const { return count > 0; }
  Phase phase() const { return is_day ? DAY : NIGHT; }
  operator string() const {
    return absl::StrFormat("%s_%d", is_day ? "day" : "night", count);
  }
  Time operator+(int n) const {
    if (n < 0) {
      return *this - (-n);
    }
    const int index = Index() + n;
    return {.is_day = index % 2 == 0, .count = index / 2};
  }
  Time operator-(int n) const {
    if (n < 0) {
      return *this + (-n);
    }
    const int index = Index() - n;
    if (index < 0) {
      return Time();
    }
    return {.is_day = index % 2 == 0, .count = index / 2};
  }
  Time& operator+=(int n) { return (*this = (*this + n)); }
  Time& operator-=(int n) { return (*this = (*this - n)); }
  Time& operator++() { return (*this += 1); }
  Time& operator--() { return (*this -= 1); }
  static Time Day(int day) { return {.is_day = true, .count = day}; }
  static Time Night(int night) { return {.is_day = false, .count = night}; }
  static Time FromProto(const GameTime& pb) {
    return {.is_day = pb.phase() != NIGHT, .count = pb.day()};
  }
  GameTime ToProto() const {
    GameTime pb;
    pb.set_phase(phase());
    pb.set_day(count);
    return pb;
  }

 private:
  int Index() const { return 2 * count + (is_day ? 0 : 1); }
};

ostream& operator<<(ostream& os, const Time& t);
bool operator<(const Time& l, const Time& r);
bool operator>(const Time& l, const Time& r);
bool operator<=(const Time& l, const Time& r);
bool operator>=(const Time& l, const Time& r);
bool operator==(const Time& l, const Time& r);
bool operator!=(const Time& l, const Time& r);
}  // namespace mafia

#endif  // SRC_GAME_TIME_H_
