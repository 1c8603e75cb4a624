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

#ifndef SRC_ERRORS_H_
#define SRC_ERRORS_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "src/game_log.pb.h"

namespace mafia {

// Status payload key under which the game ErrorCode name is attached.
constexpr char kErrorCodeUrl[] = "type.googleapis.com/mafia.ErrorCode";

// Builds a status of the canonical code matching the game error code, with
// the code attached as a payload.
absl::Status GameError(ErrorCode code, absl::string_view message);

// Returns the game error code of the status, or ERROR_CODE_UNSPECIFIED if the
// status is OK or was not produced by GameError.
ErrorCode ErrorCodeOf(const absl::Status& status);

inline absl::Status InvalidTarget(absl::string_view message) {
  return GameError(INVALID_TARGET, message);
}
inline absl::Status InvalidTargetCount(absl::string_view message) {
  return GameError(INVALID_TARGET_COUNT, message);
}
inline absl::Status IneligibleNow(absl::string_view message) {
  return GameError(INELIGIBLE_NOW, message);
}
inline absl::Status UnknownAbility(absl::string_view message) {
  return GameError(UNKNOWN_ABILITY, message);
}
inline absl::Status IllegalPhaseTransition(absl::string_view message) {
  return GameError(ILLEGAL_PHASE_TRANSITION, message);
}
inline absl::Status GameAlreadyResolved(absl::string_view message) {
  return GameError(GAME_ALREADY_RESOLVED, message);
}
}  // namespace mafia

#endif  // SRC_ERRORS_H_
