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

#include "src/errors.h"

#include <string>

#include "absl/strings/cord.h"
#include "absl/types/optional.h"

namespace mafia {

namespace {
absl::StatusCode CanonicalCode(ErrorCode code) {
  switch (code) {
    case INVALID_TARGET:
    case INVALID_TARGET_COUNT:
      return absl::StatusCode::kInvalidArgument;
    case UNKNOWN_ABILITY:
      return absl::StatusCode::kNotFound;
    case INELIGIBLE_NOW:
    case ILLEGAL_PHASE_TRANSITION:
    case GAME_ALREADY_RESOLVED:
      return absl::StatusCode::kFailedPrecondition;
    default:
      return absl::StatusCode::kUnknown;
  }
}
}  // namespace

absl::Status GameError(ErrorCode code, absl::string_view message) {
  absl::Status status(CanonicalCode(code), message);
  status.SetPayload(kErrorCodeUrl, absl::Cord(ErrorCode_Name(code)));
  return status;
}

ErrorCode ErrorCodeOf(const absl::Status& status) {
  absl::optional<absl::Cord> payload = status.GetPayload(kErrorCodeUrl);
  ErrorCode code = ERROR_CODE_UNSPECIFIED;
  if (payload.has_value() && ErrorCode_Parse(std::string(*payload), &code)) {
    return code;
  }
  return ERROR_CODE_UNSPECIFIED;
}
}  // namespace mafia
