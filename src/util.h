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

#include "google/protobuf/message.h"

namespace mafia {
using google::protobuf::Message;
using std::filesystem::path;

// Text proto file IO. Failures to open or parse a file are fatal.
void ReadProtoFromFile(const path& filename, Message* msg);
void WriteProtoToFile(const Message& msg, const path& filename);
}  // namespace mafia

#endif  // SRC_UTIL_H_
