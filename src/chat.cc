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

#include "src/chat.h"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"

namespace mafia {

string FactionChannel(const string& alignment) {
  return absl::StrCat("faction:", alignment);
}

string InboxChannel(const string& player) {
  return absl::StrCat("private:", player);
}

string PairChannel(const string& a, const string& b) {
  return a < b ? absl::StrCat("private:", a, ":", b)
               : absl::StrCat("private:", b, ":", a);
}

ChatRegistry::ChatRegistry() {
  AddChannel(kGlobalChannel, ChannelKind::GLOBAL, {});
}

void ChatRegistry::AddChannel(const string& id, ChannelKind kind,
                              const set<int>& participants) {
  CHECK(!HasChannel(id)) << "Duplicate channel " << id;
  Channel& c = channels_[id];
  c.id = id;
  c.kind = kind;
  c.participants = participants;
}

const Channel* ChatRegistry::Find(const string& id) const {
  const auto it = channels_.find(id);
  return it == channels_.end() ? nullptr : &it->second;
}

void ChatRegistry::Post(const string& id, const string& author,
                        const string& content) {
  auto it = channels_.find(id);
  CHECK(it != channels_.end()) << "Unknown channel " << id;
  vector<ChatMessage>& messages = it->second.messages;
  ChatMessage m;
  m.set_author(author);
  m.set_timestamp(messages.size());
  m.set_content(content);
  messages.push_back(m);
}

ChatPage ChatRegistry::Page(const string& id, int start, int limit) const {
  const Channel* c = Find(id);
  CHECK(c != nullptr) << "Unknown channel " << id;
  ChatPage page;
  page.set_channel(id);
  page.set_start(start);
  page.set_total(c->messages.size());
  const int size = c->messages.size();
  const int first = std::clamp(start, 0, size);
  const int end = first + std::clamp(limit, 0, size - first);
  for (int i = first; i < end; ++i) {
    *page.add_messages() = c->messages[i];
  }
  return page;
}

vector<string> ChatRegistry::ChannelIds() const {
  vector<string> ids;
  for (const auto& it : channels_) {
    ids.push_back(it.first);
  }
  return ids;
}
}  // namespace mafia
