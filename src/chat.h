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

#ifndef SRC_CHAT_H_
#define SRC_CHAT_H_

#include <map>
#include <set>
#include <string>
#include <vector>

#include "src/views.pb.h"

namespace mafia {

using std::map;
using std::set;
using std::string;
using std::vector;

constexpr char kGlobalChannel[] = "global";
constexpr char kModeratorAuthor[] = "Moderator";

// Channel ids.
string FactionChannel(const string& alignment);
string InboxChannel(const string& player);  // Player <-> moderator messages.
string PairChannel(const string& a, const string& b);  // Order independent.

enum class ChannelKind { GLOBAL, FACTION, INBOX, PAIR };

struct Channel {
  string id;
  ChannelKind kind = ChannelKind::GLOBAL;
  set<int> participants;  // Unused for the global channel.
  vector<ChatMessage> messages;

  // Global channel participants are all the players.
  bool IsParticipant(int player) const {
    return kind == ChannelKind::GLOBAL || participants.count(player) > 0;
  }
};

// The chat channels of a game. Channels are append only; message timestamps
// are their indices in the channel.
class ChatRegistry {
 public:
  ChatRegistry();

  void AddChannel(const string& id, ChannelKind kind,
                  const set<int>& participants);
  bool HasChannel(const string& id) const { return channels_.count(id) > 0; }
  // Returns nullptr for unknown channels.
  const Channel* Find(const string& id) const;
  void Post(const string& id, const string& author, const string& content);
  // Returns up to limit messages starting at index start.
  ChatPage Page(const string& id, int start, int limit) const;
  // In lexicographic order.
  vector<string> ChannelIds() const;

 private:
  map<string, Channel> channels_;
};
}  // namespace mafia

#endif  // SRC_CHAT_H_
