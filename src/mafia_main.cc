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

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "ortools/base/logging.h"
#include "src/catalog.h"
#include "src/game_store.h"
#include "src/util.h"
#include "src/views.pb.h"

using std::cout;
using std::endl;
using std::filesystem::path;
using std::string;
using std::vector;

// All files below are in text proto format.
ABSL_FLAG(string, game_script, "", "Game script file path.");
ABSL_FLAG(string, output_log, "", "Optional game log output file.");
ABSL_FLAG(string, viewer, "",
          "Player whose final overview is printed; the moderator if empty.");

namespace mafia {

template <typename T>
void Print(const absl::StatusOr<T>& result) {
  if (result.ok()) {
    cout << result->DebugString();
  } else {
    cout << "Error: " << result.status() << endl;
  }
}

void Print(const absl::Status& status) {
  cout << (status.ok() ? "OK" : absl::StrCat("Error: ", status.ToString()))
       << endl;
}

void RunStep(GameStore* store, const string& id, const ScriptStep& step) {
  const Viewer& viewer = step.viewer();
  switch (step.request_case()) {
    case ScriptStep::kQueue:
      Print(store->QueueAbility(id, viewer, step.queue()));
      break;
    case ScriptStep::kDequeue:
      Print(store->DequeueAbility(id, viewer, step.dequeue()));
      break;
    case ScriptStep::kUpdate:
      Print(store->UpdateGame(id, viewer, step.update()));
      break;
    case ScriptStep::kVote:
      Print(store->CastVote(id, viewer, step.vote()));
      break;
    case ScriptStep::kUnvote:
      Print(store->Unvote(id, viewer, step.unvote()));
      break;
    case ScriptStep::kPost:
      Print(store->PostChat(id, viewer, step.post().channel(),
                            step.post().content()));
      break;
    case ScriptStep::kReadChat:
      Print(store->ReadChat(id, viewer, step.read_chat(), 0, 0));
      break;
    case ScriptStep::kListAbilities:
      Print(store->ListAbilities(id, viewer, viewer.player()));
      break;
    case ScriptStep::kOverview:
      Print(store->Overview(id, viewer));
      break;
    default:
      LOG(WARNING) << "Skipping an empty script step";
  }
}

void Run() {
  path game_script = absl::GetFlag(FLAGS_game_script);
  CHECK(!game_script.empty()) << "Set --game_script to a valid path";
  GameScript script;
  ReadProtoFromFile(game_script, &script);

  GameStore store(DefaultCatalog());
  absl::StatusOr<string> id = store.CreateGame(script.setup());
  if (!id.ok()) {
    cout << "Error: " << id.status() << endl;
    return;
  }
  for (int i = 0; i < script.steps_size(); ++i) {
    cout << "Step " << i << ":\n";
    RunStep(&store, *id, script.steps(i));
  }

  Viewer moderator;
  moderator.set_level(Viewer::MODERATOR);
  Viewer final_viewer = moderator;
  const string player = absl::GetFlag(FLAGS_viewer);
  if (!player.empty()) {
    final_viewer.set_level(Viewer::PLAYER);
    final_viewer.set_player(player);
  }
  cout << "Final overview:\n";
  Print(store.Overview(*id, final_viewer));
  absl::StatusOr<vector<ResolutionRecord>> records =
      store.ResolutionLog(*id, moderator);
  CHECK(records.ok()) << records.status();
  cout << "Resolution log:\n";
  for (const ResolutionRecord& r : *records) {
    cout << r.ShortDebugString() << endl;
  }

  path output_log = absl::GetFlag(FLAGS_output_log);
  if (!output_log.empty()) {
    absl::StatusOr<GameLog> log = store.ExportLog(*id, moderator);
    CHECK(log.ok()) << log.status();
    WriteProtoToFile(*log, output_log);
    cout << "Game log written to " << output_log << endl;
  }
}
}  // namespace mafia

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  mafia::Run();
  return 0;
}
