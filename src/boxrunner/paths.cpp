#include <boxrunner/paths.h>

fs::path kWorkspaceRoot = "/tmp/boxrunner";
fs::path kTemplateDir = "sandbox";

namespace internal {
fs::path kDataDir = fs::path(BOXRUNNER_DATA_DIR);
} // internal

const char kCommandsFile[] = "commands.json";
const char kResultsFile[] = "results.json";

fs::path WorkspaceCommands(const fs::path& workspace) {
  return workspace / kCommandsFile;
}

fs::path WorkspaceResults(const fs::path& workspace) {
  return workspace / kResultsFile;
}
