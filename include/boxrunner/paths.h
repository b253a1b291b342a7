#ifndef INCLUDE_BOXRUNNER_PATHS_H_
#define INCLUDE_BOXRUNNER_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// parent of all job workspaces
extern fs::path kWorkspaceRoot;
// baseline runtime image copied into every workspace
extern fs::path kTemplateDir;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

extern const char kCommandsFile[];
extern const char kResultsFile[];

fs::path WorkspaceCommands(const fs::path& workspace);
fs::path WorkspaceResults(const fs::path& workspace);

#endif  // INCLUDE_BOXRUNNER_PATHS_H_
