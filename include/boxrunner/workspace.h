#ifndef INCLUDE_BOXRUNNER_WORKSPACE_H_
#define INCLUDE_BOXRUNNER_WORKSPACE_H_

#include <string>
#include <vector>
#include <filesystem>

#include "errors.h"
#include "job.h"

class Workspace {
 public:
  std::string job_id; // for logging only
  std::filesystem::path path; // empty if never staged or already released

  bool IsStaged() const { return !path.empty(); }
};

// Check the baseline template once at startup; a missing template is a configuration error
bool CheckTemplate();

// Create a uniquely named directory under kWorkspaceRoot and copy the template into it.
// On failure nothing is left on disk and ws stays unstaged.
JobError StageWorkspace(const std::string& job_id, Workspace& ws);
JobError WriteCommands(const Workspace& ws, const std::vector<Command>& commands);
// expected_count is the number of commands written; any other count is RESULT_MISMATCH
JobError ReadResult(const Workspace& ws, size_t expected_count, std::vector<CommandResult>& results);
// Idempotent; releasing an unstaged workspace does nothing
bool ReleaseWorkspace(Workspace& ws);

class ScopedWorkspace { // RAII release
  Workspace ws_;
 public:
  ScopedWorkspace() {}
  ScopedWorkspace(const ScopedWorkspace&) = delete;
  ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;
  ~ScopedWorkspace() { ReleaseWorkspace(ws_); }

  Workspace& Get() { return ws_; }
  const Workspace& Get() const { return ws_; }
};

#endif  // INCLUDE_BOXRUNNER_WORKSPACE_H_
