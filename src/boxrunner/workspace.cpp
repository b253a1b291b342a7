#include <boxrunner/workspace.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <boxrunner/paths.h>
#include "utils.h"

bool CheckTemplate() {
  std::error_code ec;
  if (!fs::is_directory(kTemplateDir, ec)) {
    spdlog::error("Template directory {} not found", kTemplateDir.c_str());
    return false;
  }
  return true;
}

JobError StageWorkspace(const std::string& job_id, Workspace& ws) {
  ws.job_id = job_id;
  ws.path.clear();
  std::error_code ec;
  if (!fs::is_directory(kTemplateDir, ec)) {
    spdlog::error("Template directory {} vanished", kTemplateDir.c_str());
    return JobError::TEMPLATE_MISSING;
  }
  if (!CreateDirs(kWorkspaceRoot)) return JobError::WORKSPACE_ERROR;

  // mkdtemp picks a random name and creates it exclusively, so concurrent jobs never collide
  std::string tmpl = (kWorkspaceRoot / "ws-XXXXXX").string();
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("Failed creating workspace under {}: {}", kWorkspaceRoot.c_str(), strerror(errno));
    return JobError::WORKSPACE_ERROR;
  }
  fs::path path = fs::absolute(tmpl, ec);
  if (ec) path = tmpl;
  spdlog::debug("Staging workspace {} for job {}", path.c_str(), job_id);
  // the runtime may run as another user
  fs::permissions(path, fs::perms::all, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), ec.message());
    RemoveAll(path);
    return JobError::WORKSPACE_ERROR;
  }
  if (!CopyTree(kTemplateDir, path)) {
    RemoveAll(path);
    return JobError::WORKSPACE_ERROR;
  }
  ws.path = std::move(path);
  return JobError::OK;
}

JobError WriteCommands(const Workspace& ws, const std::vector<Command>& commands) {
  if (!ws.IsStaged()) return JobError::WORKSPACE_ERROR;
  std::string content = CommandsToJSON(commands).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (!WriteFile(WorkspaceCommands(ws.path), content)) return JobError::WORKSPACE_ERROR;
  return JobError::OK;
}

JobError ReadResult(const Workspace& ws, size_t expected_count, std::vector<CommandResult>& results) {
  if (!ws.IsStaged()) return JobError::WORKSPACE_ERROR;
  fs::path result_path = WorkspaceResults(ws.path);
  // the workspace is writable by the job; never follow a link it planted
  std::error_code ec;
  fs::file_status st = fs::symlink_status(result_path, ec);
  std::string content;
  if (ec || !fs::is_regular_file(st) || !ReadFile(result_path, content)) {
    spdlog::warn("Result file of job {} missing{}", ws.job_id,
                 fs::is_symlink(st) ? " (symbolic link refused)" : "");
    return JobError::RESULT_MISSING;
  }
  try {
    results = ResultsFromJSON(nlohmann::json::parse(content));
  } catch (nlohmann::json::exception& err) {
    spdlog::warn("Result file of job {} malformed: {}", ws.job_id, err.what());
    return JobError::RESULT_MALFORMED;
  } catch (std::invalid_argument& err) {
    spdlog::warn("Result file of job {} malformed: {}", ws.job_id, err.what());
    return JobError::RESULT_MALFORMED;
  }
  if (results.size() != expected_count) {
    spdlog::error("Isolation runtime returned {} results for {} commands (job {})",
                  results.size(), expected_count, ws.job_id);
    results.clear();
    return JobError::RESULT_MISMATCH;
  }
  return JobError::OK;
}

bool ReleaseWorkspace(Workspace& ws) {
  if (!ws.IsStaged()) return true;
  spdlog::debug("Releasing workspace {} of job {}", ws.path.c_str(), ws.job_id);
  bool ret = RemoveAll(ws.path);
  if (!ret) spdlog::error("Workspace {} of job {} leaked", ws.path.c_str(), ws.job_id);
  ws.path.clear();
  return ret;
}
