#include "utils.h"

#include <fstream>
#include <boxrunner/paths.h>
#include <boxrunner/runtime.h>
#include <boxrunner/dispatcher.h>

fs::path kTestRoot;

void SetupTemplate(const fs::path& dir) {
  fs::create_directories(dir / "lib");
  {
    std::ofstream fout(dir / "sandbox");
    fout << "#!/bin/sh\nexit 0\n";
  }
  fs::permissions(dir / "sandbox", fs::perms::owner_all, fs::perm_options::add);
  std::ofstream fout(dir / "lib" / "data.txt");
  fout << "baseline\n";
}

size_t CountEntries(const fs::path& dir) {
  std::error_code ec;
  size_t ret = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); ++it) ret++;
  return ret;
}

Command MakeCommand(const std::string& command, const std::vector<std::string>& args, const std::string& input) {
  Command cmd;
  cmd.command = command;
  cmd.args = args;
  cmd.input = input;
  cmd.budget.time_limit = 1;
  cmd.budget.time_reserved = 1;
  cmd.budget.memory_limit = 256000;
  cmd.budget.memory_reserved = 4096000;
  return cmd;
}

Job MakeJob(const std::string& submit_id, const std::string& profile, size_t num_commands) {
  Job job;
  job.submit_id = submit_id;
  job.profile = profile;
  for (size_t i = 0; i < num_commands; i++) {
    job.commands.push_back(MakeCommand("step" + std::to_string(i), {"--index", std::to_string(i)}));
  }
  return job;
}

std::string MakeJobBody(const std::string& submit_id, const std::string& profile, size_t num_commands) {
  return JobToJSON(MakeJob(submit_id, profile, num_commands)).dump();
}

bool RecordingPublisher::Publish(const JobResult& result) {
  if (fail) return false;
  std::lock_guard lck(mtx_);
  results_.push_back(result);
  return true;
}

size_t RecordingPublisher::Count() {
  std::lock_guard lck(mtx_);
  return results_.size();
}

std::vector<JobResult> RecordingPublisher::Results() {
  std::lock_guard lck(mtx_);
  return results_;
}

const JobResult* RecordingPublisher::Find(const std::string& submit_id) {
  std::lock_guard lck(mtx_);
  for (auto& i : results_) {
    if (i.submit_id == submit_id) return &i;
  }
  return nullptr;
}

void RunnerTest::SetUp() {
  const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
  workspace_root = kTestRoot / "workspaces" / (std::string(info->test_suite_name()) + "." + info->name());
  fs::create_directories(workspace_root);
  kWorkspaceRoot = workspace_root;
  kTemplateDir = kTestRoot / "template";
  kRuntimeCommand = (internal::kDataDir / "fake-runtime").string() + " {workspace} {image}";
  kProfileImages.clear();
  kAllowUnlistedProfiles = true;
  kMaxParallel = 0;
}

void RunnerTest::TearDown() {
  if (workspace_root.empty()) return; // skipped before setup
  fs::remove_all(workspace_root);
}
