#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <vector>
#include <string>
#include <filesystem>

#include <gtest/gtest.h>
#include <boxrunner/job.h>
#include <boxrunner/publisher.h>

namespace fs = std::filesystem;

// per-process scratch directory; holds the template and the workspace roots
extern fs::path kTestRoot;

// template layout: sandbox (executable entry point) and lib/data.txt
void SetupTemplate(const fs::path& dir);
size_t CountEntries(const fs::path& dir);

Command MakeCommand(const std::string& command, const std::vector<std::string>& args = {},
                    const std::string& input = "");
Job MakeJob(const std::string& submit_id, const std::string& profile, size_t num_commands);
std::string MakeJobBody(const std::string& submit_id, const std::string& profile, size_t num_commands);

class RecordingPublisher : public Publisher {
  std::mutex mtx_;
  std::vector<JobResult> results_;
 public:
  bool fail; // report every publish as failed

  RecordingPublisher() : fail(false) {}
  bool Publish(const JobResult& result) override;

  size_t Count();
  std::vector<JobResult> Results();
  // nullptr if absent; the pointer is invalidated by the next Publish
  const JobResult* Find(const std::string& submit_id);
};

// Points the runner at the fake runtime and a fresh workspace root for each test
class RunnerTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  fs::path workspace_root;
};

#endif // TEST_UTILS_H_
