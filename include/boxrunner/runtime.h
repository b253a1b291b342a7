#ifndef INCLUDE_BOXRUNNER_RUNTIME_H_
#define INCLUDE_BOXRUNNER_RUNTIME_H_

#include <string>
#include <vector>
#include <unordered_map>

#include "paths.h"
#include "errors.h"
#include "workspace.h"

// Command line of the isolation runtime; each whitespace-separated token may
//   contain {workspace}, {image} and {entry}
extern std::string kRuntimeCommand;
// Entry point inside the baseline template, relative to the workspace
extern std::string kRuntimeEntry;
// profile -> image reference
extern std::unordered_map<std::string, std::string> kProfileImages;
// pass an unmapped profile to the runtime as the image reference itself
extern bool kAllowUnlistedProfiles;

struct RuntimeReport {
  int pid;
  int exit_status; // -1 if killed by a signal
  int term_signal;
  std::string output; // stdout & stderr of the runtime, truncated

  RuntimeReport() : pid(-1), exit_status(-1), term_signal(0) {}
};

// return false if the profile has no image and unlisted profiles are disallowed
bool ResolveImage(const std::string& profile, std::string& image);
// Expand kRuntimeCommand for a workspace; empty if the template has a bad placeholder
std::vector<std::string> RuntimeArgv(const fs::path& workspace, const std::string& image);

// Block until the isolation runtime exits. Its exit status is reported but not
//   interpreted; the command outcomes come from the result file.
JobError ExecuteIsolation(const Workspace& ws, const std::string& profile, RuntimeReport* report = nullptr);

#endif  // INCLUDE_BOXRUNNER_RUNTIME_H_
