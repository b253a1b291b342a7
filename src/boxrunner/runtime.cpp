#include <boxrunner/runtime.h>

#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <sstream>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "utils.h"

std::string kRuntimeCommand = "docker run --rm -v {workspace}:/sandbox -w /sandbox {image} {entry}";
std::string kRuntimeEntry = "./sandbox";
std::unordered_map<std::string, std::string> kProfileImages;
bool kAllowUnlistedProfiles = true;

namespace {

constexpr size_t kMaxRuntimeOutput = 64 * 1024;
constexpr int kErrorFd = 3;

/// child
// Report errno to the parent through the close-on-exec pipe; never returns
[[noreturn]] void ChildDie(int err_fd) {
  int err = errno;
  IGNORE_RETURN(write(err_fd, &err, sizeof(err)));
  _exit(127);
}

[[noreturn]] void RuntimeChild(char* const* argv, int out_fd, int err_fd) {
  int devnull = open("/dev/null", O_RDONLY);
  if (devnull < 0 || dup2(devnull, 0) < 0) ChildDie(err_fd);
  if (dup2(out_fd, 1) < 0 || dup2(out_fd, 2) < 0) ChildDie(err_fd);
  if (err_fd != kErrorFd) {
    if (dup2(err_fd, kErrorFd) < 0) ChildDie(err_fd);
    err_fd = kErrorFd;
  }
  if (fcntl(err_fd, F_SETFD, FD_CLOEXEC) < 0) ChildDie(err_fd);
  // other jobs' pipes must not stay open in this process, or their readers never see EOF
  CloseFrom(kErrorFd + 1);
  execvp(argv[0], argv);
  ChildDie(err_fd);
}

/// parent
void ReadAll(int fd, std::string& output) {
  char buf[4096];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    // keep draining even when the buffer is full, so the runtime never blocks on a full pipe
    if (output.size() < kMaxRuntimeOutput) {
      output.append(buf, std::min((size_t)n, kMaxRuntimeOutput - output.size()));
    }
  }
}

} // namespace

bool ResolveImage(const std::string& profile, std::string& image) {
  if (auto it = kProfileImages.find(profile); it != kProfileImages.end()) {
    image = it->second;
    return true;
  }
  if (!kAllowUnlistedProfiles) return false;
  image = profile;
  return true;
}

std::vector<std::string> RuntimeArgv(const fs::path& workspace, const std::string& image) {
  std::vector<std::string> ret;
  std::istringstream iss(kRuntimeCommand);
  try {
    for (std::string token; iss >> token;) {
      ret.push_back(fmt::format(fmt::runtime(token),
                                fmt::arg("workspace", workspace.string()),
                                fmt::arg("image", image),
                                fmt::arg("entry", kRuntimeEntry)));
    }
  } catch (fmt::format_error& err) {
    spdlog::error("Invalid runtime command \"{}\": {}", kRuntimeCommand, err.what());
    ret.clear();
  }
  return ret;
}

JobError ExecuteIsolation(const Workspace& ws, const std::string& profile, RuntimeReport* report) {
  RuntimeReport local_report;
  RuntimeReport& rep = report ? *report : local_report;
  if (!ws.IsStaged()) return JobError::WORKSPACE_ERROR;

  std::string image;
  if (!ResolveImage(profile, image)) {
    spdlog::error("No isolation image for profile {} (job {})", profile, ws.job_id);
    return JobError::RUNTIME_INVOCATION_ERROR;
  }
  std::vector<std::string> args = RuntimeArgv(ws.path, image);
  if (args.empty()) return JobError::RUNTIME_INVOCATION_ERROR;
  // build argv before forking; the child should not allocate
  std::vector<char*> argv;
  for (auto& i : args) argv.push_back(i.data());
  argv.push_back(nullptr);

  int outpipe[2], errpipe[2];
  if (pipe2(outpipe, O_CLOEXEC) < 0) goto err;
  if (pipe2(errpipe, O_CLOEXEC) < 0) {
    close(outpipe[0]);
    close(outpipe[1]);
    goto err;
  }
  spdlog::debug("Running isolation runtime for job {}: {}", ws.job_id, fmt::format("{}", args));
  rep.pid = fork();
  if (rep.pid < 0) {
    close(outpipe[0]);
    close(outpipe[1]);
    close(errpipe[0]);
    close(errpipe[1]);
    goto err;
  }
  if (rep.pid == 0) RuntimeChild(argv.data(), outpipe[1], errpipe[1]);
  {
    close(outpipe[1]);
    close(errpipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
      n = read(errpipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(errpipe[0]);
    ReadAll(outpipe[0], rep.output);
    close(outpipe[0]);
    int status = 0;
    while (waitpid(rep.pid, &status, 0) < 0 && errno == EINTR);

    if (n == sizeof(child_errno)) {
      spdlog::error("Failed launching isolation runtime {} for job {}: {}",
                    args[0], ws.job_id, strerror(child_errno));
      return JobError::RUNTIME_INVOCATION_ERROR;
    }
    if (WIFEXITED(status)) {
      rep.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      rep.term_signal = WTERMSIG(status);
    }
    if (rep.exit_status == 0) {
      spdlog::info("Isolation runtime finished: job={} pid={}", ws.job_id, rep.pid);
      spdlog::debug("Runtime output of job {}: {}", ws.job_id, rep.output);
    } else {
      spdlog::warn("Isolation runtime exited abnormally: job={} pid={} status={} signal={} output={}",
                   ws.job_id, rep.pid, rep.exit_status, rep.term_signal, rep.output);
    }
  }
  return JobError::OK;
err:
  spdlog::error("Failed starting isolation runtime for job {}: {}", ws.job_id, strerror(errno));
  return JobError::RUNTIME_INVOCATION_ERROR;
}
