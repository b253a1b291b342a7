#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;

#define X(...) X_RETURN_ARG1(JobError, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* JobErrorName, JobError, ENUM_JOB_ERROR_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool CopyTree(const fs::path& from, const fs::path& to) {
  spdlog::debug("Copy tree {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  // permissions are kept so that the entry point stays executable
  fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (fout) fout << content;
  if (fout) fout.close();
  if (!fout) {
    spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, std::string& content) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  std::stringstream ss;
  ss << fin.rdbuf();
  if (fin.bad()) return false;
  content = ss.str();
  return true;
}
