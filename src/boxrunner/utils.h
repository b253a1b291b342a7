#ifndef BOXRUNNER_UTILS_H_
#define BOXRUNNER_UTILS_H_

#include <string>
#include <filesystem>

#include <boxrunner/errors.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// copy the contents of directory from into the existing directory to, recursively
bool CopyTree(const fs::path& from, const fs::path& to);
bool WriteFile(const fs::path&, const std::string& content);
// return false if the file does not exist or cannot be read
bool ReadFile(const fs::path&, std::string& content);

// close every fd >= minfd; used in forked children before exec
int CloseFrom(int minfd);

#endif  // BOXRUNNER_UTILS_H_
