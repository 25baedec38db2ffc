/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "cvdr/common/libs/utils/files.h"

#include <dirent.h>
#include <libgen.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <android-base/logging.h>

namespace cvdr {

bool FileExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  return (follow_symlinks ? stat : lstat)(path.c_str(), &st) == 0;
}

bool DirectoryExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  if ((follow_symlinks ? stat : lstat)(path.c_str(), &st) == -1) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

bool IsSocket(const std::string& path) {
  struct stat st {};
  if (lstat(path.c_str(), &st) == -1) {
    return false;
  }
  return S_ISSOCK(st.st_mode);
}

std::string cpp_dirname(const std::string& str) {
  std::unique_ptr<char, decltype(&free)> copy(strdup(str.c_str()), &free);
  return dirname(copy.get());
}

Result<void> EnsureDirectoryExists(const std::string& directory_path,
                                   mode_t mode) {
  if (DirectoryExists(directory_path)) {
    return {};
  }
  const auto parent_dir = cpp_dirname(directory_path);
  if (parent_dir.size() > 1 && parent_dir != directory_path) {
    CVDR_EXPECT(EnsureDirectoryExists(parent_dir, mode));
  }
  LOG(DEBUG) << "Setting up " << directory_path;
  if (mkdir(directory_path.c_str(), mode) < 0 && errno != EEXIST) {
    return CVDR_ERRNO("Failed to create directory \"" << directory_path
                                                      << "\"");
  }
  return {};
}

Result<std::vector<std::string>> DirectoryContents(const std::string& path) {
  std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(path.c_str()), closedir);
  CVDR_EXPECT(dir != nullptr,
              "Could not read from dir \"" << path << "\": " << strerror(errno));
  std::vector<std::string> ret;
  struct dirent* ent{};
  while ((ent = readdir(dir.get()))) {
    std::string name = ent->d_name;
    if (name == "." || name == "..") {
      continue;
    }
    ret.push_back(name);
  }
  return ret;
}

Result<void> RemoveFile(const std::string& file) {
  LOG(DEBUG) << "Removing file " << file;
  if (remove(file.c_str()) != 0) {
    return CVDR_ERRNO("Failed to remove \"" << file << "\"");
  }
  return {};
}

Result<std::chrono::system_clock::time_point> FileModificationTime(
    const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) {
    return CVDR_ERRNO("stat(\"" << path << "\") failed");
  }
  std::chrono::seconds seconds(st.st_mtim.tv_sec);
  std::chrono::nanoseconds nanos(st.st_mtim.tv_nsec);
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(seconds +
                                                                      nanos));
}

Result<std::string> ExpandPath(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  CVDR_EXPECT(path.size() == 1 || path[1] == '/',
              "Can't expand \"" << path << "\", only \"~/\" is supported");
  const char* home = getenv("HOME");
  CVDR_EXPECT(home != nullptr && home[0] != '\0',
              "Can't expand \"" << path << "\": $HOME is not set");
  return std::string(home) + path.substr(1);
}

}  // namespace cvdr
