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
#pragma once

#include <sys/stat.h>
#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

#include "cvdr/common/libs/utils/result.h"

namespace cvdr {

bool FileExists(const std::string& path, bool follow_symlinks = true);
bool DirectoryExists(const std::string& path, bool follow_symlinks = true);
bool IsSocket(const std::string& path);

Result<void> EnsureDirectoryExists(const std::string& directory_path,
                                   mode_t mode = S_IRWXU | S_IRGRP | S_IXGRP |
                                                 S_IROTH | S_IXOTH);
// Entry names excluding "." and "..".
Result<std::vector<std::string>> DirectoryContents(const std::string& path);

Result<void> RemoveFile(const std::string& file);
Result<std::chrono::system_clock::time_point> FileModificationTime(
    const std::string& path);

// Replaces a leading "~" with the value of $HOME.
Result<std::string> ExpandPath(const std::string& path);

std::string cpp_dirname(const std::string& str);

}  // namespace cvdr
