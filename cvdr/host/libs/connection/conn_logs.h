//
// Copyright (C) 2024 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "cvdr/common/libs/fs/shared_fd.h"
#include "cvdr/common/libs/utils/result.h"
#include "cvdr/host/libs/connection/remote_cvd.h"

namespace cvdr {

std::string LogsDir(const std::string& control_dir);

struct ConnectionLog {
  std::string path;
  SharedFD fd;
};

// Creates {logs dir}/{unix time}_{host}_{device}.log. Never reuses an existing
// file, a numbered name is picked when that one is taken.
Result<ConnectionLog> CreateConnectionLog(const std::string& control_dir,
                                          const RemoteCvdLocator& cvd);

struct LogCleanup {
  int removed = 0;
  std::vector<StackTraceError> errors;
};

// Removes the logs not modified within `inactive_time`. Failures on
// individual files are collected in the returned errors. A non-positive
// `inactive_time` keeps every log.
Result<LogCleanup> MaybeCleanOldLogs(const std::string& control_dir,
                                     std::chrono::seconds inactive_time);

}  // namespace cvdr
