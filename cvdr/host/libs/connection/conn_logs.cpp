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

#include "cvdr/host/libs/connection/conn_logs.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>

#include <chrono>
#include <string>

#include <android-base/strings.h>
#include <fmt/format.h>

#include "cvdr/common/libs/utils/files.h"

namespace cvdr {
namespace {

constexpr int kMaxLogNameAttempts = 100;

}  // namespace

std::string LogsDir(const std::string& control_dir) {
  return control_dir + "/logs";
}

Result<ConnectionLog> CreateConnectionLog(const std::string& control_dir,
                                          const RemoteCvdLocator& cvd) {
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch());
  // The name looks like 123456_us-central1-c_cf-12345-12345_cvd-1.log
  auto base = fmt::format("{}/{}_{}_{}", LogsDir(control_dir), now.count(),
                          cvd.host, cvd.webrtc_device_id);
  ConnectionLog log;
  for (int attempt = 0; attempt < kMaxLogNameAttempts; attempt++) {
    // Connections to the same device started within the same second get a
    // numbered name: 123456_host_cvd-1.1.log
    log.path = attempt == 0 ? base + ".log"
                            : fmt::format("{}.{}.log", base, attempt);
    log.fd = SharedFD::Open(log.path, O_CREAT | O_EXCL | O_WRONLY | O_APPEND,
                            S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP);
    if (log.fd->IsOpen()) {
      return log;
    }
    CVDR_EXPECT(log.fd->GetErrno() == EEXIST,
                "Failed to create log file \"" << log.path
                                               << "\": " << log.fd->StrError());
  }
  return CVDR_ERRF("No free log file name for \"{}\" after {} attempts",
                   base, kMaxLogNameAttempts);
}

Result<LogCleanup> MaybeCleanOldLogs(const std::string& control_dir,
                                     std::chrono::seconds inactive_time) {
  LogCleanup cleanup;
  if (inactive_time.count() <= 0) {
    return cleanup;
  }
  auto logs_dir = LogsDir(control_dir);
  auto entries =
      CVDR_EXPECT(DirectoryContents(logs_dir), "Failed to read logs dir");
  auto now = std::chrono::system_clock::now();
  for (const auto& entry : entries) {
    if (!android::base::EndsWith(entry, ".log")) {
      continue;
    }
    auto path = logs_dir + "/" + entry;
    auto mtime = FileModificationTime(path);
    if (!mtime.ok()) {
      cleanup.errors.push_back(mtime.error());
      continue;
    }
    if (now - *mtime <= inactive_time) {
      continue;
    }
    auto removed = RemoveFile(path);
    if (!removed.ok()) {
      cleanup.errors.push_back(removed.error());
      continue;
    }
    cleanup.removed++;
  }
  return cleanup;
}

}  // namespace cvdr
