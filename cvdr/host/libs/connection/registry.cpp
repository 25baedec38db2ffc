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

#include "cvdr/host/libs/connection/registry.h"

#include <sys/stat.h>

#include <map>
#include <string>
#include <vector>

#include <android-base/logging.h>

#include "cvdr/common/libs/utils/files.h"
#include "cvdr/host/libs/connection/conn_logs.h"

namespace cvdr {

Result<void> EnsureConnDirsExist(const std::string& control_dir) {
  constexpr mode_t kDirMode =
      S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH;  // 0755
  CVDR_EXPECTF(EnsureDirectoryExists(control_dir, kDirMode),
               "Failed to create directory {}", control_dir);
  CVDR_EXPECT(EnsureDirectoryExists(LogsDir(control_dir), kDirMode),
              "Failed to create logs directory");
  return {};
}

ConnectionRegistry::ConnectionRegistry(const std::string& control_dir,
                                       ControlClient& client)
    : control_dir_(control_dir), client_(client) {}

std::string ConnectionRegistry::ControlSocketPath(
    const RemoteCvdLocator& cvd) const {
  return control_dir_ + "/" + ControlSocketName(cvd);
}

ConnectionListing ConnectionRegistry::List() {
  ConnectionListing listing;
  auto entries = DirectoryContents(control_dir_);
  if (!entries.ok()) {
    listing.errors.push_back(entries.error());
    return listing;
  }
  for (const auto& entry : *entries) {
    auto path = control_dir_ + "/" + entry;
    if (!IsSocket(path)) {
      // Skip non socket files in the control directory.
      continue;
    }
    auto res = client_.Status(path);
    if (!res.ok()) {
      LOG(DEBUG) << "Failed to get status from " << path << ": "
                 << res.error().Message();
      listing.errors.push_back(res.error());
      continue;
    }
    listing.statuses[res->cvd] = res->status;
  }
  return listing;
}

ConnectionListing ConnectionRegistry::ListByHost(const std::string& host) {
  auto listing = List();
  for (auto it = listing.statuses.begin(); it != listing.statuses.end();) {
    if (it->first.host != host) {
      it = listing.statuses.erase(it);
    } else {
      ++it;
    }
  }
  return listing;
}

Result<void> ConnectionRegistry::Disconnect(const RemoteCvdLocator& cvd) {
  CVDR_EXPECT(client_.Stop(ControlSocketPath(cvd)),
              "Failed to stop " << cvd << "'s agent");
  return {};
}

}  // namespace cvdr
