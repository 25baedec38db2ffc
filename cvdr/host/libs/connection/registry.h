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

#include <map>
#include <string>
#include <vector>

#include "cvdr/common/libs/utils/result.h"
#include "cvdr/host/libs/connection/control_protocol.h"
#include "cvdr/host/libs/connection/remote_cvd.h"

namespace cvdr {

// Creates the control directory and its logs subdirectory.
Result<void> EnsureConnDirsExist(const std::string& control_dir);

struct ConnectionListing {
  std::map<RemoteCvdLocator, ConnStatus> statuses;
  // One entry per agent that couldn't be reached. Non-empty errors don't
  // invalidate the statuses gathered from the other agents.
  std::vector<StackTraceError> errors;
};

/**
 * The set of connection agents running on this machine, discovered through
 * the control sockets in a directory.
 */
class ConnectionRegistry {
 public:
  ConnectionRegistry(const std::string& control_dir, ControlClient& client);

  const std::string& ControlDir() const { return control_dir_; }
  ControlClient& Client() { return client_; }

  std::string ControlSocketPath(const RemoteCvdLocator& cvd) const;

  ConnectionListing List();
  ConnectionListing ListByHost(const std::string& host);

  // Asks the agent serving `cvd` to stop.
  Result<void> Disconnect(const RemoteCvdLocator& cvd);

 private:
  std::string control_dir_;
  ControlClient& client_;
};

}  // namespace cvdr
