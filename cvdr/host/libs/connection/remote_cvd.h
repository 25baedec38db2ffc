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

#include <ostream>
#include <string>

#include <json/json.h>

#include "cvdr/common/libs/utils/result.h"

namespace cvdr {

// Identifies the device a tunnel is connected to.
struct RemoteCvdLocator {
  std::string service_root_endpoint;
  std::string host;
  std::string webrtc_device_id;

  bool operator==(const RemoteCvdLocator& other) const;
  bool operator!=(const RemoteCvdLocator& other) const;
  bool operator<(const RemoteCvdLocator& other) const;
};

std::ostream& operator<<(std::ostream& out, const RemoteCvdLocator& cvd);

struct ForwarderState {
  // Assigned when the local listener is bound, never changes afterwards.
  int port = 0;
  std::string state;

  bool operator==(const ForwarderState& other) const {
    return port == other.port && state == other.state;
  }
};

struct ConnStatus {
  ForwarderState adb;
};

// Reply to the control socket's status command.
struct StatusCmdRes {
  RemoteCvdLocator cvd;
  ConnStatus status;
};

Json::Value ToJson(const RemoteCvdLocator& cvd);
Json::Value ToJson(const ForwarderState& state);
Json::Value ToJson(const ConnStatus& status);
Json::Value ToJson(const StatusCmdRes& res);

Result<RemoteCvdLocator> RemoteCvdLocatorFromJson(const Json::Value& value);
Result<ForwarderState> ForwarderStateFromJson(const Json::Value& value);
Result<ConnStatus> ConnStatusFromJson(const Json::Value& value);
Result<StatusCmdRes> StatusCmdResFromJson(const Json::Value& value);

}  // namespace cvdr
