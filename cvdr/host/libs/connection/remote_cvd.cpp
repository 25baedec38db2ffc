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

#include "cvdr/host/libs/connection/remote_cvd.h"

#include <string>
#include <tuple>

#include "cvdr/common/libs/utils/json.h"

namespace cvdr {

bool RemoteCvdLocator::operator==(const RemoteCvdLocator& other) const {
  return std::tie(service_root_endpoint, host, webrtc_device_id) ==
         std::tie(other.service_root_endpoint, other.host,
                  other.webrtc_device_id);
}

bool RemoteCvdLocator::operator!=(const RemoteCvdLocator& other) const {
  return !(*this == other);
}

bool RemoteCvdLocator::operator<(const RemoteCvdLocator& other) const {
  return std::tie(service_root_endpoint, host, webrtc_device_id) <
         std::tie(other.service_root_endpoint, other.host,
                  other.webrtc_device_id);
}

std::ostream& operator<<(std::ostream& out, const RemoteCvdLocator& cvd) {
  return out << cvd.host << "/" << cvd.webrtc_device_id;
}

Json::Value ToJson(const RemoteCvdLocator& cvd) {
  Json::Value value(Json::objectValue);
  value["service_root_endpoint"] = cvd.service_root_endpoint;
  value["host"] = cvd.host;
  value["webrtc_device_id"] = cvd.webrtc_device_id;
  return value;
}

Json::Value ToJson(const ForwarderState& state) {
  Json::Value value(Json::objectValue);
  value["port"] = state.port;
  value["state"] = state.state;
  return value;
}

Json::Value ToJson(const ConnStatus& status) {
  Json::Value value(Json::objectValue);
  value["adb"] = ToJson(status.adb);
  return value;
}

Json::Value ToJson(const StatusCmdRes& res) {
  Json::Value value(Json::objectValue);
  value["cvd"] = ToJson(res.cvd);
  value["status"] = ToJson(res.status);
  return value;
}

Result<RemoteCvdLocator> RemoteCvdLocatorFromJson(const Json::Value& value) {
  RemoteCvdLocator cvd;
  cvd.service_root_endpoint =
      CVDR_EXPECT(GetValue<std::string>(value, {"service_root_endpoint"}));
  cvd.host = CVDR_EXPECT(GetValue<std::string>(value, {"host"}));
  cvd.webrtc_device_id =
      CVDR_EXPECT(GetValue<std::string>(value, {"webrtc_device_id"}));
  return cvd;
}

Result<ForwarderState> ForwarderStateFromJson(const Json::Value& value) {
  ForwarderState state;
  state.port = CVDR_EXPECT(GetValue<int>(value, {"port"}));
  state.state = CVDR_EXPECT(GetValue<std::string>(value, {"state"}));
  return state;
}

Result<ConnStatus> ConnStatusFromJson(const Json::Value& value) {
  CVDR_EXPECT(HasValue(value, {"adb"}), "Missing \"adb\" status");
  ConnStatus status;
  status.adb = CVDR_EXPECT(ForwarderStateFromJson(value["adb"]),
                           "Invalid \"adb\" status");
  return status;
}

Result<StatusCmdRes> StatusCmdResFromJson(const Json::Value& value) {
  CVDR_EXPECT(HasValue(value, {"cvd"}), "Missing \"cvd\" member");
  CVDR_EXPECT(HasValue(value, {"status"}), "Missing \"status\" member");
  StatusCmdRes res;
  res.cvd = CVDR_EXPECT(RemoteCvdLocatorFromJson(value["cvd"]));
  res.status = CVDR_EXPECT(ConnStatusFromJson(value["status"]));
  return res;
}

}  // namespace cvdr
