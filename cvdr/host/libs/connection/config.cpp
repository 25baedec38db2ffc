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

#include "cvdr/host/libs/connection/config.h"

#include <chrono>
#include <string>
#include <vector>

#include <android-base/logging.h>

#include "cvdr/common/libs/utils/files.h"
#include "cvdr/common/libs/utils/json.h"

namespace cvdr {
namespace {

constexpr char kControlDirKey[] = "connection_control_dir";
constexpr char kKeepLogsKey[] = "keep_log_files_days";
constexpr char kHandshakeTimeoutKey[] = "handshake_timeout_seconds";

}  // namespace

Result<std::string> ConnectionConfig::ControlDirExpanded() const {
  return CVDR_EXPECT(ExpandPath(connection_control_dir));
}

std::chrono::seconds ConnectionConfig::LogFilesDeleteThreshold() const {
  return std::chrono::hours(24) * keep_log_files_days;
}

std::chrono::seconds ConnectionConfig::HandshakeTimeout() const {
  return std::chrono::seconds(handshake_timeout_seconds);
}

Result<void> MergeConnectionConfig(const Json::Value& json,
                                   ConnectionConfig* config) {
  const std::vector<std::string> known = {kControlDirKey, kKeepLogsKey,
                                          kHandshakeTimeoutKey};
  CVDR_EXPECT(ExpectOnlyMembers(json, known));
  if (json.isMember(kControlDirKey)) {
    config->connection_control_dir =
        CVDR_EXPECT(GetValue<std::string>(json, {kControlDirKey}));
    CVDR_EXPECT(!config->connection_control_dir.empty(),
                kControlDirKey << " can't be empty");
  }
  if (json.isMember(kKeepLogsKey)) {
    config->keep_log_files_days =
        CVDR_EXPECT(GetValue<int>(json, {kKeepLogsKey}));
  }
  if (json.isMember(kHandshakeTimeoutKey)) {
    config->handshake_timeout_seconds =
        CVDR_EXPECT(GetValue<int>(json, {kHandshakeTimeoutKey}));
    CVDR_EXPECT_GE(config->handshake_timeout_seconds, 0,
                   kHandshakeTimeoutKey << " can't be negative");
  }
  return {};
}

Result<ConnectionConfig> LoadConnectionConfig(
    const std::vector<std::string>& paths) {
  ConnectionConfig config;
  for (const auto& path : paths) {
    LOG(DEBUG) << "Loading configuration from " << path;
    auto json = CVDR_EXPECT(LoadFromFile(path));
    CVDR_EXPECTF(MergeConnectionConfig(json, &config),
                 "Invalid configuration in \"{}\"", path);
  }
  return config;
}

}  // namespace cvdr
