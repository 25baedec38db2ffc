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

#include <json/json.h>

#include "cvdr/common/libs/utils/result.h"

namespace cvdr {

struct ConnectionConfig {
  std::string connection_control_dir = "~/.cvdr/connections";
  // Non-positive values keep the logs forever.
  int keep_log_files_days = 30;
  // Zero waits forever for the data channel.
  int handshake_timeout_seconds = 60;

  Result<std::string> ControlDirExpanded() const;
  std::chrono::seconds LogFilesDeleteThreshold() const;
  std::chrono::seconds HandshakeTimeout() const;
};

// Overrides the members of `config` present in `json`. Unknown members are
// an error.
Result<void> MergeConnectionConfig(const Json::Value& json,
                                   ConnectionConfig* config);

// Later files take precedence over earlier ones.
Result<ConnectionConfig> LoadConnectionConfig(
    const std::vector<std::string>& paths);

}  // namespace cvdr
