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

#include <string>
#include <vector>

#include <json/json.h>

#include "cvdr/common/libs/utils/result.h"

namespace cvdr {

struct IceServer {
  std::vector<std::string> urls;
  std::string username;
  std::string credential;
};

// Caller supplied ICE servers, used instead of the ones offered by the host.
struct IceConfig {
  std::vector<IceServer> ice_servers;
};

Json::Value ToJson(const IceConfig& config);
Result<IceConfig> IceConfigFromJson(const Json::Value& value);

// Reads a file shaped like {"config": {"ice_servers": [...]}}.
Result<IceConfig> LoadIceConfigFromFile(const std::string& path);

}  // namespace cvdr
