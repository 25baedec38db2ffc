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

#include "cvdr/common/libs/utils/result.h"

namespace cvdr {

inline constexpr int kDefaultAdbServerPort = 5037;

// Attaches tunnels to the local ADB server so they show up in `adb devices`.
class AdbServerProxy {
 public:
  virtual ~AdbServerProxy() = default;

  virtual Result<void> Connect(int port) = 0;
  virtual Result<void> Disconnect(int port) = 0;
};

class AdbServerProxyImpl : public AdbServerProxy {
 public:
  AdbServerProxyImpl(int server_port = kDefaultAdbServerPort);

  Result<void> Connect(int port) override;
  Result<void> Disconnect(int port) override;

 private:
  Result<void> SendMsg(const std::string& msg);

  int server_port_;
};

// Frames a host service request: four hex digits of length, then the payload.
std::string FormatAdbHostMessage(const std::string& msg);

}  // namespace cvdr
