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

#include <memory>
#include <vector>

#include "cvdr/common/libs/utils/result.h"
#include "cvdr/host/libs/connection/conn_controller.h"
#include "cvdr/host/libs/connection/registry.h"
#include "cvdr/host/libs/connection/remote_cvd.h"
#include "cvdr/host/libs/connection/webrtc_client.h"

namespace cvdr {

struct FindOrConnectResult {
  ConnStatus status;
  // Only set when a new connection was created. The caller must eventually
  // call Run() or Stop() on it.
  std::unique_ptr<ConnController> controller;
  // Agents that couldn't be reached while looking for an existing connection.
  std::vector<StackTraceError> listing_errors;
};

/**
 * Reuses the connection to `cvd` if an agent already serves it, otherwise
 * connects to it.
 *
 * Looking for an existing connection and creating a new one is not atomic.
 * When another process wins the race the control socket can't be created, in
 * which case the winner's status is returned instead.
 */
Result<FindOrConnectResult> FindOrConnect(ConnectionRegistry& registry,
                                          const RemoteCvdLocator& cvd,
                                          WebRtcService& service,
                                          const ConnectOptions& opts);

}  // namespace cvdr
