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

#include "cvdr/host/libs/connection/find_or_connect.h"

#include <utility>

#include <android-base/logging.h>

namespace cvdr {

Result<FindOrConnectResult> FindOrConnect(ConnectionRegistry& registry,
                                          const RemoteCvdLocator& cvd,
                                          WebRtcService& service,
                                          const ConnectOptions& opts) {
  FindOrConnectResult result;
  // Even with errors some connections may have been listed.
  auto listing = registry.ListByHost(cvd.host);
  result.listing_errors = std::move(listing.errors);
  auto it = listing.statuses.find(cvd);
  if (it != listing.statuses.end()) {
    result.status = it->second;
    return result;
  }

  auto controller =
      ConnController::Create(registry.ControlDir(), service, cvd, opts);
  if (!controller.ok()) {
    // Another agent may have been created for the same device in the meantime.
    auto again = registry.ListByHost(cvd.host);
    auto winner = again.statuses.find(cvd);
    if (winner != again.statuses.end()) {
      LOG(INFO) << "Using the connection to " << cvd
                << " created concurrently by another process";
      result.status = winner->second;
      return result;
    }
  }
  // This error is fatal, ignore any previous ones to avoid unnecessary noise.
  auto created = CVDR_EXPECT(std::move(controller),
                             "Failed to create connection controller");
  result.status = created->Status();
  result.controller = std::move(created);
  return result;
}

}  // namespace cvdr
