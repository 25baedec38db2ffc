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

#include "cvdr/common/libs/utils/result.h"
#include "cvdr/host/libs/connection/conn_controller.h"
#include "cvdr/host/libs/connection/registry.h"
#include "cvdr/host/libs/connection/remote_cvd.h"
#include "cvdr/host/libs/connection/webrtc_client.h"

namespace cvdr {

/**
 * Connects to `cvd` from a detached background process.
 *
 * The agent process runs FindOrConnect and reports the outcome back before
 * closing its standard streams and serving the control protocol until it's
 * stopped. When the connection already existed the agent just reports its
 * status and exits.
 *
 * Returns the status of the connection, or the error that prevented the
 * agent from establishing it. Nothing is left running in the background when
 * an error is returned.
 */
Result<ConnStatus> SpawnConnectionAgent(ConnectionRegistry& registry,
                                        const RemoteCvdLocator& cvd,
                                        WebRtcService& service,
                                        const ConnectOptions& opts);

}  // namespace cvdr
