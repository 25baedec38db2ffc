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

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "cvdr/common/libs/fs/shared_fd.h"
#include "cvdr/common/libs/utils/result.h"
#include "cvdr/host/libs/connection/conn_logs.h"
#include "cvdr/host/libs/connection/forwarder.h"
#include "cvdr/host/libs/connection/ice_config.h"
#include "cvdr/host/libs/connection/remote_cvd.h"
#include "cvdr/host/libs/connection/webrtc_client.h"

namespace cvdr {

struct ConnectOptions {
  std::optional<IceConfig> ice_config;
  // How long to wait for the data channel to open, zero waits forever.
  std::chrono::seconds handshake_timeout{0};
};

/**
 * Owns the WebRTC connection to a device, the forwarder serving its ADB data
 * channel and the control socket other processes use to find and stop it.
 */
class ConnController : public WebRtcObserver {
 public:
  // Returns only once the data channel is open. The control socket is created
  // last, so a failed or interrupted creation leaves nothing discoverable
  // behind.
  static Result<std::unique_ptr<ConnController>> Create(
      const std::string& control_dir, WebRtcService& service,
      const RemoteCvdLocator& cvd, const ConnectOptions& opts);

  ~ConnController() override;

  void OnDataChannel(std::shared_ptr<DataChannel> data_channel) override;
  void OnError(const std::string& message) override;
  void OnFailure() override;
  void OnClose() override;

  // Serves control commands until Stop is called.
  void Run();
  void Stop();

  ConnStatus Status();
  int AdbPort() const;
  const RemoteCvdLocator& Cvd() const { return cvd_; }
  const std::string& LogFile() const { return log_.path; }
  const std::string& ControlSocketPath() const { return control_path_; }

  // Logs to the tunnel log file only, used once the standard streams are
  // gone.
  void LogToFileOnly();

 private:
  ConnController(const RemoteCvdLocator& cvd, ConnectionLog log,
                 std::unique_ptr<Forwarder> forwarder, SharedFD interrupt);

  void HandleControlCommand(SharedFD conn);
  void CloseConnection();

  const RemoteCvdLocator cvd_;
  ConnectionLog log_;
  std::unique_ptr<Forwarder> forwarder_;
  std::unique_ptr<WebRtcConnection> connection_;
  SharedFD control_;
  std::string control_path_;
  // Readable after Stop, ends the control loop.
  SharedFD interrupt_;
  std::atomic<bool> stopped_{false};
};

}  // namespace cvdr
