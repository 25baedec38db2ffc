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

#include <stdint.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "cvdr/common/libs/fs/shared_fd.h"
#include "cvdr/common/libs/utils/result.h"
#include "cvdr/host/libs/connection/ice_config.h"

/*
 * Boundary with the peer to peer layer. The session negotiation (signaling,
 * ICE and SDP) lives behind WebRtcService, the agent only ever sees the data
 * channel it produces.
 */
namespace cvdr {

class DataChannel {
 public:
  using MessageCallback = std::function<void(const uint8_t*, size_t)>;
  using CloseCallback = std::function<void()>;

  virtual ~DataChannel() = default;

  virtual Result<void> Send(const uint8_t* data, size_t size) = 0;
  // Safe to call more than once. No callback runs once Close() returns,
  // other than the close callback invoked by Close() itself.
  virtual void Close() = 0;

  // Callbacks run one at a time. Once a setter returns the previous callback
  // is not running and won't be invoked again, unless the setter was called
  // from within that same callback. Pass nullptr to stop receiving events.
  virtual void SetMessageCallback(MessageCallback callback) = 0;
  virtual void SetCloseCallback(CloseCallback callback) = 0;
};

/*
 * Receives the events of a connection. The callbacks may run on any thread,
 * including the one that called WebRtcService::ConnectWebRtc.
 */
class WebRtcObserver {
 public:
  virtual ~WebRtcObserver() = default;

  // The channel is open and ready to carry data.
  virtual void OnDataChannel(std::shared_ptr<DataChannel> data_channel) = 0;
  virtual void OnError(const std::string& message) = 0;
  virtual void OnFailure() = 0;
  virtual void OnClose() = 0;
};

class WebRtcConnection {
 public:
  virtual ~WebRtcConnection() = default;

  virtual void Close() = 0;
};

struct ConnectWebRtcOpts {
  std::optional<IceConfig> local_ice_config;
};

class WebRtcService {
 public:
  virtual ~WebRtcService() = default;

  // `log_file` receives the negotiation logs of the connection.
  virtual Result<std::unique_ptr<WebRtcConnection>> ConnectWebRtc(
      const std::string& host, const std::string& device,
      WebRtcObserver& observer, SharedFD log_file,
      const ConnectWebRtcOpts& opts) = 0;
};

}  // namespace cvdr
