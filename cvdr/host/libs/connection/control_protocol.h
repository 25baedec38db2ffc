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

#include "cvdr/common/libs/fs/shared_fd.h"
#include "cvdr/common/libs/utils/result.h"
#include "cvdr/host/libs/connection/remote_cvd.h"

/*
 * Every connection agent listens on a SOCK_SEQPACKET unix socket in the
 * control directory. A client connects, sends one command and reads at most
 * one reply:
 *
 *   "version" -> the protocol version in decimal
 *   "status"  -> a JSON encoded StatusCmdRes
 *   "stop"    -> no reply, the agent shuts down
 *
 * Message boundaries are preserved by the socket type, there is no framing.
 */
namespace cvdr {

inline constexpr char kVersionCmd[] = "version";
inline constexpr char kStatusCmd[] = "status";
inline constexpr char kStopCmd[] = "stop";

inline constexpr int kControlProtocolVersion = 1;

// Derived from the locator alone so that two agents for the same device
// compete for the same path.
std::string ControlSocketName(const RemoteCvdLocator& cvd);

// Creators of the socket at `socket_path` hold a lock on this file. It is
// left in place when the socket goes away.
std::string ControlSocketLockPath(const std::string& socket_path);

// Creates a listening control socket at `path`, failing if a live agent
// already owns it. A stale socket left behind by a dead agent is replaced.
Result<SharedFD> CreateControlSocket(const std::string& path);

class ControlClient {
 public:
  virtual ~ControlClient() = default;

  virtual Result<int> Version(const std::string& socket_path) = 0;
  virtual Result<StatusCmdRes> Status(const std::string& socket_path) = 0;
  virtual Result<void> Stop(const std::string& socket_path) = 0;
};

class UnixControlClient : public ControlClient {
 public:
  UnixControlClient(
      std::chrono::milliseconds reply_timeout = std::chrono::seconds(5));

  Result<int> Version(const std::string& socket_path) override;
  Result<StatusCmdRes> Status(const std::string& socket_path) override;
  Result<void> Stop(const std::string& socket_path) override;

 private:
  Result<SharedFD> SendCommand(const std::string& socket_path,
                               const std::string& command);
  Result<std::string> ReadReply(SharedFD conn);

  std::chrono::milliseconds reply_timeout_;
};

}  // namespace cvdr
