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

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "cvdr/common/libs/fs/shared_fd.h"
#include "cvdr/common/libs/utils/result.h"
#include "cvdr/host/libs/connection/remote_cvd.h"
#include "cvdr/host/libs/connection/webrtc_client.h"

namespace cvdr {

enum class FwdState : int {
  kInitializing = 0,
  kReady,
  kConnected,
  kStopped,
  kFailed,
};

std::string FwdStateToString(FwdState state);

/**
 * Forwards bytes between a local TCP listener and a data channel.
 *
 * The listener is bound on creation, but connections are only accepted after
 * the data channel opens. One TCP peer is served at a time, the next one is
 * accepted when the current peer disconnects:
 *
 *   initializing -> ready -> connected -> ready -> ...
 *
 * stopped and failed can be reached from any state and are final.
 */
class Forwarder {
 public:
  // Binds an ephemeral port on the loopback interface.
  static Result<std::unique_ptr<Forwarder>> Create();

  ~Forwarder();

  // Called once the data channel is open. Starts accepting TCP peers.
  void OnDataChannel(std::shared_ptr<DataChannel> data_channel);

  // Writes to the currently attached TCP peer.
  Result<void> Send(const uint8_t* data, size_t size);

  // `state` must be kStopped or kFailed.
  void StopForwarding(FwdState state);

  ForwarderState State();
  int Port() const { return port_; }

  // Blocks until the data channel opens or forwarding stops. A zero timeout
  // waits forever.
  Result<void> WaitForReady(std::chrono::seconds timeout);

 private:
  Forwarder(SharedFD listener, int port, SharedFD interrupt);

  // Sets the state to `new_state` only if it was `old_state`. Returns whether
  // the swap happened along with the state found.
  std::pair<bool, FwdState> CompareAndSwapState(FwdState old_state,
                                                FwdState new_state);
  bool SetConnection(SharedFD conn);
  std::shared_ptr<DataChannel> CurrentDataChannel();

  void AcceptLoop();
  void RecvLoop(SharedFD conn);

  SharedFD listener_;
  const int port_;
  // Readable once forwarding stops, wakes up the accept and receive loops.
  SharedFD interrupt_;

  std::mutex state_mtx_;
  std::condition_variable state_cv_;
  FwdState state_ = FwdState::kInitializing;
  std::shared_ptr<DataChannel> data_channel_;
  SharedFD conn_;

  std::thread accept_thread_;
};

}  // namespace cvdr
