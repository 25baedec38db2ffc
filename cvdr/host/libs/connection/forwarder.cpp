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

#include "cvdr/host/libs/connection/forwarder.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>

#include <vector>

#include <android-base/logging.h>

#include "cvdr/common/libs/fs/shared_buf.h"

namespace cvdr {
namespace {

constexpr size_t kRecvBufferSize = 4096;
// Never a valid state, used to read the state through CompareAndSwapState.
constexpr FwdState kNoState = static_cast<FwdState>(-1);

bool IsTerminal(FwdState state) {
  return state == FwdState::kStopped || state == FwdState::kFailed;
}

}  // namespace

std::string FwdStateToString(FwdState state) {
  switch (state) {
    case FwdState::kInitializing:
      return "initializing";
    case FwdState::kReady:
      return "ready";
    case FwdState::kConnected:
      return "connected";
    case FwdState::kStopped:
      return "stopped";
    case FwdState::kFailed:
      return "failed";
  }
  return "unknown";
}

Result<std::unique_ptr<Forwarder>> Forwarder::Create() {
  // Bind the local socket before attempting to connect over WebRTC
  auto listener = SharedFD::SocketLocalServer(0, SOCK_STREAM);
  CVDR_EXPECT(listener->IsOpen(),
              "Failed to bind local TCP port: " << listener->StrError());
  struct sockaddr_in addr {};
  socklen_t addr_len = sizeof(addr);
  CVDR_EXPECT(listener->GetSockName(reinterpret_cast<sockaddr*>(&addr),
                                    &addr_len) == 0,
              "getsockname failed: " << listener->StrError());
  auto interrupt = SharedFD::Event(0, EFD_CLOEXEC);
  CVDR_EXPECT(interrupt->IsOpen(),
              "Failed to create eventfd: " << interrupt->StrError());
  return std::unique_ptr<Forwarder>(
      new Forwarder(listener, ntohs(addr.sin_port), interrupt));
}

Forwarder::Forwarder(SharedFD listener, int port, SharedFD interrupt)
    : listener_(listener), port_(port), interrupt_(interrupt) {}

Forwarder::~Forwarder() {
  StopForwarding(FwdState::kStopped);
  std::thread accept_thread;
  {
    std::lock_guard<std::mutex> lock(state_mtx_);
    accept_thread = std::move(accept_thread_);
  }
  if (accept_thread.joinable()) {
    accept_thread.join();
  }
}

void Forwarder::OnDataChannel(std::shared_ptr<DataChannel> data_channel) {
  // Installed before the state check so a close reported at any point after
  // this is seen. StopForwarding removes them again.
  data_channel->SetMessageCallback([this](const uint8_t* data, size_t size) {
    auto res = Send(data, size);
    if (!res.ok()) {
      LOG(ERROR) << "Error writing to socket: " << res.error().Message();
    }
  });
  data_channel->SetCloseCallback([this]() {
    LOG(INFO) << "Data channel for port " << port_ << " closed";
    StopForwarding(FwdState::kFailed);
  });
  {
    std::lock_guard<std::mutex> lock(state_mtx_);
    if (state_ == FwdState::kInitializing) {
      data_channel_ = data_channel;
      state_ = FwdState::kReady;
      // AcceptLoop waits for the lock before reading the state.
      accept_thread_ = std::thread(&Forwarder::AcceptLoop, this);
      state_cv_.notify_all();
      return;
    }
    // Not fatal: the channel was opened twice or forwarding already stopped.
    LOG(WARNING) << "Forwarding not started in unexpected state: "
                 << FwdStateToString(state_);
    if (data_channel_ == data_channel && !IsTerminal(state_)) {
      // Already serving this channel, the callbacks above replaced its own.
      return;
    }
  }
  data_channel->SetMessageCallback(nullptr);
  data_channel->SetCloseCallback(nullptr);
}

Result<void> Forwarder::Send(const uint8_t* data, size_t size) {
  SharedFD conn;
  {
    std::lock_guard<std::mutex> lock(state_mtx_);
    conn = conn_;
  }
  CVDR_EXPECT(conn->IsOpen(), "No connection yet on port " << port_);
  // The connection may be dropped concurrently, the write just fails then.
  auto written = WriteAll(conn, reinterpret_cast<const char*>(data), size);
  CVDR_EXPECT_EQ(written, static_cast<ssize_t>(size),
                 "Failed to write to port " << port_ << ": "
                                            << conn->StrError());
  return {};
}

void Forwarder::StopForwarding(FwdState state) {
  std::shared_ptr<DataChannel> data_channel;
  SharedFD conn;
  {
    std::lock_guard<std::mutex> lock(state_mtx_);
    if (state_ == state) {
      return;
    }
    if (IsTerminal(state_)) {
      LOG(DEBUG) << "Forwarder on port " << port_ << " already "
                 << FwdStateToString(state_) << ", ignoring "
                 << FwdStateToString(state);
      return;
    }
    state_ = state;
    data_channel = data_channel_;
    conn = conn_;
  }
  state_cv_.notify_all();
  LOG(INFO) << "Forwarding on port " << port_ << " "
            << FwdStateToString(state);
  if (interrupt_->EventfdWrite(1) != 0) {
    LOG(ERROR) << "Failed to interrupt forwarding loops: "
               << interrupt_->StrError();
  }
  // Refuse new TCP peers. The descriptor itself is closed on destruction, the
  // accept loop may still be polling it.
  listener_->Shutdown(SHUT_RDWR);
  // Also fails any write a message callback is blocked on.
  if (conn->IsOpen()) {
    conn->Shutdown(SHUT_RDWR);
  }
  // The channel may call back into StopForwarding, so no locks can be held
  // here. Once the callbacks are removed nothing refers to this forwarder.
  if (data_channel) {
    data_channel->SetMessageCallback(nullptr);
    data_channel->SetCloseCallback(nullptr);
    data_channel->Close();
  }
}

ForwarderState Forwarder::State() {
  // Pass equal values to get the current state without changing it
  auto [_, state] = CompareAndSwapState(kNoState, kNoState);
  return ForwarderState{
      .port = port_,
      .state = FwdStateToString(state),
  };
}

Result<void> Forwarder::WaitForReady(std::chrono::seconds timeout) {
  std::unique_lock<std::mutex> lock(state_mtx_);
  auto initialized = [this]() { return state_ != FwdState::kInitializing; };
  if (timeout.count() > 0) {
    CVDR_EXPECTF(state_cv_.wait_for(lock, timeout, initialized),
                 "Data channel not open after {} seconds", timeout.count());
  } else {
    state_cv_.wait(lock, initialized);
  }
  CVDR_EXPECT(!IsTerminal(state_),
              "Forwarding " << FwdStateToString(state_) << " before starting");
  return {};
}

std::pair<bool, FwdState> Forwarder::CompareAndSwapState(FwdState old_state,
                                                         FwdState new_state) {
  std::lock_guard<std::mutex> lock(state_mtx_);
  if (state_ == old_state) {
    state_ = new_state;
    return {true, old_state};
  }
  return {false, state_};
}

bool Forwarder::SetConnection(SharedFD conn) {
  std::lock_guard<std::mutex> lock(state_mtx_);
  if (state_ != FwdState::kReady) {
    return false;
  }
  conn_ = conn;
  state_ = FwdState::kConnected;
  return true;
}

std::shared_ptr<DataChannel> Forwarder::CurrentDataChannel() {
  std::lock_guard<std::mutex> lock(state_mtx_);
  return data_channel_;
}

void Forwarder::AcceptLoop() {
  auto [unchanged, state] =
      CompareAndSwapState(FwdState::kReady, FwdState::kReady);
  if (!unchanged) {
    // StopForwarding could have been called already
    LOG(INFO) << "Forwarder accept loop started in wrong state: "
              << FwdStateToString(state);
    return;
  }
  LOG(INFO) << "Listening on port " << port_;
  while (true) {
    std::vector<PollSharedFd> fds = {
        {.fd = listener_, .events = POLLIN, .revents = 0},
        {.fd = interrupt_, .events = POLLIN, .revents = 0},
    };
    if (SharedFD::Poll(fds, -1) < 0) {
      PLOG(ERROR) << "Failed to poll port " << port_;
      return;
    }
    if (fds[1].revents & POLLIN) {
      return;
    }
    auto conn = SharedFD::Accept(*listener_);
    if (!conn->IsOpen()) {
      LOG(ERROR) << "Error accepting connection on port " << port_ << ": "
                 << conn->StrError();
      return;
    }
    LOG(INFO) << "Connection received on port " << port_;
    if (!SetConnection(conn)) {
      // StopForwarding was called, conn is closed when it goes out of scope.
      return;
    }

    RecvLoop(conn);

    if (!CompareAndSwapState(FwdState::kConnected, FwdState::kReady).first) {
      // A different state means this loop should end
      return;
    }
  }
}

void Forwarder::RecvLoop(SharedFD conn) {
  auto data_channel = CurrentDataChannel();
  uint8_t buffer[kRecvBufferSize];
  while (true) {
    std::vector<PollSharedFd> fds = {
        {.fd = conn, .events = POLLIN, .revents = 0},
        {.fd = interrupt_, .events = POLLIN, .revents = 0},
    };
    if (SharedFD::Poll(fds, -1) < 0) {
      PLOG(ERROR) << "Failed to poll connection on port " << port_;
      break;
    }
    if (fds[1].revents & POLLIN) {
      break;
    }
    auto length = conn->Read(buffer, sizeof(buffer));
    if (length == 0) {
      LOG(INFO) << "Connection on port " << port_ << " closed by peer";
      break;
    }
    if (length < 0) {
      auto error = conn->GetErrno();
      // Resets and shutdowns are the normal way of closing these connections.
      if (error == ECONNRESET || error == EBADF || error == ESHUTDOWN) {
        LOG(DEBUG) << "Connection on port " << port_
                   << " closed: " << conn->StrError();
      } else {
        LOG(ERROR) << "Error receiving from port " << port_ << ": "
                   << conn->StrError();
      }
      break;
    }
    auto res = data_channel->Send(buffer, length);
    if (!res.ok()) {
      LOG(ERROR) << "Failed to send data to data channel from port " << port_
                 << ": " << res.error().Message();
      break;
    }
  }
  std::lock_guard<std::mutex> lock(state_mtx_);
  conn_ = SharedFD();
}

}  // namespace cvdr
