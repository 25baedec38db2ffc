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

#include "cvdr/host/libs/connection/conn_controller.h"

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>

#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/scopeguard.h>

#include "cvdr/common/libs/utils/files.h"
#include "cvdr/common/libs/utils/json.h"
#include "cvdr/common/libs/utils/tee_logging.h"
#include "cvdr/host/libs/connection/control_protocol.h"

namespace cvdr {
namespace {

constexpr size_t kMaxCommandSize = 100;
// A client that connects and says nothing must not block the control loop.
constexpr int kCommandTimeoutMs = 5000;

}  // namespace

Result<std::unique_ptr<ConnController>> ConnController::Create(
    const std::string& control_dir, WebRtcService& service,
    const RemoteCvdLocator& cvd, const ConnectOptions& opts) {
  auto log = CVDR_EXPECT(CreateConnectionLog(control_dir, cvd));
  auto previous_logger =
      android::base::SetLogger(LogToStderrAndFiles({log.fd}));
  // Runs after on_failure below, which still logs to the connection log.
  android::base::ScopeGuard restore_logger([&previous_logger]() {
    android::base::SetLogger(std::move(previous_logger));
  });
  LOG(INFO) << "Connecting to " << cvd.webrtc_device_id << " in host "
            << cvd.host;

  auto forwarder =
      CVDR_EXPECTF(Forwarder::Create(),
                   "Failed to instantiate ADB forwarder for \"{}\"",
                   cvd.webrtc_device_id);
  auto interrupt = SharedFD::Event(0, EFD_CLOEXEC);
  CVDR_EXPECT(interrupt->IsOpen(),
              "Failed to create eventfd: " << interrupt->StrError());
  std::unique_ptr<ConnController> controller(
      new ConnController(cvd, log, std::move(forwarder), interrupt));

  ConnectWebRtcOpts webrtc_opts;
  webrtc_opts.local_ice_config = opts.ice_config;
  controller->connection_ = CVDR_EXPECTF(
      service.ConnectWebRtc(cvd.host, cvd.webrtc_device_id, *controller,
                            log.fd, webrtc_opts),
      "Failed to connect to \"{}\"", cvd.webrtc_device_id);

  android::base::ScopeGuard on_failure([&controller]() {
    controller->forwarder_->StopForwarding(FwdState::kFailed);
    controller->CloseConnection();
  });

  // Wait for the ADB forwarder to be set up before exposing the tunnel.
  CVDR_EXPECTF(controller->forwarder_->WaitForReady(opts.handshake_timeout),
               "Connection to \"{}\" failed", cvd.webrtc_device_id);

  // Create the control socket as late as possible to reduce the chances of it
  // being left behind if the user interrupts the command.
  controller->control_path_ = control_dir + "/" + ControlSocketName(cvd);
  controller->control_ =
      CVDR_EXPECTF(CreateControlSocket(controller->control_path_),
                   "Control socket creation failed for \"{}\"",
                   cvd.webrtc_device_id);

  on_failure.Disable();
  restore_logger.Disable();
  return controller;
}

ConnController::ConnController(const RemoteCvdLocator& cvd, ConnectionLog log,
                               std::unique_ptr<Forwarder> forwarder,
                               SharedFD interrupt)
    : cvd_(cvd),
      log_(std::move(log)),
      forwarder_(std::move(forwarder)),
      interrupt_(interrupt) {}

ConnController::~ConnController() {
  Stop();
  // No callbacks may reach the forwarder after this.
  CloseConnection();
}

void ConnController::CloseConnection() {
  if (connection_) {
    connection_->Close();
    connection_.reset();
  }
}

void ConnController::OnDataChannel(std::shared_ptr<DataChannel> data_channel) {
  LOG(INFO) << "ADB data channel to \"" << cvd_.webrtc_device_id
            << "\" is open";
  forwarder_->OnDataChannel(data_channel);
}

void ConnController::OnError(const std::string& message) {
  forwarder_->StopForwarding(FwdState::kFailed);
  LOG(ERROR) << "Error on webrtc connection to \"" << cvd_.webrtc_device_id
             << "\": " << message;
}

void ConnController::OnFailure() {
  forwarder_->StopForwarding(FwdState::kFailed);
  LOG(ERROR) << "WebRTC connection to \"" << cvd_.webrtc_device_id
             << "\" set to failed state";
}

void ConnController::OnClose() {
  forwarder_->StopForwarding(FwdState::kStopped);
  LOG(INFO) << "WebRTC connection to \"" << cvd_.webrtc_device_id
            << "\" closed";
}

void ConnController::Stop() {
  forwarder_->StopForwarding(FwdState::kStopped);
  if (stopped_.exchange(true)) {
    return;
  }
  // Only the agent that created the socket may remove it.
  if (control_->IsOpen()) {
    auto removed = RemoveFile(control_path_);
    if (!removed.ok()) {
      LOG(ERROR) << "Failed to remove control socket: "
                 << removed.error().Message();
    }
  }
  // This will cause the control loop to finish.
  if (interrupt_->EventfdWrite(1) != 0) {
    LOG(ERROR) << "Failed to interrupt the control loop: "
               << interrupt_->StrError();
  }
}

ConnStatus ConnController::Status() {
  return ConnStatus{.adb = forwarder_->State()};
}

int ConnController::AdbPort() const { return forwarder_->Port(); }

void ConnController::LogToFileOnly() {
  android::base::SetLogger(LogToFiles({log_.fd}));
}

void ConnController::Run() {
  while (true) {
    std::vector<PollSharedFd> fds = {
        {.fd = control_, .events = POLLIN, .revents = 0},
        {.fd = interrupt_, .events = POLLIN, .revents = 0},
    };
    if (SharedFD::Poll(fds, -1) < 0) {
      PLOG(ERROR) << "Failed to poll the control socket";
      return;
    }
    if (fds[1].revents & POLLIN) {
      // control socket closed, exit normally
      return;
    }
    auto conn = SharedFD::Accept(*control_);
    if (!conn->IsOpen()) {
      LOG(ERROR) << "Error accepting connection on control socket: "
                 << conn->StrError();
      continue;
    }
    HandleControlCommand(conn);
  }
}

void ConnController::HandleControlCommand(SharedFD conn) {
  std::vector<PollSharedFd> fds = {
      {.fd = conn, .events = POLLIN, .revents = 0},
  };
  auto ready = SharedFD::Poll(fds, kCommandTimeoutMs);
  if (ready <= 0) {
    LOG(ERROR) << "No command received on control socket connection";
    return;
  }
  char buff[kMaxCommandSize];
  auto length = conn->Recv(buff, sizeof(buff), 0);
  if (length < 0) {
    LOG(ERROR) << "Error reading from control socket connection: "
               << conn->StrError();
    return;
  }
  std::string cmd(buff, length);
  std::string reply;
  if (cmd == kVersionCmd) {
    reply = std::to_string(kControlProtocolVersion);
  } else if (cmd == kStatusCmd) {
    reply = SerializeJson(ToJson(StatusCmdRes{.cvd = cvd_, .status = Status()}));
  } else if (cmd == kStopCmd) {
    Stop();
    return;
  } else {
    LOG(WARNING) << "Unknown command on control socket: \"" << cmd << "\"";
    return;
  }
  if (conn->Send(reply.data(), reply.size(), MSG_NOSIGNAL) < 0) {
    LOG(ERROR) << "Error writing to control socket connection: "
               << conn->StrError();
  }
}

}  // namespace cvdr
