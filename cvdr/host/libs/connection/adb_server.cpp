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

#include "cvdr/host/libs/connection/adb_server.h"

#include <sys/socket.h>

#include <string>

#include <android-base/logging.h>
#include <fmt/format.h>

#include "cvdr/common/libs/fs/shared_buf.h"
#include "cvdr/common/libs/fs/shared_fd.h"

namespace cvdr {

std::string FormatAdbHostMessage(const std::string& msg) {
  return fmt::format("{:04x}{}", msg.size(), msg);
}

AdbServerProxyImpl::AdbServerProxyImpl(int server_port)
    : server_port_(server_port) {}

Result<void> AdbServerProxyImpl::Connect(int port) {
  CVDR_EXPECT(SendMsg(fmt::format("host:connect:127.0.0.1:{}", port)));
  return {};
}

Result<void> AdbServerProxyImpl::Disconnect(int port) {
  CVDR_EXPECT(SendMsg(fmt::format("host:disconnect:127.0.0.1:{}", port)));
  return {};
}

Result<void> AdbServerProxyImpl::SendMsg(const std::string& msg) {
  auto conn = SharedFD::SocketLocalClient(server_port_, SOCK_STREAM);
  CVDR_EXPECT(conn->IsOpen(),
              "Unable to contact ADB server: " << conn->StrError());
  auto framed = FormatAdbHostMessage(msg);
  CVDR_EXPECT_EQ(WriteAll(conn, framed), static_cast<ssize_t>(framed.size()),
                 "Error sending message to ADB server: " << conn->StrError());
  LOG(DEBUG) << "Sent \"" << msg << "\" to the ADB server";
  return {};
}

}  // namespace cvdr
