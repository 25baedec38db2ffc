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

#include "cvdr/host/libs/connection/control_protocol.h"

#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/un.h>

#include <cstdint>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <fmt/format.h>

#include "cvdr/common/libs/utils/files.h"
#include "cvdr/common/libs/utils/json.h"

namespace cvdr {
namespace {

constexpr size_t kMaxReplySize = 4096;

// 64 bit FNV-1a
uint64_t Fnv1a(const std::string& data, uint64_t hash) {
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

}  // namespace

std::string ControlSocketName(const RemoteCvdLocator& cvd) {
  // The canonical name is too long to use as a unix socket name.
  std::string canonical = cvd.service_root_endpoint;
  canonical.push_back('\0');
  canonical += cvd.host;
  canonical.push_back('\0');
  canonical += cvd.webrtc_device_id;
  return fmt::format("{:016x}.sock", Fnv1a(canonical, 0xcbf29ce484222325ULL));
}

std::string ControlSocketLockPath(const std::string& socket_path) {
  return socket_path + ".lock";
}

Result<SharedFD> CreateControlSocket(const std::string& path) {
  CVDR_EXPECT_LT(path.size(), sizeof(sockaddr_un::sun_path),
                 "Control socket path is too long: " << path);
  // Serializes the stale check and the removal against other creators, or one
  // of them could remove a socket another just bound. Released on return.
  auto lock_path = ControlSocketLockPath(path);
  auto lock = SharedFD::Open(lock_path, O_CREAT | O_RDWR | O_CLOEXEC, 0600);
  CVDR_EXPECT(lock->IsOpen(), "Failed to open lock file \""
                                  << lock_path << "\": " << lock->StrError());
  CVDR_EXPECT(lock->Flock(LOCK_EX) == 0, "Failed to lock \""
                                             << lock_path << "\": "
                                             << lock->StrError());
  // A second attempt is made after removing a stale socket.
  for (int attempt = 0; attempt < 2; attempt++) {
    auto control =
        SharedFD::SocketLocalServer(path, false, SOCK_SEQPACKET, 0600);
    if (control->IsOpen()) {
      return control;
    }
    CVDR_EXPECT_EQ(control->GetErrno(), EADDRINUSE,
                   "Failed to create control socket \"" << path << "\": "
                                                        << control->StrError());
    auto client = SharedFD::SocketLocalClient(path, false, SOCK_SEQPACKET);
    CVDR_EXPECT(!client->IsOpen(),
                "Control socket \"" << path << "\" belongs to a running agent");
    if (client->GetErrno() == ENOENT) {
      continue;
    }
    CVDR_EXPECT_EQ(client->GetErrno(), ECONNREFUSED,
                   "Unable to check control socket \""
                       << path << "\": " << client->StrError());
    LOG(INFO) << "Removing stale control socket " << path;
    CVDR_EXPECT(RemoveFile(path));
  }
  return CVDR_ERR("Unable to create control socket \"" << path << "\"");
}

UnixControlClient::UnixControlClient(std::chrono::milliseconds reply_timeout)
    : reply_timeout_(reply_timeout) {}

Result<SharedFD> UnixControlClient::SendCommand(const std::string& socket_path,
                                                const std::string& command) {
  auto conn = SharedFD::SocketLocalClient(socket_path, false, SOCK_SEQPACKET);
  CVDR_EXPECT(conn->IsOpen(), "Unable to contact connection agent at \""
                                  << socket_path
                                  << "\": " << conn->StrError());
  // A seqpacket message is delivered in full or not at all.
  auto sent = conn->Send(command.data(), command.size(), MSG_NOSIGNAL);
  CVDR_EXPECT_EQ(sent, static_cast<ssize_t>(command.size()),
                 "Failed to send " << command
                                   << " command: " << conn->StrError());
  return conn;
}

Result<std::string> UnixControlClient::ReadReply(SharedFD conn) {
  std::vector<PollSharedFd> fds = {
      {.fd = conn, .events = POLLIN, .revents = 0},
  };
  auto ready = SharedFD::Poll(fds, reply_timeout_.count());
  CVDR_EXPECT(ready >= 0, "Failed to poll control socket: " << strerror(errno));
  CVDR_EXPECT(ready > 0, "Connection agent did not reply within "
                             << reply_timeout_.count() << "ms");
  std::string reply(kMaxReplySize, '\0');
  auto length = conn->Recv(reply.data(), reply.size(), 0);
  CVDR_EXPECT(length >= 0, "Failed to read reply: " << conn->StrError());
  CVDR_EXPECT(length > 0, "Connection agent closed the connection");
  reply.resize(length);
  return reply;
}

Result<int> UnixControlClient::Version(const std::string& socket_path) {
  auto conn = CVDR_EXPECT(SendCommand(socket_path, kVersionCmd));
  auto reply = CVDR_EXPECT(ReadReply(conn));
  int version;
  CVDR_EXPECT(android::base::ParseInt(reply, &version),
              "Invalid version reply: \"" << reply << "\"");
  return version;
}

Result<StatusCmdRes> UnixControlClient::Status(
    const std::string& socket_path) {
  auto conn = CVDR_EXPECT(SendCommand(socket_path, kStatusCmd));
  auto reply = CVDR_EXPECT(ReadReply(conn), "Failed to read status reply");
  auto json = CVDR_EXPECT(ParseJson(reply), "Failed to parse status reply");
  return CVDR_EXPECT(StatusCmdResFromJson(json),
                     "Failed to parse status reply");
}

Result<void> UnixControlClient::Stop(const std::string& socket_path) {
  CVDR_EXPECT(SendCommand(socket_path, kStopCmd));
  return {};
}

}  // namespace cvdr
