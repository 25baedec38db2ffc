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
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/stat.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "cvdr/common/libs/utils/json.h"
#include "cvdr/common/libs/utils/result_matchers.h"

namespace cvdr {
namespace {

using ::testing::HasSubstr;
using ::testing::MatchesRegex;

RemoteCvdLocator Locator(const std::string& host, const std::string& device) {
  return RemoteCvdLocator{
      .service_root_endpoint = "http://localhost:8080",
      .host = host,
      .webrtc_device_id = device,
  };
}

// Serves a single command on `server`, replying with `reply` unless empty.
std::thread ServeOnce(SharedFD server, std::string reply,
                      std::string* received) {
  return std::thread([server, reply, received]() {
    auto conn = SharedFD::Accept(*server);
    if (!conn->IsOpen()) {
      return;
    }
    char buf[100];
    auto length = conn->Recv(buf, sizeof(buf), 0);
    if (length > 0 && received) {
      *received = std::string(buf, length);
    }
    if (!reply.empty()) {
      conn->Send(reply.data(), reply.size(), MSG_NOSIGNAL);
    }
    // Keep the connection open until the client is done with it.
    conn->Recv(buf, sizeof(buf), 0);
  });
}

TEST(ControlSocketNameTest, IsShortAndStable) {
  auto cvd = Locator("host_1", "cvd-1");
  auto name = ControlSocketName(cvd);
  EXPECT_THAT(name, MatchesRegex("[0-9a-f]{16}\\.sock"));
  EXPECT_EQ(name, ControlSocketName(Locator("host_1", "cvd-1")));
}

TEST(ControlSocketNameTest, DependsOnEveryField) {
  auto base = Locator("host_1", "cvd-1");
  auto other_endpoint = base;
  other_endpoint.service_root_endpoint = "http://localhost:9090";
  EXPECT_NE(ControlSocketName(base), ControlSocketName(other_endpoint));
  EXPECT_NE(ControlSocketName(base),
            ControlSocketName(Locator("host_2", "cvd-1")));
  EXPECT_NE(ControlSocketName(base),
            ControlSocketName(Locator("host_1", "cvd-2")));
  // Fields are delimited, moving characters between them changes the name.
  EXPECT_NE(ControlSocketName(Locator("ab", "c")),
            ControlSocketName(Locator("a", "bc")));
}

TEST(CreateControlSocketTest, OwnerOnlyPermissions) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/control.sock";
  auto control = CreateControlSocket(path);
  ASSERT_THAT(control, IsOk());
  struct stat st {};
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_TRUE(S_ISSOCK(st.st_mode));
  EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST(CreateControlSocketTest, RefusesLiveSocket) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/control.sock";
  auto first = CreateControlSocket(path);
  ASSERT_THAT(first, IsOk());
  auto second = CreateControlSocket(path);
  ASSERT_THAT(second, IsError());
  EXPECT_THAT(second.error().Message(), HasSubstr("running agent"));
  // The live socket is still reachable.
  auto client = SharedFD::SocketLocalClient(path, false, SOCK_SEQPACKET);
  EXPECT_TRUE(client->IsOpen()) << client->StrError();
}

TEST(CreateControlSocketTest, ReplacesStaleSocket) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/control.sock";
  {
    auto first = CreateControlSocket(path);
    ASSERT_THAT(first, IsOk());
  }
  // The file outlives the closed socket.
  struct stat st {};
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  auto second = CreateControlSocket(path);
  ASSERT_THAT(second, IsOk());
  auto client = SharedFD::SocketLocalClient(path, false, SOCK_SEQPACKET);
  EXPECT_TRUE(client->IsOpen()) << client->StrError();
}

TEST(CreateControlSocketTest, StaleSocketIsReplacedUnderLock) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/control.sock";
  {
    auto first = CreateControlSocket(path);
    ASSERT_THAT(first, IsOk());
  }
  auto lock = SharedFD::Open(ControlSocketLockPath(path), O_RDWR);
  ASSERT_TRUE(lock->IsOpen()) << lock->StrError();
  ASSERT_EQ(lock->Flock(LOCK_EX), 0) << lock->StrError();

  std::atomic<bool> done{false};
  Result<SharedFD> second;
  std::thread creator([&path, &done, &second]() {
    second = CreateControlSocket(path);
    done = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_FALSE(done);
  struct stat st {};
  EXPECT_EQ(stat(path.c_str(), &st), 0);

  ASSERT_EQ(lock->Flock(LOCK_UN), 0) << lock->StrError();
  creator.join();
  ASSERT_THAT(second, IsOk());
  auto client = SharedFD::SocketLocalClient(path, false, SOCK_SEQPACKET);
  EXPECT_TRUE(client->IsOpen()) << client->StrError();
}

TEST(CreateControlSocketTest, ConcurrentCreatorsOnStaleSocketHaveOneWinner) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/control.sock";
  {
    auto stale = CreateControlSocket(path);
    ASSERT_THAT(stale, IsOk());
  }
  constexpr int kCreators = 8;
  std::vector<Result<SharedFD>> results(kCreators);
  std::vector<std::thread> creators;
  for (int i = 0; i < kCreators; i++) {
    creators.emplace_back(
        [&path, &results, i]() { results[i] = CreateControlSocket(path); });
  }
  for (auto& creator : creators) {
    creator.join();
  }
  int created = 0;
  for (const auto& result : results) {
    if (result.ok()) {
      created++;
    } else {
      EXPECT_THAT(result.error().Message(), HasSubstr("running agent"));
    }
  }
  EXPECT_EQ(created, 1);
}

TEST(CreateControlSocketTest, RejectsLongPath) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/" + std::string(200, 'x');
  EXPECT_THAT(CreateControlSocket(path), IsError());
}

TEST(UnixControlClientTest, Version) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/control.sock";
  auto server = CreateControlSocket(path);
  ASSERT_THAT(server, IsOk());
  std::string received;
  auto agent = ServeOnce(*server, "1", &received);

  UnixControlClient client;
  auto version = client.Version(path);
  agent.join();
  ASSERT_THAT(version, IsOk());
  EXPECT_EQ(*version, kControlProtocolVersion);
  EXPECT_EQ(received, kVersionCmd);
}

TEST(UnixControlClientTest, Status) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/control.sock";
  auto server = CreateControlSocket(path);
  ASSERT_THAT(server, IsOk());
  StatusCmdRes expected{
      .cvd = Locator("host_1", "cvd-1"),
      .status = ConnStatus{.adb = ForwarderState{.port = 4321,
                                                 .state = "connected"}},
  };
  std::string received;
  auto agent = ServeOnce(*server, SerializeJson(ToJson(expected)), &received);

  UnixControlClient client;
  auto status = client.Status(path);
  agent.join();
  ASSERT_THAT(status, IsOk());
  EXPECT_EQ(status->cvd, expected.cvd);
  EXPECT_EQ(status->status.adb, expected.status.adb);
  EXPECT_EQ(received, kStatusCmd);
}

TEST(UnixControlClientTest, InvalidStatusReply) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/control.sock";
  auto server = CreateControlSocket(path);
  ASSERT_THAT(server, IsOk());
  auto agent = ServeOnce(*server, "{\"cvd\": 3}", nullptr);

  UnixControlClient client;
  auto status = client.Status(path);
  agent.join();
  EXPECT_THAT(status, IsError());
}

TEST(UnixControlClientTest, StopExpectsNoReply) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/control.sock";
  auto server = CreateControlSocket(path);
  ASSERT_THAT(server, IsOk());
  std::string received;
  auto agent = ServeOnce(*server, "", &received);

  UnixControlClient client;
  auto stopped = client.Stop(path);
  // Closing the client side ends the agent's wait.
  EXPECT_THAT(stopped, IsOk());
  agent.join();
  EXPECT_EQ(received, kStopCmd);
}

TEST(UnixControlClientTest, SilentAgentTimesOut) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/control.sock";
  auto server = CreateControlSocket(path);
  ASSERT_THAT(server, IsOk());
  auto agent = ServeOnce(*server, "", nullptr);

  UnixControlClient client(std::chrono::milliseconds(100));
  auto version = client.Version(path);
  ASSERT_THAT(version, IsError());
  EXPECT_THAT(version.error().Message(), HasSubstr("did not reply"));
  agent.join();
}

TEST(UnixControlClientTest, MissingSocket) {
  TemporaryDir dir;
  UnixControlClient client;
  auto version = client.Version(std::string(dir.path) + "/missing.sock");
  ASSERT_THAT(version, IsError());
  EXPECT_THAT(version.error().Message(), HasSubstr("Unable to contact"));
}

}  // namespace
}  // namespace cvdr
