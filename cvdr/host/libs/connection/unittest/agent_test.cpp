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

#include "cvdr/host/libs/connection/agent.h"

#include <chrono>
#include <string>
#include <thread>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "cvdr/common/libs/utils/files.h"
#include "cvdr/common/libs/utils/result_matchers.h"
#include "cvdr/host/libs/connection/control_protocol.h"
#include "cvdr/host/libs/connection/unittest/fake_webrtc.h"

namespace cvdr {
namespace {

using ::testing::HasSubstr;

const RemoteCvdLocator kCvd{
    .service_root_endpoint = "http://localhost:8080",
    .host = "host_1",
    .webrtc_device_id = "cvd-1",
};

bool WaitForRemoval(const std::string& path, std::chrono::seconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (FileExists(path)) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return true;
}

class AgentTest : public ::testing::Test {
 protected:
  void SetUp() override {
    control_dir_ = dir_.path;
    ASSERT_THAT(EnsureConnDirsExist(control_dir_), IsOk());
  }

  void TearDown() override {
    // Never leave an agent behind.
    auto path = control_dir_ + "/" + ControlSocketName(kCvd);
    if (FileExists(path)) {
      UnixControlClient client;
      auto stopped = client.Stop(path);
      if (stopped.ok()) {
        WaitForRemoval(path, std::chrono::seconds(5));
      }
    }
  }

  TemporaryDir dir_;
  std::string control_dir_;
  UnixControlClient client_;
};

TEST_F(AgentTest, AgentOutlivesCaller) {
  FakeWebRtcService service;
  ConnectionRegistry registry(control_dir_, client_);

  auto status = SpawnConnectionAgent(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(status, IsOk());
  EXPECT_GT(status->adb.port, 0);
  EXPECT_EQ(status->adb.state, "ready");

  auto path = registry.ControlSocketPath(kCvd);
  auto remote = client_.Status(path);
  ASSERT_THAT(remote, IsOk());
  EXPECT_EQ(remote->cvd, kCvd);
  EXPECT_EQ(remote->status.adb.port, status->adb.port);

  ASSERT_THAT(registry.Disconnect(kCvd), IsOk());
  EXPECT_TRUE(WaitForRemoval(path, std::chrono::seconds(5)));
}

TEST_F(AgentTest, SecondAgentReportsExistingConnection) {
  FakeWebRtcService service;
  ConnectionRegistry registry(control_dir_, client_);
  auto first = SpawnConnectionAgent(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(first, IsOk());

  auto second = SpawnConnectionAgent(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(second, IsOk());
  EXPECT_EQ(second->adb.port, first->adb.port);

  auto listing = registry.List();
  EXPECT_EQ(listing.statuses.size(), 1u);
  EXPECT_TRUE(listing.errors.empty());
}

TEST_F(AgentTest, ConnectionErrorIsReported) {
  FakeWebRtcService service(FakeWebRtcService::Behavior::kRefuse);
  ConnectionRegistry registry(control_dir_, client_);

  auto status = SpawnConnectionAgent(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(status, IsError());
  EXPECT_THAT(status.error().Message(), HasSubstr("Fake service refused"));
  EXPECT_FALSE(FileExists(registry.ControlSocketPath(kCvd)));
}

}  // namespace
}  // namespace cvdr
