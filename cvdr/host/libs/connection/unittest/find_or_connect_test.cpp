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

#include "cvdr/host/libs/connection/find_or_connect.h"

#include <atomic>
#include <memory>
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

/**
 * Starts a competing agent for the same device while the connection is being
 * negotiated, so it takes the control socket first.
 */
class RacingWebRtcService : public WebRtcService {
 public:
  RacingWebRtcService(const std::string& control_dir,
                      const RemoteCvdLocator& cvd)
      : control_dir_(control_dir), cvd_(cvd) {}

  ~RacingWebRtcService() override {
    if (competitor_) {
      competitor_->Stop();
    }
    if (competitor_thread_.joinable()) {
      competitor_thread_.join();
    }
  }

  Result<std::unique_ptr<WebRtcConnection>> ConnectWebRtc(
      const std::string&, const std::string&, WebRtcObserver& observer,
      SharedFD, const ConnectWebRtcOpts&) override {
    competitor_ = CVDR_EXPECT(ConnController::Create(
        control_dir_, competitor_service_, cvd_, ConnectOptions{}));
    competitor_thread_ = std::thread([this]() { competitor_->Run(); });
    channel_ = std::make_shared<FakeDataChannel>();
    observer.OnDataChannel(channel_);
    return std::unique_ptr<WebRtcConnection>(
        new FakeWebRtcConnection(close_count_));
  }

  ConnController* Competitor() const { return competitor_.get(); }
  std::shared_ptr<FakeDataChannel> Channel() const { return channel_; }
  int CloseCalls() const { return *close_count_; }

 private:
  std::string control_dir_;
  RemoteCvdLocator cvd_;
  FakeWebRtcService competitor_service_;
  std::unique_ptr<ConnController> competitor_;
  std::thread competitor_thread_;
  std::shared_ptr<FakeDataChannel> channel_;
  std::shared_ptr<std::atomic<int>> close_count_ =
      std::make_shared<std::atomic<int>>(0);
};

class FindOrConnectTest : public ::testing::Test {
 protected:
  void SetUp() override {
    control_dir_ = dir_.path;
    ASSERT_THAT(EnsureConnDirsExist(control_dir_), IsOk());
  }

  void TearDown() override {
    if (controller_) {
      controller_->Stop();
    }
    if (agent_thread_.joinable()) {
      agent_thread_.join();
    }
  }

  // Serves the control socket of `controller` until the test ends.
  void RunAgent(std::unique_ptr<ConnController> controller) {
    controller_ = std::move(controller);
    agent_thread_ = std::thread([this]() { controller_->Run(); });
  }

  TemporaryDir dir_;
  std::string control_dir_;
  UnixControlClient client_;
  std::unique_ptr<ConnController> controller_;
  std::thread agent_thread_;
};

TEST_F(FindOrConnectTest, CreatesConnectionWhenNoneExists) {
  FakeWebRtcService service;
  ConnectionRegistry registry(control_dir_, client_);

  auto res = FindOrConnect(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(res, IsOk());
  ASSERT_NE(res->controller, nullptr);
  EXPECT_TRUE(res->listing_errors.empty());
  EXPECT_GT(res->status.adb.port, 0);
  EXPECT_EQ(res->status.adb.state, "ready");
  EXPECT_EQ(service.ConnectCalls(), 1);
  EXPECT_TRUE(IsSocket(registry.ControlSocketPath(kCvd)));
  RunAgent(std::move(res->controller));
}

TEST_F(FindOrConnectTest, ReusesExistingConnection) {
  FakeWebRtcService service;
  ConnectionRegistry registry(control_dir_, client_);
  auto first = FindOrConnect(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(first, IsOk());
  ASSERT_NE(first->controller, nullptr);
  auto port = first->status.adb.port;
  RunAgent(std::move(first->controller));

  auto second = FindOrConnect(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(second, IsOk());
  EXPECT_EQ(second->controller, nullptr);
  EXPECT_EQ(second->status.adb.port, port);
  EXPECT_EQ(service.ConnectCalls(), 1);
}

TEST_F(FindOrConnectTest, OtherDevicesAreNotReused) {
  FakeWebRtcService service;
  ConnectionRegistry registry(control_dir_, client_);
  auto first = FindOrConnect(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(first, IsOk());
  RunAgent(std::move(first->controller));

  auto other_cvd = kCvd;
  other_cvd.webrtc_device_id = "cvd-2";
  auto second = FindOrConnect(registry, other_cvd, service, ConnectOptions{});
  ASSERT_THAT(second, IsOk());
  ASSERT_NE(second->controller, nullptr);
  EXPECT_NE(second->status.adb.port, first->status.adb.port);
  EXPECT_EQ(service.ConnectCalls(), 2);
  second->controller->Stop();
}

TEST_F(FindOrConnectTest, UnreachableAgentsAreReported) {
  // Left behind by an agent that died.
  {
    auto stale = CreateControlSocket(control_dir_ + "/0000000000000000.sock");
    ASSERT_THAT(stale, IsOk());
  }
  FakeWebRtcService service;
  ConnectionRegistry registry(control_dir_, client_);

  auto res = FindOrConnect(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(res, IsOk());
  EXPECT_EQ(res->listing_errors.size(), 1u);
  ASSERT_NE(res->controller, nullptr);
  RunAgent(std::move(res->controller));
}

TEST_F(FindOrConnectTest, ConnectionFailureIsAnError) {
  FakeWebRtcService service(FakeWebRtcService::Behavior::kRefuse);
  ConnectionRegistry registry(control_dir_, client_);

  auto res = FindOrConnect(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(res, IsError());
  EXPECT_THAT(res.error().Message(), HasSubstr("Fake service refused"));
  EXPECT_FALSE(FileExists(registry.ControlSocketPath(kCvd)));
}

TEST_F(FindOrConnectTest, LosingCreationRaceReturnsTheWinner) {
  RacingWebRtcService service(control_dir_, kCvd);
  ConnectionRegistry registry(control_dir_, client_);

  auto res = FindOrConnect(registry, kCvd, service, ConnectOptions{});
  ASSERT_THAT(res, IsOk());
  EXPECT_EQ(res->controller, nullptr);
  ASSERT_NE(service.Competitor(), nullptr);
  EXPECT_EQ(res->status.adb.port, service.Competitor()->AdbPort());
  EXPECT_EQ(res->status.adb.state, "ready");
  // The losing connection was torn down.
  EXPECT_EQ(service.CloseCalls(), 1);
  EXPECT_TRUE(service.Channel()->IsClosed());
  EXPECT_TRUE(IsSocket(registry.ControlSocketPath(kCvd)));
}

TEST_F(FindOrConnectTest, PassesIceConfigToService) {
  FakeWebRtcService service;
  ConnectionRegistry registry(control_dir_, client_);
  ConnectOptions opts;
  opts.ice_config = IceConfig{
      .ice_servers = {IceServer{.urls = {"turn:turn.example.com:3478"},
                                .username = "user",
                                .credential = "secret"}},
  };

  auto res = FindOrConnect(registry, kCvd, service, opts);
  ASSERT_THAT(res, IsOk());
  ASSERT_TRUE(service.LastOpts().has_value());
  ASSERT_TRUE(service.LastOpts()->local_ice_config.has_value());
  const auto& servers = service.LastOpts()->local_ice_config->ice_servers;
  ASSERT_EQ(servers.size(), 1u);
  EXPECT_EQ(servers[0].username, "user");
  RunAgent(std::move(res->controller));
}

}  // namespace
}  // namespace cvdr
