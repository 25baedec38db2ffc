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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "cvdr/common/libs/utils/result.h"
#include "cvdr/host/libs/connection/webrtc_client.h"

namespace cvdr {

class FakeDataChannel : public DataChannel {
 public:
  Result<void> Send(const uint8_t* data, size_t size) override {
    std::lock_guard<std::mutex> lock(mtx_);
    CVDR_EXPECT(!closed_, "Data channel is closed");
    sent_.append(reinterpret_cast<const char*>(data), size);
    cv_.notify_all();
    return {};
  }

  void Close() override {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_) {
        return;
      }
      closed_ = true;
    }
    std::lock_guard<std::recursive_mutex> lock(callback_mtx_);
    if (close_callback_) {
      auto callback = close_callback_;
      callback();
    }
  }

  void SetMessageCallback(MessageCallback callback) override {
    std::lock_guard<std::recursive_mutex> lock(callback_mtx_);
    message_callback_ = std::move(callback);
  }

  void SetCloseCallback(CloseCallback callback) override {
    std::lock_guard<std::recursive_mutex> lock(callback_mtx_);
    close_callback_ = std::move(callback);
  }

  // Simulates a message arriving from the device.
  void Deliver(const std::string& data) {
    std::lock_guard<std::recursive_mutex> lock(callback_mtx_);
    if (message_callback_) {
      // The callback may clear itself, keep it alive until it returns.
      auto callback = message_callback_;
      callback(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }
  }

  bool HasCallbacks() {
    std::lock_guard<std::recursive_mutex> lock(callback_mtx_);
    return message_callback_ || close_callback_;
  }

  bool WaitForSent(const std::string& expected,
                   std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_for(lock, timeout, [this, &expected]() {
      return sent_.find(expected) != std::string::npos;
    });
  }

  std::string Sent() {
    std::lock_guard<std::mutex> lock(mtx_);
    return sent_;
  }

  bool IsClosed() {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

 private:
  std::mutex mtx_;
  std::condition_variable cv_;
  std::string sent_;
  bool closed_ = false;
  // Held while a callback runs, recursive so callbacks can reset themselves.
  std::recursive_mutex callback_mtx_;
  MessageCallback message_callback_;
  CloseCallback close_callback_;
};

class FakeWebRtcConnection : public WebRtcConnection {
 public:
  FakeWebRtcConnection(std::shared_ptr<std::atomic<int>> close_count)
      : close_count_(close_count) {}

  void Close() override { (*close_count_)++; }

 private:
  std::shared_ptr<std::atomic<int>> close_count_;
};

/**
 * Completes connections synchronously, calling the observer from within
 * ConnectWebRtc the way the configured behavior dictates.
 */
class FakeWebRtcService : public WebRtcService {
 public:
  enum class Behavior {
    kOpenChannel,
    kNeverOpen,
    kReportError,
    kReportFailure,
    kRefuse,
  };

  FakeWebRtcService(Behavior behavior = Behavior::kOpenChannel)
      : behavior_(behavior) {}

  Result<std::unique_ptr<WebRtcConnection>> ConnectWebRtc(
      const std::string& host, const std::string& device,
      WebRtcObserver& observer, SharedFD,
      const ConnectWebRtcOpts& opts) override {
    connect_calls_++;
    last_opts_ = opts;
    if (behavior_ == Behavior::kRefuse) {
      return CVDR_ERR("Fake service refused " << host << "/" << device);
    }
    observer_ = &observer;
    channel_ = std::make_shared<FakeDataChannel>();
    switch (behavior_) {
      case Behavior::kOpenChannel:
        observer.OnDataChannel(channel_);
        break;
      case Behavior::kReportError:
        observer.OnError("ICE negotiation failed");
        break;
      case Behavior::kReportFailure:
        observer.OnFailure();
        break;
      case Behavior::kNeverOpen:
      case Behavior::kRefuse:
        break;
    }
    return std::unique_ptr<WebRtcConnection>(
        new FakeWebRtcConnection(close_count_));
  }

  int ConnectCalls() const { return connect_calls_; }
  int CloseCalls() const { return *close_count_; }
  std::shared_ptr<FakeDataChannel> Channel() const { return channel_; }
  WebRtcObserver* Observer() const { return observer_; }
  const std::optional<ConnectWebRtcOpts>& LastOpts() const {
    return last_opts_;
  }

 private:
  Behavior behavior_;
  std::atomic<int> connect_calls_ = 0;
  std::shared_ptr<std::atomic<int>> close_count_ =
      std::make_shared<std::atomic<int>>(0);
  std::shared_ptr<FakeDataChannel> channel_;
  WebRtcObserver* observer_ = nullptr;
  std::optional<ConnectWebRtcOpts> last_opts_;
};

}  // namespace cvdr
