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

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <string>

#include <android-base/logging.h>

#include "cvdr/common/libs/fs/shared_buf.h"
#include "cvdr/common/libs/fs/shared_fd.h"
#include "cvdr/common/libs/utils/json.h"
#include "cvdr/host/libs/connection/find_or_connect.h"

namespace cvdr {
namespace {

enum AgentExitCodes : int {
  kSuccess = 0,
  kConnectionError = 1,
  kDaemonizationError = 2,
};

void Report(SharedFD report_fd, const Json::Value& report) {
  auto serialized = SerializeJson(report);
  if (WriteAll(report_fd, serialized) != static_cast<ssize_t>(serialized.size())) {
    LOG(ERROR) << "Failed to report to the foreground process: "
               << report_fd->StrError();
  }
  report_fd->Close();
}

Result<void> DetachStandardStreams() {
  auto dev_null = SharedFD::Open("/dev/null", O_RDWR);
  CVDR_EXPECT(dev_null->IsOpen(),
              "Failed to open /dev/null: " << dev_null->StrError());
  for (int fd = 0; fd < 3; fd++) {
    CVDR_EXPECTF(dev_null->UNMANAGED_Dup2(fd) >= 0, "Failed dup2 {}: {}", fd,
                 dev_null->StrError());
  }
  return {};
}

[[noreturn]] void RunAgent(SharedFD report_fd, ConnectionRegistry& registry,
                           const RemoteCvdLocator& cvd, WebRtcService& service,
                           const ConnectOptions& opts) {
  auto result = FindOrConnect(registry, cvd, service, opts);
  Json::Value report(Json::objectValue);
  if (!result.ok()) {
    LOG(ERROR) << result.error().Trace();
    report["error"] = result.error().Message();
    Report(report_fd, report);
    _exit(kConnectionError);
  }
  if (!result->listing_errors.empty()) {
    LOG(WARNING) << "Unreachable connection agents:\n"
                 << JoinErrorMessages(result->listing_errors);
  }
  report["status"] = ToJson(result->status);
  if (!result->controller) {
    LOG(INFO) << "Connection to " << cvd << " already exists";
    Report(report_fd, report);
    _exit(kSuccess);
  }
  auto controller = std::move(result->controller);
  // Errors from now on can only be found in the log file.
  controller->LogToFileOnly();
  Report(report_fd, report);
  auto detached = DetachStandardStreams();
  if (!detached.ok()) {
    LOG(ERROR) << detached.error().Trace();
  }

  controller->Run();
  LOG(INFO) << "Connection agent for " << cvd << " exiting";
  controller.reset();
  _exit(kSuccess);
}

}  // namespace

Result<ConnStatus> SpawnConnectionAgent(ConnectionRegistry& registry,
                                        const RemoteCvdLocator& cvd,
                                        WebRtcService& service,
                                        const ConnectOptions& opts) {
  SharedFD read_end, write_end;
  CVDR_EXPECT(SharedFD::Pipe(&read_end, &write_end),
              "Unable to create pipe: " << strerror(errno));
  auto pid = fork();
  CVDR_EXPECT(pid >= 0, "Failed to fork: " << strerror(errno));
  if (pid == 0) {
    read_end->Close();
    if (daemon(/*nochdir*/ 1, /*noclose*/ 1) != 0) {
      Json::Value report(Json::objectValue);
      report["error"] = std::string("Failed to daemonize: ") + strerror(errno);
      Report(write_end, report);
      _exit(kDaemonizationError);
    }
    RunAgent(write_end, registry, cvd, service, opts);
  }
  // Explicitly close here, otherwise we may end up reading forever if the
  // agent dies.
  write_end->Close();
  // The direct child exits as soon as the agent is daemonized.
  int wstatus;
  if (TEMP_FAILURE_RETRY(waitpid(pid, &wstatus, 0)) != pid) {
    LOG(WARNING) << "Failed to wait for the agent's parent: " << strerror(errno);
  }

  std::string report;
  CVDR_EXPECT_GE(ReadAll(read_end, &report), 0,
                 "Failed to read the agent report: " << read_end->StrError());
  CVDR_EXPECT(!report.empty(), "The connection agent exited without reporting");
  auto json = CVDR_EXPECT(ParseJson(report), "Invalid agent report");
  if (json.isMember("error")) {
    return CVDR_ERR(json["error"].asString());
  }
  CVDR_EXPECT(HasValue(json, {"status"}), "Agent report has no status");
  return CVDR_EXPECT(ConnStatusFromJson(json["status"]));
}

}  // namespace cvdr
