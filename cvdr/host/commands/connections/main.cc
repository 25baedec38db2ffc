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

#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <gflags/gflags.h>

#include "cvdr/common/libs/utils/result.h"
#include "cvdr/common/libs/utils/tee_logging.h"
#include "cvdr/host/libs/connection/adb_server.h"
#include "cvdr/host/libs/connection/config.h"
#include "cvdr/host/libs/connection/conn_logs.h"
#include "cvdr/host/libs/connection/control_protocol.h"
#include "cvdr/host/libs/connection/registry.h"

DEFINE_string(config_file, "",
              "Comma separated list of JSON configuration files, later files "
              "override earlier ones");
DEFINE_string(control_dir, "",
              "Directory holding the connection control sockets, overrides "
              "the configuration");
DEFINE_string(host, "", "Only consider connections to devices in this host");
DEFINE_bool(long, false, "Include the service endpoint when listing");
DEFINE_int32(adb_server_port, cvdr::kDefaultAdbServerPort,
             "Port of the local ADB server");

namespace cvdr {
namespace {

constexpr char kUsage[] = R"(Manages the connections to remote devices.

usage: cvdr_connections <command> [flags]

commands:
  list                 List the connections to remote devices
  close [device...]    Close connections, all of them if no device is given
  prune_logs           Remove logs from connections inactive for too long
  version <socket>     Print the control protocol version of an agent
)";

Result<ConnectionConfig> LoadConfig() {
  std::vector<std::string> files;
  if (!FLAGS_config_file.empty()) {
    files = android::base::Split(FLAGS_config_file, ",");
  }
  auto config = CVDR_EXPECT(LoadConnectionConfig(files));
  if (!FLAGS_control_dir.empty()) {
    config.connection_control_dir = FLAGS_control_dir;
  }
  return config;
}

std::vector<std::pair<RemoteCvdLocator, ConnStatus>> Filter(
    const ConnectionListing& listing, const std::set<std::string>& devices) {
  std::vector<std::pair<RemoteCvdLocator, ConnStatus>> ret;
  for (const auto& [cvd, status] : listing.statuses) {
    if (!FLAGS_host.empty() && cvd.host != FLAGS_host) {
      continue;
    }
    if (!devices.empty() && devices.count(cvd.webrtc_device_id) == 0) {
      continue;
    }
    ret.emplace_back(cvd, status);
  }
  return ret;
}

int ReportErrors(const std::vector<StackTraceError>& errors) {
  if (errors.empty()) {
    return 0;
  }
  LOG(ERROR) << JoinErrorMessages(errors);
  for (const auto& error : errors) {
    LOG(DEBUG) << error.Trace();
  }
  return 1;
}

Result<int> ListConnections(ConnectionRegistry& registry) {
  auto listing = registry.List();
  // Print the connections found even if some agents couldn't be reached.
  for (const auto& [cvd, status] : Filter(listing, {})) {
    std::string line = cvd.host + "/" + cvd.webrtc_device_id + " 127.0.0.1:" +
                       std::to_string(status.adb.port) + " " +
                       status.adb.state;
    if (FLAGS_long) {
      line = cvd.service_root_endpoint + ": " + line;
    }
    std::cout << line << std::endl;
  }
  return ReportErrors(listing.errors);
}

Result<int> CloseConnections(ConnectionRegistry& registry,
                             const std::vector<std::string>& args) {
  std::set<std::string> devices(args.begin(), args.end());
  auto listing = registry.List();
  auto matches = Filter(listing, devices);
  CVDR_EXPECT(!matches.empty(), "No connections found");
  AdbServerProxyImpl adb_server(FLAGS_adb_server_port);
  std::vector<StackTraceError> errors = listing.errors;
  for (const auto& [cvd, status] : matches) {
    auto stopped = registry.Disconnect(cvd);
    if (!stopped.ok()) {
      errors.push_back(stopped.error());
      continue;
    }
    auto disconnected = adb_server.Disconnect(status.adb.port);
    if (!disconnected.ok()) {
      LOG(WARNING) << "Failed to disconnect ADB from " << cvd << ": "
                   << disconnected.error().Message();
    }
    std::cout << cvd << ": closed" << std::endl;
  }
  return ReportErrors(errors);
}

Result<int> PruneLogs(const ConnectionConfig& config,
                      const std::string& control_dir) {
  auto cleanup = CVDR_EXPECT(
      MaybeCleanOldLogs(control_dir, config.LogFilesDeleteThreshold()));
  LOG(INFO) << "Removed " << cleanup.removed << " log files";
  return ReportErrors(cleanup.errors);
}

Result<int> PrintVersion(ControlClient& client,
                         const std::vector<std::string>& args) {
  CVDR_EXPECT_EQ(args.size(), 1u, "Expected the path to a control socket");
  auto version = CVDR_EXPECT(client.Version(args[0]));
  std::cout << version << std::endl;
  return 0;
}

Result<int> ConnectionsMain(const std::vector<std::string>& args) {
  CVDR_EXPECT(!args.empty(), "Missing command\n" << kUsage);
  const auto& command = args[0];
  std::vector<std::string> command_args(args.begin() + 1, args.end());

  auto config = CVDR_EXPECT(LoadConfig());
  auto control_dir = CVDR_EXPECT(config.ControlDirExpanded());
  CVDR_EXPECT(EnsureConnDirsExist(control_dir));
  UnixControlClient client;
  ConnectionRegistry registry(control_dir, client);

  if (command == "list") {
    return CVDR_EXPECT(ListConnections(registry));
  } else if (command == "close") {
    return CVDR_EXPECT(CloseConnections(registry, command_args));
  } else if (command == "prune_logs") {
    return CVDR_EXPECT(PruneLogs(config, control_dir));
  } else if (command == "version") {
    return CVDR_EXPECT(PrintVersion(client, command_args));
  }
  return CVDR_ERR("Unknown command \"" << command << "\"\n" << kUsage);
}

}  // namespace
}  // namespace cvdr

int main(int argc, char** argv) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  ::android::base::SetMinimumLogSeverity(cvdr::ConsoleSeverity());
  gflags::SetUsageMessage(cvdr::kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  std::vector<std::string> args(argv + 1, argv + argc);
  auto result = cvdr::ConnectionsMain(args);
  if (!result.ok()) {
    LOG(ERROR) << result.error().Message();
    LOG(DEBUG) << result.error().Trace();
    return 1;
  }
  return *result;
}
