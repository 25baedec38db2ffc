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

#include "cvdr/host/libs/connection/ice_config.h"

#include <string>
#include <vector>

#include "cvdr/common/libs/utils/files.h"
#include "cvdr/common/libs/utils/json.h"

namespace cvdr {
namespace {

const std::vector<std::string> kIceServerMembers = {"urls", "username",
                                                    "credential"};

Result<IceServer> IceServerFromJson(const Json::Value& value) {
  CVDR_EXPECT(ExpectOnlyMembers(value, kIceServerMembers));
  IceServer server;
  if (value.isMember("urls")) {
    const auto& urls = value["urls"];
    // A single url string is accepted as well as a list.
    if (urls.isString()) {
      server.urls.push_back(urls.asString());
    } else {
      CVDR_EXPECT(urls.isArray(), "\"urls\" must be a string or a list");
      for (const auto& url : urls) {
        server.urls.push_back(CVDR_EXPECT(As<std::string>(url)));
      }
    }
  }
  if (value.isMember("username")) {
    server.username = CVDR_EXPECT(GetValue<std::string>(value, {"username"}));
  }
  if (value.isMember("credential")) {
    server.credential =
        CVDR_EXPECT(GetValue<std::string>(value, {"credential"}));
  }
  return server;
}

}  // namespace

Json::Value ToJson(const IceConfig& config) {
  Json::Value servers(Json::arrayValue);
  for (const auto& server : config.ice_servers) {
    Json::Value json_server(Json::objectValue);
    Json::Value urls(Json::arrayValue);
    for (const auto& url : server.urls) {
      urls.append(url);
    }
    json_server["urls"] = urls;
    if (!server.username.empty()) {
      json_server["username"] = server.username;
    }
    if (!server.credential.empty()) {
      json_server["credential"] = server.credential;
    }
    servers.append(json_server);
  }
  Json::Value value(Json::objectValue);
  value["ice_servers"] = servers;
  return value;
}

Result<IceConfig> IceConfigFromJson(const Json::Value& value) {
  CVDR_EXPECT(value.isObject(), "ICE config must be a JSON object");
  IceConfig config;
  if (!value.isMember("ice_servers")) {
    return config;
  }
  const auto& servers = value["ice_servers"];
  CVDR_EXPECT(servers.isArray(), "\"ice_servers\" must be a list");
  for (Json::ArrayIndex i = 0; i < servers.size(); i++) {
    config.ice_servers.push_back(CVDR_EXPECTF(IceServerFromJson(servers[i]),
                                              "Invalid ICE server at {}", i));
  }
  return config;
}

Result<IceConfig> LoadIceConfigFromFile(const std::string& path) {
  CVDR_EXPECTF(FileExists(path), "ICE config file \"{}\" does not exist", path);
  auto json = CVDR_EXPECT(LoadFromFile(path));
  CVDR_EXPECTF(HasValue(json, {"config"}), "Missing \"config\" in \"{}\"",
               path);
  return CVDR_EXPECTF(IceConfigFromJson(json["config"]),
                      "Invalid ICE config in \"{}\"", path);
}

}  // namespace cvdr
