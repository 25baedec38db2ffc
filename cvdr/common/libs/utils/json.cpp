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

#include "cvdr/common/libs/utils/json.h"

#include <fcntl.h>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>

#include "cvdr/common/libs/fs/shared_buf.h"
#include "cvdr/common/libs/fs/shared_fd.h"

namespace cvdr {

Result<Json::Value> ParseJson(std::string_view input) {
  Json::Value root;
  JSONCPP_STRING err;
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  auto begin = input.data();
  auto end = begin + input.length();
  CVDR_EXPECT(reader->parse(begin, end, &root, &err), err);
  return root;
}

Result<Json::Value> LoadFromFile(SharedFD json_fd) {
  CVDR_EXPECT(json_fd->IsOpen(),
              "json_fd is not open: " << json_fd->StrError());
  std::string json_contents;
  CVDR_EXPECT_GE(ReadAll(json_fd, &json_contents), 0,
                 "ReadAll() failed: " << json_fd->StrError());
  return CVDR_EXPECTF(ParseJson(json_contents), "Failed to parse json: \n{}",
                      json_contents);
}

Result<Json::Value> LoadFromFile(const std::string& path_to_file) {
  SharedFD json_fd = SharedFD::Open(path_to_file, O_RDONLY);
  return CVDR_EXPECTF(LoadFromFile(json_fd), "Failed to load \"{}\"",
                      path_to_file);
}

std::string SerializeJson(const Json::Value& value) {
  Json::StreamWriterBuilder factory;
  factory["indentation"] = "";
  return Json::writeString(factory, value);
}

Result<void> ExpectOnlyMembers(const Json::Value& root,
                               const std::vector<std::string>& allowed) {
  CVDR_EXPECT(root.isObject(), "Expected a JSON object");
  for (const auto& member : root.getMemberNames()) {
    CVDR_EXPECTF(
        std::find(allowed.begin(), allowed.end(), member) != allowed.end(),
        "Unknown member \"{}\"", member);
  }
  return {};
}

}  // namespace cvdr
