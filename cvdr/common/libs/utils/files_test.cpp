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

#include "cvdr/common/libs/utils/files.h"

#include <stdlib.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "cvdr/common/libs/fs/shared_fd.h"
#include "cvdr/common/libs/utils/result_matchers.h"

namespace cvdr {

using ::testing::HasSubstr;
using ::testing::UnorderedElementsAre;

TEST(FilesTest, EnsureDirectoryExistsCreatesParents) {
  TemporaryDir dir;
  std::string nested = std::string(dir.path) + "/a/b/c";
  ASSERT_THAT(EnsureDirectoryExists(nested), IsOk());
  EXPECT_TRUE(DirectoryExists(nested));
  // A second call is a no-op.
  EXPECT_THAT(EnsureDirectoryExists(nested), IsOk());
}

TEST(FilesTest, DirectoryContentsSkipsDots) {
  TemporaryDir dir;
  ASSERT_TRUE(android::base::WriteStringToFile("", std::string(dir.path) + "/f"));
  ASSERT_THAT(EnsureDirectoryExists(std::string(dir.path) + "/d"), IsOk());
  auto contents = DirectoryContents(dir.path);
  ASSERT_THAT(contents, IsOk());
  EXPECT_THAT(*contents, UnorderedElementsAre("f", "d"));
}

TEST(FilesTest, DirectoryContentsOfMissingDirectory) {
  EXPECT_THAT(DirectoryContents("/nonexistent/dir"), IsError());
}

TEST(FilesTest, IsSocketOnlyForSockets) {
  TemporaryDir dir;
  std::string file = std::string(dir.path) + "/file";
  ASSERT_TRUE(android::base::WriteStringToFile("", file));
  std::string sock = std::string(dir.path) + "/sock";
  auto server = SharedFD::SocketLocalServer(sock, false, SOCK_STREAM, 0600);
  ASSERT_TRUE(server->IsOpen()) << server->StrError();

  EXPECT_TRUE(IsSocket(sock));
  EXPECT_FALSE(IsSocket(file));
  EXPECT_FALSE(IsSocket(dir.path));
}

TEST(FilesTest, RemoveFile) {
  TemporaryDir dir;
  std::string file = std::string(dir.path) + "/file";
  ASSERT_TRUE(android::base::WriteStringToFile("", file));
  EXPECT_THAT(RemoveFile(file), IsOk());
  EXPECT_FALSE(FileExists(file));
  EXPECT_THAT(RemoveFile(file), IsError());
}

TEST(FilesTest, ExpandPathUsesHome) {
  setenv("HOME", "/home/someone", 1);
  auto expanded = ExpandPath("~/.cvdr/connections");
  ASSERT_THAT(expanded, IsOk());
  EXPECT_EQ(*expanded, "/home/someone/.cvdr/connections");

  auto bare = ExpandPath("~");
  ASSERT_THAT(bare, IsOk());
  EXPECT_EQ(*bare, "/home/someone");

  auto absolute = ExpandPath("/var/run/cvdr");
  ASSERT_THAT(absolute, IsOk());
  EXPECT_EQ(*absolute, "/var/run/cvdr");
}

TEST(FilesTest, ExpandPathRejectsOtherUsers) {
  setenv("HOME", "/home/someone", 1);
  auto expanded = ExpandPath("~other/dir");
  ASSERT_THAT(expanded, IsError());
  EXPECT_THAT(expanded.error().Message(), HasSubstr("~other/dir"));
}

}  // namespace cvdr
