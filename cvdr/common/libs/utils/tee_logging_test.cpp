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

#include "cvdr/common/libs/utils/tee_logging.h"

#include <string>

#include <android-base/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "cvdr/common/libs/fs/shared_buf.h"
#include "cvdr/common/libs/fs/shared_fd.h"
#include "cvdr/common/libs/utils/result_matchers.h"

namespace cvdr {

using ::testing::HasSubstr;
using ::testing::Not;

TEST(TeeLoggingTest, SeverityNames) {
  auto severity = ToSeverity("warning");
  ASSERT_THAT(severity, IsOk());
  EXPECT_EQ(*severity, android::base::WARNING);
  EXPECT_EQ(FromSeverity(android::base::DEBUG), "DEBUG");

  auto numeric = ToSeverity(std::to_string(android::base::ERROR));
  ASSERT_THAT(numeric, IsOk());
  EXPECT_EQ(*numeric, android::base::ERROR);

  EXPECT_THAT(ToSeverity("LOUD"), IsError());
}

TEST(TeeLoggingTest, FiltersBySeverityPerTarget) {
  SharedFD verbose_read, verbose_write;
  ASSERT_TRUE(SharedFD::Pipe(&verbose_read, &verbose_write));
  SharedFD errors_read, errors_write;
  ASSERT_TRUE(SharedFD::Pipe(&errors_read, &errors_write));

  {
    TeeLogger logger({
        {android::base::VERBOSE, verbose_write, MetadataLevel::ONLY_MESSAGE},
        {android::base::ERROR, errors_write, MetadataLevel::TAG_AND_MESSAGE},
    });
    logger(android::base::DEFAULT, android::base::INFO, "cvdr", __FILE__,
           __LINE__, "first\nsecond");
    logger(android::base::DEFAULT, android::base::ERROR, "cvdr", __FILE__,
           __LINE__, "broken");
  }
  verbose_write->Close();
  errors_write->Close();

  std::string verbose;
  ASSERT_GE(ReadAll(verbose_read, &verbose), 0);
  EXPECT_EQ(verbose, "first\nsecond\nbroken\n");

  std::string errors;
  ASSERT_GE(ReadAll(errors_read, &errors), 0);
  EXPECT_EQ(errors, "cvdr broken\n");
  EXPECT_THAT(errors, Not(HasSubstr("first")));
}

TEST(TeeLoggingTest, FullMetadataIncludesLocation) {
  SharedFD read_end, write_end;
  ASSERT_TRUE(SharedFD::Pipe(&read_end, &write_end));
  {
    TeeLogger logger({{android::base::VERBOSE, write_end, MetadataLevel::FULL}});
    logger(android::base::DEFAULT, android::base::WARNING, "cvdr", "file.cpp",
           42, "careful");
  }
  write_end->Close();
  std::string output;
  ASSERT_GE(ReadAll(read_end, &output), 0);
  EXPECT_THAT(output, HasSubstr(" W "));
  EXPECT_THAT(output, HasSubstr("file.cpp:42] careful"));
}

}  // namespace cvdr
