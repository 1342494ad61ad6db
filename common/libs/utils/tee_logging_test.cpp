/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <stdlib.h>

#include <string>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/strings.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"
#include "common/libs/utils/tee_logging.h"

namespace bootdisk {

TEST(TeeLoggingTest, ParseSeverityAcceptsNamesAndNumbers) {
  EXPECT_THAT(ParseSeverity("verbose"), IsOkAndValue(android::base::VERBOSE));
  EXPECT_THAT(ParseSeverity("WARNING"), IsOkAndValue(android::base::WARNING));
  EXPECT_THAT(ParseSeverity("4"), IsOkAndValue(android::base::ERROR));
  EXPECT_THAT(ParseSeverity("LOUD"), IsError());
}

TEST(TeeLoggingTest, ConsoleSeverityFromEnvironment) {
  setenv("BOOTDISK_CONSOLE_SEVERITY", "debug", 1);
  EXPECT_EQ(ConsoleSeverity(), android::base::DEBUG);
  setenv("BOOTDISK_CONSOLE_SEVERITY", "nonsense", 1);
  EXPECT_EQ(ConsoleSeverity(), android::base::INFO);
  unsetenv("BOOTDISK_CONSOLE_SEVERITY");
  EXPECT_EQ(ConsoleSeverity(), android::base::INFO);
}

TEST(TeeLoggingTest, FileTargetFiltersBySeverity) {
  TemporaryFile file;
  SeverityTarget target{android::base::WARNING,
                        SharedFD::Open(file.path, O_WRONLY | O_APPEND)};
  ASSERT_TRUE(target.target->IsOpen());
  TeeLogger logger({target});

  logger(android::base::DEFAULT, android::base::INFO, "mkbootdisk", "x.cpp",
         1, "quiet");
  logger(android::base::DEFAULT, android::base::ERROR, "mkbootdisk", "x.cpp",
         2, "first\nsecond");

  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(file.path, &contents));
  EXPECT_EQ(contents.find("quiet"), std::string::npos);
  auto lines = android::base::Split(android::base::Trim(contents), "\n");
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("] first"), std::string::npos);
  EXPECT_NE(lines[1].find("] second"), std::string::npos);
}

TEST(TeeLoggingTest, UnwritableLogFileFails) {
  EXPECT_THAT(LogToStderrAndFiles({"/nonexistent/dir/bootdisk.log"}),
              IsError());
}

}  // namespace bootdisk
