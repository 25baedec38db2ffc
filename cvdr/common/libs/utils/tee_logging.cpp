/*
 * Copyright (C) 2024 The Android Open Source Project
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

#include "cvdr/common/libs/utils/tee_logging.h"

#include <inttypes.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include <string>
#include <utility>
#include <vector>

#include <android-base/macros.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>
#include <android-base/threads.h>

#include "cvdr/common/libs/fs/shared_buf.h"

using android::base::GetThreadId;
using android::base::LogSeverity;
using android::base::StringPrintf;

namespace cvdr {
namespace {

struct SeverityName {
  LogSeverity severity;
  const char* name;
};

const SeverityName kSeverityNames[] = {
    {android::base::VERBOSE, "VERBOSE"},
    {android::base::DEBUG, "DEBUG"},
    {android::base::INFO, "INFO"},
    {android::base::WARNING, "WARNING"},
    {android::base::ERROR, "ERROR"},
    {android::base::FATAL_WITHOUT_ABORT, "FATAL_WITHOUT_ABORT"},
    {android::base::FATAL, "FATAL"},
};

LogSeverity GuessSeverity(const std::string& env_var,
                          LogSeverity default_value) {
  char* env_cstr = getenv(env_var.c_str());
  if (env_cstr == nullptr) {
    return default_value;
  }
  auto severity = ToSeverity(env_cstr);
  return severity.ok() ? *severity : default_value;
}

std::string LinePrefix(const struct tm& now, int pid, uint64_t tid,
                       LogSeverity severity, const char* tag, const char* file,
                       unsigned int line, MetadataLevel level) {
  static const char log_characters[] = "VDIWEFF";
  static_assert(arraysize(log_characters) - 1 == android::base::FATAL + 1,
                "Mismatch in size of log_characters and values in LogSeverity");
  char severity_char = log_characters[severity];
  switch (level) {
    case MetadataLevel::ONLY_MESSAGE:
      return "";
    case MetadataLevel::TAG_AND_MESSAGE:
      return StringPrintf("%s ", tag ? tag : "nullptr");
    case MetadataLevel::FULL:
      break;
  }
  char timestamp[32];
  strftime(timestamp, sizeof(timestamp), "%m-%d %H:%M:%S", &now);
  if (file != nullptr) {
    return StringPrintf("%s %c %s %5d %5" PRIu64 " %s:%u] ",
                        tag ? tag : "nullptr", severity_char, timestamp, pid,
                        tid, file, line);
  }
  return StringPrintf("%s %c %s %5d %5" PRIu64 " ", tag ? tag : "nullptr",
                      severity_char, timestamp, pid, tid);
}

// Prefixes every line of the message.
std::string FormatLines(const std::string& prefix, const char* message) {
  std::string output;
  const char* line_start = message;
  while (true) {
    const char* newline = strchr(line_start, '\n');
    output.append(prefix);
    if (newline == nullptr) {
      output.append(line_start);
      output.append("\n");
      break;
    }
    output.append(line_start, newline - line_start);
    output.append("\n");
    line_start = newline + 1;
  }
  return output;
}

}  // namespace

std::string FromSeverity(LogSeverity severity) {
  for (const auto& entry : kSeverityNames) {
    if (entry.severity == severity) {
      return entry.name;
    }
  }
  return "Unknown";
}

Result<LogSeverity> ToSeverity(const std::string& value) {
  for (const auto& entry : kSeverityNames) {
    if (android::base::EqualsIgnoreCase(value, entry.name) ||
        value == std::to_string(static_cast<int>(entry.severity))) {
      return entry.severity;
    }
  }
  return CVDR_ERRF("Unexpected log severity \"{}\"", value);
}

LogSeverity ConsoleSeverity() {
  return GuessSeverity("CVDR_CONSOLE_SEVERITY", android::base::INFO);
}

LogSeverity LogFileSeverity() {
  return GuessSeverity("CVDR_FILE_SEVERITY", android::base::VERBOSE);
}

TeeLogger::TeeLogger(const std::vector<SeverityTarget>& destinations)
    : destinations_(destinations) {}

void TeeLogger::operator()(android::base::LogId, LogSeverity severity,
                           const char* tag, const char* file,
                           unsigned int line, const char* message) {
  struct tm now;
  time_t t = time(nullptr);
  localtime_r(&t, &now);
  for (const auto& destination : destinations_) {
    if (severity < destination.severity) {
      continue;
    }
    auto prefix = LinePrefix(now, getpid(), GetThreadId(), severity, tag, file,
                             line, destination.metadata_level);
    WriteAll(destination.target, FormatLines(prefix, message));
  }
}

TeeLogger LogToFiles(const std::vector<SharedFD>& files) {
  std::vector<SeverityTarget> targets;
  for (const auto& file : files) {
    targets.push_back(
        SeverityTarget{LogFileSeverity(), file, MetadataLevel::FULL});
  }
  return TeeLogger(targets);
}

TeeLogger LogToStderrAndFiles(const std::vector<SharedFD>& files,
                              MetadataLevel stderr_level) {
  std::vector<SeverityTarget> targets;
  for (const auto& file : files) {
    targets.push_back(
        SeverityTarget{LogFileSeverity(), file, MetadataLevel::FULL});
  }
  targets.push_back(SeverityTarget{
      ConsoleSeverity(), SharedFD::Dup(/* stderr */ 2), stderr_level});
  return TeeLogger(targets);
}

}  // namespace cvdr
