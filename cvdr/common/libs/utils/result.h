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

#include <string.h>

#include <cerrno>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <android-base/logging.h>
#include <android-base/result.h>  // IWYU pragma: export
#include <fmt/core.h>             // IWYU pragma: export

namespace cvdr {

class StackTraceError;

// One frame of a failure: where it was raised or propagated, and what the
// code at that point had to say about it.
class StackTraceEntry {
 public:
  StackTraceEntry(std::string file, size_t line, std::string function,
                  std::string expression = "")
      : file_(std::move(file)),
        line_(line),
        function_(std::move(function)),
        expression_(std::move(expression)) {}

  template <typename T>
  StackTraceEntry& operator<<(const T& value) & {
    Append(value);
    return *this;
  }
  template <typename T>
  StackTraceEntry operator<<(const T& value) && {
    Append(value);
    return std::move(*this);
  }

  operator StackTraceError() &&;
  template <typename T>
  operator android::base::expected<T, StackTraceError>() &&;

  const std::string& message() const { return message_; }

  void WriteVerbose(std::ostream& out) const {
    out << (message_.empty() ? "Failure" : message_) << "\n";
    out << " at " << file_ << ":" << line_ << " in " << function_;
    if (!expression_.empty()) {
      out << " for CVDR_EXPECT(" << expression_ << ")";
    }
    out << "\n";
  }

 private:
  template <typename T>
  void Append(const T& value) {
    std::ostringstream out;
    out << value;
    message_ += out.str();
  }

  std::string file_;
  size_t line_;
  std::string function_;
  std::string expression_;
  std::string message_;
};

#define CVDR_STACK_TRACE_ENTRY(expression) \
  StackTraceEntry(__FILE__, __LINE__, __PRETTY_FUNCTION__, expression)

// Innermost entry first.
class StackTraceError {
 public:
  StackTraceError& PushEntry(StackTraceEntry entry) & {
    stack_.emplace_back(std::move(entry));
    return *this;
  }

  // Non empty messages, outermost first, separated by ": ".
  std::string Message() const {
    std::string message;
    for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
      if (it->message().empty()) {
        continue;
      }
      if (!message.empty()) {
        message += ": ";
      }
      message += it->message();
    }
    return message;
  }

  std::string Trace() const {
    std::stringstream out;
    for (const auto& entry : stack_) {
      entry.WriteVerbose(out);
    }
    return out.str();
  }

  template <typename T>
  operator android::base::expected<T, StackTraceError>() && {
    return android::base::unexpected(std::move(*this));
  }

 private:
  std::vector<StackTraceEntry> stack_;
};

inline StackTraceEntry::operator StackTraceError() && {
  StackTraceError error;
  error.PushEntry(std::move(*this));
  return error;
}

template <typename T>
inline StackTraceEntry::operator android::base::expected<T,
                                                         StackTraceError>() && {
  return android::base::unexpected(StackTraceError(std::move(*this)));
}

inline std::ostream& operator<<(std::ostream& out,
                                const StackTraceError& error) {
  return out << error.Message();
}

template <typename T>
using Result = android::base::expected<T, StackTraceError>;

/**
 * Joins the messages of independent failures, one per line. Used by
 * operations that keep going after an individual item fails and report the
 * accumulated failures together with their partial results.
 */
inline std::string JoinErrorMessages(
    const std::vector<StackTraceError>& errors) {
  std::string joined;
  for (const auto& error : errors) {
    if (!joined.empty()) {
      joined += "\n";
    }
    joined += error.Message();
  }
  return joined;
}

/**
 * Builds a failure carrying the call site. CVDR_ERRNO appends the text of
 * the current errno, captured before the message is evaluated.
 *
 *     if (mkdir(path.c_str(), 0700) != 0) {
 *       return CVDR_ERRNO("mkdir(\"" << path << "\") failed");
 *     }
 */
#define CVDR_ERR(MSG) (CVDR_STACK_TRACE_ENTRY("") << MSG)
#define CVDR_ERRNO(MSG)                                              \
  ({                                                                 \
    const int macro_saved_errno = errno;                             \
    CVDR_STACK_TRACE_ENTRY("") << MSG << ": "                        \
                               << strerror(macro_saved_errno);       \
  })
#define CVDR_ERRF(MSG, ...) \
  (CVDR_STACK_TRACE_ENTRY("") << fmt::format(FMT_STRING(MSG), __VA_ARGS__))

inline bool TypeIsSuccess(bool value) { return value; }

template <typename T>
bool TypeIsSuccess(Result<T>& value) {
  return value.ok();
}

inline StackTraceError ErrorFromType(bool) { return StackTraceError(); }

template <typename T>
StackTraceError ErrorFromType(Result<T>& value) {
  return value.error();
}

template <typename T>
std::conditional_t<std::is_void_v<T>, bool, T> OutcomeDereference(
    Result<T>&& result) {
  if constexpr (std::is_void_v<T>) {
    return result.ok();
  } else {
    return std::move(*result);
  }
}

template <typename T>
std::enable_if_t<std::is_convertible_v<T, bool>, T> OutcomeDereference(
    T&& value) {
  return std::forward<T>(value);
}

#define CVDR_EXPECT_OVERLOAD(_1, _2, NAME, ...) NAME

#define CVDR_EXPECT2(RESULT, MSG)                             \
  ({                                                          \
    decltype(RESULT)&& macro_intermediate_result = RESULT;    \
    if (!TypeIsSuccess(macro_intermediate_result)) {          \
      auto error = ErrorFromType(macro_intermediate_result);  \
      error.PushEntry(CVDR_STACK_TRACE_ENTRY(#RESULT) << MSG); \
      return error;                                           \
    };                                                        \
    OutcomeDereference(std::move(macro_intermediate_result)); \
  })

#define CVDR_EXPECT1(RESULT) CVDR_EXPECT2(RESULT, "")

/**
 * Propagates a failed Result or a false condition out of the enclosing
 * function, which must itself return a Result. On success evaluates to the
 * contained value, or to the condition itself.
 *
 *     Result<void> StartLogging() {
 *       SharedFD log = CVDR_EXPECT(OpenLog(), "Failed to open the log");
 *       CVDR_EXPECT(log->IsOpen());
 *       ...
 *     }
 */
#define CVDR_EXPECT(...) \
  CVDR_EXPECT_OVERLOAD(__VA_ARGS__, CVDR_EXPECT2, CVDR_EXPECT1)(__VA_ARGS__)

#define CVDR_EXPECTF(RESULT, MSG, ...) \
  CVDR_EXPECT(RESULT, fmt::format(FMT_STRING(MSG), __VA_ARGS__))

#define CVDR_COMPARE_EXPECT4(COMPARE_OP, LHS, RHS, MSG)                \
  ({                                                                  \
    auto&& macro_lhs = LHS;                                           \
    auto&& macro_rhs = RHS;                                           \
    if (!(macro_lhs COMPARE_OP macro_rhs)) {                          \
      StackTraceError error;                                          \
      error.PushEntry(CVDR_STACK_TRACE_ENTRY("")                      \
                      << "Expected " << #LHS << " " << #COMPARE_OP    \
                      << " " << #RHS << " but was " << macro_lhs      \
                      << " vs " << macro_rhs << ". " << MSG);         \
      return error;                                                   \
    }                                                                 \
    true;                                                             \
  })

#define CVDR_COMPARE_EXPECT3(COMPARE_OP, LHS, RHS) \
  CVDR_COMPARE_EXPECT4(COMPARE_OP, LHS, RHS, "")

#define CVDR_COMPARE_EXPECT_OVERLOAD(_1, _2, _3, _4, NAME, ...) NAME

#define CVDR_COMPARE_EXPECT(...)                                  \
  CVDR_COMPARE_EXPECT_OVERLOAD(__VA_ARGS__, CVDR_COMPARE_EXPECT4, \
                               CVDR_COMPARE_EXPECT3)              \
  (__VA_ARGS__)

#define CVDR_EXPECT_EQ(LHS, RHS, ...) \
  CVDR_COMPARE_EXPECT(==, LHS, RHS, ##__VA_ARGS__)
#define CVDR_EXPECT_LT(LHS, RHS, ...) \
  CVDR_COMPARE_EXPECT(<, LHS, RHS, ##__VA_ARGS__)
#define CVDR_EXPECT_GE(LHS, RHS, ...) \
  CVDR_COMPARE_EXPECT(>=, LHS, RHS, ##__VA_ARGS__)

}  // namespace cvdr
