//
// Copyright (C) 2026 The Android Open Source Project
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

#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <android-base/expected.h>  // IWYU pragma: export
#include <fmt/core.h>               // IWYU pragma: export
#include <fmt/format.h>

namespace bootdisk {

class StackTraceError;

// One frame of a failure: where it was raised and what the caller had to say
// about it.
class StackTraceEntry {
 public:
  StackTraceEntry(std::string file, size_t line, std::string pretty_function)
      : file_(std::move(file)),
        line_(line),
        pretty_function_(std::move(pretty_function)) {}

  StackTraceEntry(std::string file, size_t line, std::string pretty_function,
                  std::string expression)
      : file_(std::move(file)),
        line_(line),
        pretty_function_(std::move(pretty_function)),
        expression_(std::move(expression)) {}

  StackTraceEntry(const StackTraceEntry& other)
      : file_(other.file_),
        line_(other.line_),
        pretty_function_(other.pretty_function_),
        expression_(other.expression_),
        message_(other.message_.str()) {}

  StackTraceEntry(StackTraceEntry&&) = default;
  StackTraceEntry& operator=(const StackTraceEntry& other) {
    file_ = other.file_;
    line_ = other.line_;
    pretty_function_ = other.pretty_function_;
    expression_ = other.expression_;
    message_.str(other.message_.str());
    return *this;
  }
  StackTraceEntry& operator=(StackTraceEntry&&) = default;

  template <typename T>
  StackTraceEntry& operator<<(T&& message_ext) & {
    message_ << std::forward<T>(message_ext);
    return *this;
  }
  template <typename T>
  StackTraceEntry operator<<(T&& message_ext) && {
    message_ << std::forward<T>(message_ext);
    return std::move(*this);
  }

  operator StackTraceError() &&;
  template <typename T>
  operator android::base::expected<T, StackTraceError>() &&;

  bool HasMessage() const { return !message_.str().empty(); }

  void Write(std::ostream& stream) const { stream << message_.str(); }
  void WriteVerbose(std::ostream& stream) const {
    auto str = message_.str();
    if (str.empty()) {
      stream << "Failure\n";
    } else {
      stream << str << "\n";
    }
    stream << "  at " << file_ << ":" << line_ << "\n";
    stream << "  in " << pretty_function_ << "\n";
    if (!expression_.empty()) {
      stream << "  for BD_EXPECT(" << expression_ << ")\n";
    }
  }

 private:
  std::string file_;
  size_t line_;
  std::string pretty_function_;
  std::string expression_;
  std::stringstream message_;
};

#define BD_STACK_TRACE_ENTRY(expression) \
  StackTraceEntry(__FILE__, __LINE__, __PRETTY_FUNCTION__, expression)

class StackTraceError {
 public:
  StackTraceError& PushEntry(StackTraceEntry entry) & {
    stack_.emplace_back(std::move(entry));
    return *this;
  }
  StackTraceError PushEntry(StackTraceEntry entry) && {
    stack_.emplace_back(std::move(entry));
    return std::move(*this);
  }
  const std::vector<StackTraceEntry>& Stack() const { return stack_; }

  // Messages from the outermost frame to the innermost, joined by ": ".
  std::string Message() const {
    std::stringstream writer;
    bool first = true;
    for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
      if (!it->HasMessage()) {
        continue;
      }
      if (!first) {
        writer << ": ";
      }
      it->Write(writer);
      first = false;
    }
    return writer.str();
  }

  std::string Trace() const {
    std::stringstream writer;
    for (const auto& entry : stack_) {
      entry.WriteVerbose(writer);
    }
    return writer.str();
  }

  template <typename T>
  operator android::base::expected<T, StackTraceError>() && {
    return android::base::unexpected(std::move(*this));
  }

 private:
  std::vector<StackTraceEntry> stack_;
};

inline StackTraceEntry::operator StackTraceError() && {
  return StackTraceError().PushEntry(std::move(*this));
}

template <typename T>
inline StackTraceEntry::operator android::base::expected<T,
                                                         StackTraceError>() && {
  return android::base::unexpected(std::move(*this));
}

template <typename T>
using Result = android::base::expected<T, StackTraceError>;

/**
 * Error return macro that records the location of the failure.
 *
 * Example usage:
 *
 *     if (mkdir(path.c_str(), 0755) != 0) {
 *       return BD_ERRNO("mkdir(\"" << path << "\") failed: "
 *                       << strerror(errno));
 *     }
 */
#define BD_ERR(MSG) (BD_STACK_TRACE_ENTRY("") << MSG)
#define BD_ERRNO(MSG) (BD_STACK_TRACE_ENTRY("") << MSG)
#define BD_ERRF(MSG, ...) \
  (BD_STACK_TRACE_ENTRY("") << fmt::format(FMT_STRING(MSG), __VA_ARGS__))

template <typename T>
T OutcomeDereference(std::optional<T>&& value) {
  return std::move(*value);
}

template <typename T>
typename std::conditional_t<std::is_void_v<T>, bool, T> OutcomeDereference(
    Result<T>&& result) {
  if constexpr (std::is_void<T>::value) {
    return result.ok();
  } else {
    return std::move(*result);
  }
}

template <typename T>
typename std::enable_if<std::is_convertible_v<T, bool>, T>::type
OutcomeDereference(T&& value) {
  return std::forward<T>(value);
}

inline bool TypeIsSuccess(bool value) { return value; }

template <typename T>
bool TypeIsSuccess(std::optional<T>& value) {
  return value.has_value();
}

template <typename T>
bool TypeIsSuccess(Result<T>& value) {
  return value.ok();
}

template <typename T>
bool TypeIsSuccess(Result<T>&& value) {
  return value.ok();
}

inline auto ErrorFromType(bool) { return StackTraceError(); }

template <typename T>
inline auto ErrorFromType(std::optional<T>) {
  return StackTraceError();
}

template <typename T>
auto ErrorFromType(Result<T>& value) {
  return value.error();
}

template <typename T>
auto ErrorFromType(Result<T>&& value) {
  return value.error();
}

#define BD_EXPECT_OVERLOAD(_1, _2, NAME, ...) NAME

#define BD_EXPECT2(RESULT, MSG)                               \
  ({                                                          \
    decltype(RESULT)&& macro_intermediate_result = RESULT;    \
    if (!TypeIsSuccess(macro_intermediate_result)) {          \
      auto current_entry = BD_STACK_TRACE_ENTRY(#RESULT);     \
      current_entry << MSG;                                   \
      auto error = ErrorFromType(macro_intermediate_result);  \
      error.PushEntry(std::move(current_entry));              \
      return error;                                           \
    };                                                        \
    OutcomeDereference(std::move(macro_intermediate_result)); \
  })

#define BD_EXPECT1(RESULT) BD_EXPECT2(RESULT, "")

/**
 * Error propagation macro that can be used as an expression.
 *
 * The first argument can be either a Result or a type that is convertible to
 * a boolean. A successful result evaluates to the value inside the result;
 * a value that converts to `true` evaluates to itself.
 *
 * On failure the enclosing function returns a failing Result that carries
 * the call site, the optional message and the inner error if there was one.
 * Only usable in functions that return a Result.
 *
 *     Result<std::string> CreateMountPoint() {
 *       std::string dir = BD_EXPECT(CreateTempDirectory("mnt"),
 *                                   "Failed to create mount point");
 *       return dir;
 *     }
 */
#define BD_EXPECT(...) \
  BD_EXPECT_OVERLOAD(__VA_ARGS__, BD_EXPECT2, BD_EXPECT1)(__VA_ARGS__)

#define BD_EXPECTF(RESULT, MSG, ...) \
  BD_EXPECT(RESULT, fmt::format(FMT_STRING(MSG), __VA_ARGS__))

#define BD_COMPARE_EXPECT4(COMPARE_OP, LHS_RESULT, RHS_RESULT, MSG)         \
  ({                                                                        \
    auto&& lhs_macro_intermediate_result = LHS_RESULT;                      \
    auto&& rhs_macro_intermediate_result = RHS_RESULT;                      \
    bool comparison_result = lhs_macro_intermediate_result COMPARE_OP       \
        rhs_macro_intermediate_result;                                      \
    if (!comparison_result) {                                               \
      auto current_entry = BD_STACK_TRACE_ENTRY("");                        \
      current_entry << "Expected \"" << #LHS_RESULT << "\" " << #COMPARE_OP \
                    << " \"" << #RHS_RESULT << "\" but was "                \
                    << lhs_macro_intermediate_result << " vs "              \
                    << rhs_macro_intermediate_result << ". ";               \
      current_entry << MSG;                                                 \
      auto error = ErrorFromType(false);                                    \
      error.PushEntry(std::move(current_entry));                            \
      return error;                                                         \
    };                                                                      \
    comparison_result;                                                      \
  })

#define BD_COMPARE_EXPECT3(COMPARE_OP, LHS_RESULT, RHS_RESULT) \
  BD_COMPARE_EXPECT4(COMPARE_OP, LHS_RESULT, RHS_RESULT, "")

#define BD_COMPARE_EXPECT_OVERLOAD(_1, _2, _3, _4, NAME, ...) NAME

#define BD_COMPARE_EXPECT(...)                                \
  BD_COMPARE_EXPECT_OVERLOAD(__VA_ARGS__, BD_COMPARE_EXPECT4, \
                             BD_COMPARE_EXPECT3)              \
  (__VA_ARGS__)

#define BD_EXPECT_EQ(LHS_RESULT, RHS_RESULT, ...) \
  BD_COMPARE_EXPECT(==, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define BD_EXPECT_NE(LHS_RESULT, RHS_RESULT, ...) \
  BD_COMPARE_EXPECT(!=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define BD_EXPECT_LE(LHS_RESULT, RHS_RESULT, ...) \
  BD_COMPARE_EXPECT(<=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)
#define BD_EXPECT_GE(LHS_RESULT, RHS_RESULT, ...) \
  BD_COMPARE_EXPECT(>=, LHS_RESULT, RHS_RESULT, ##__VA_ARGS__)

}  // namespace bootdisk
