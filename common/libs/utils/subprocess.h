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
#pragma once

#include <sys/types.h>

#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/result.h"

namespace bootdisk {

class Subprocess {
 public:
  enum class StdIOChannel {
    kStdIn = 0,
    kStdOut = 1,
    kStdErr = 2,
  };

  explicit Subprocess(pid_t pid) : pid_(pid), started_(pid > 0) {}
  Subprocess(Subprocess&&);
  ~Subprocess() = default;
  Subprocess& operator=(Subprocess&&);
  // Waits for the subprocess to complete. Returns zero if completed
  // successfully, non-zero otherwise.
  int Wait();
  // Same as waitpid(2)
  pid_t Wait(int* wstatus, int options);
  bool Started() const { return started_; }
  pid_t pid() const { return pid_; }

 private:
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  pid_t pid_ = -1;
  bool started_ = false;
};

class SubprocessOptions {
 public:
  SubprocessOptions()
      : verbose_(true), exit_with_parent_(true), in_group_(false) {}

  // The subprocess runs in its own process group, out of reach of a terminal
  // ^C aimed at this process.
  SubprocessOptions& InGroup(bool in_group) &;
  SubprocessOptions InGroup(bool in_group) &&;

  bool Verbose() const { return verbose_; }
  bool ExitWithParent() const { return exit_with_parent_; }
  bool InGroup() const { return in_group_; }

 private:
  bool verbose_;
  bool exit_with_parent_;
  bool in_group_;
};

// An executable command. Multiple subprocesses can be started from the same
// command object.
class Command {
 private:
  template <typename T>
  void BuildParameter(std::stringstream* stream, T t) {
    *stream << t;
  }
  template <typename T, typename... Args>
  void BuildParameter(std::stringstream* stream, T t, Args... args) {
    BuildParameter(stream, t);
    BuildParameter(stream, args...);
  }

 public:
  // `executable` is either a path or a name looked up on PATH when the
  // command starts.
  explicit Command(std::string executable);
  Command(Command&&) = default;
  Command& operator=(Command&&) = default;
  Command(const Command&) = delete;
  Command& operator=(const Command&) = delete;
  ~Command();

  template <typename... Args>
  Command& AddParameter(Args... args) & {
    std::stringstream ss;
    BuildParameter(&ss, args...);
    command_.push_back(ss.str());
    return *this;
  }
  template <typename... Args>
  Command AddParameter(Args... args) && {
    return std::move(AddParameter(std::forward<Args>(args)...));
  }

  // Redirects the standard IO of the command.
  Command& RedirectStdIO(Subprocess::StdIOChannel channel,
                         SharedFD shared_fd) &;
  Command RedirectStdIO(Subprocess::StdIOChannel channel,
                        SharedFD shared_fd) &&;

  // Starts execution of the command. This method can be called multiple times,
  // effectively staring multiple (possibly concurrent) instances.
  Subprocess Start(SubprocessOptions options = SubprocessOptions()) const;

  const std::string& GetShortName() const { return command_[0]; }
  // The command line as one shell-like string, for logs and error messages.
  std::string ToString() const;

 private:
  std::vector<std::string> command_;
  std::map<Subprocess::StdIOChannel, int> redirects_{};
};

// Locates `name` the way execvp(3) would. Names containing a '/' are only
// checked for being executable.
Result<std::string> FindExecutable(const std::string& name);

/*
 * Consumes a Command and runs it, optionally managing the stdio channels.
 *
 * If `stdin` is set, the subprocess stdin will be pipe providing its contents.
 * If `stdout` is set, the subprocess stdout will be captured and saved to it.
 * If `stderr` is set, the subprocess stderr will be captured and saved to it.
 *
 * If `command` exits normally, the lower 8 bits of the return code will be
 * returned in a value between 0 and 255.
 * If some setup fails, `command` fails to start, or `command` exits due to a
 * signal, the return value will be negative.
 */
int RunWithManagedStdio(Command&& command, const std::string* stdin,
                        std::string* stdout, std::string* stderr,
                        SubprocessOptions options = SubprocessOptions());

// Same as Command(command[0]).AddParameter(...).Start().Wait(). Returns zero
// if the process completed successfully, non zero otherwise.
int Execute(const std::vector<std::string>& command,
            SubprocessOptions options = SubprocessOptions());

// Runs `command` to completion, failing unless it exits with status zero.
// The failure message carries the exit status and whatever the command wrote
// to stderr. Returns the captured stdout.
Result<std::string> RunAndCaptureStdout(
    Command&& command, SubprocessOptions options = SubprocessOptions());

}  // namespace bootdisk
