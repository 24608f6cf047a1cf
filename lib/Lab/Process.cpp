//===- Process.cpp - Run toolchain commands in process groups -------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// llvm::sys::ExecuteAndWait cannot put the child in a new process group, so
// the launcher is written against POSIX directly. The exit of the group
// leader is observed with waitid(WNOWAIT) so that its pid, and with it the
// group id, stays reserved until the timeout timer has been disarmed.
//
//===----------------------------------------------------------------------===//

#include "mutants/Lab/Process.h"
#include "mutants/Support/MutantsError.h"
#include "mutants/Support/WallClockTimeout.h"

#include "llvm/ADT/ScopeExit.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Errno.h"
#include "llvm/Support/Program.h"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

extern char **environ;

#define DEBUG_TYPE "mutants-process"

using namespace mutants;
using llvm::StringRef;

namespace {
/// Sent from the child to the parent over a close-on-exec pipe when it
/// cannot start the command.
struct LaunchFailure {
  enum Stage : int { ChangeDirectory, Execute } stage;
  int error;
};
} // namespace

static double secondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

static llvm::Expected<std::string> resolveProgram(StringRef name) {
  if (name.contains('/'))
    return name.str();
  auto found = llvm::sys::findProgramByName(name);
  if (!found)
    return makeError(ErrorKind::Toolchain, "cannot find program '" + name +
                                               "': " +
                                               found.getError().message());
  return *found;
}

/// Return true once \p pid has terminated, without reaping it.
static bool hasExited(pid_t pid) {
  siginfo_t info;
  info.si_pid = 0;
  while (::waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
    if (errno != EINTR)
      return true;
  }
  return info.si_pid == pid;
}

/// Reap whatever is left of process group \p pgid and wait until no process
/// remains in it.
static void waitForGroupToExit(pid_t pgid) {
  auto start = std::chrono::steady_clock::now();
  while (true) {
    pid_t reaped = ::waitpid(-pgid, nullptr, WNOHANG);
    if (reaped > 0 || (reaped < 0 && errno == EINTR))
      continue;
    if (::kill(-pgid, 0) != 0)
      return;
    if (secondsSince(start) > 10) {
      LLVM_DEBUG(llvm::dbgs() << "process group " << pgid
                              << " still has members after SIGKILL\n");
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

llvm::Expected<ProcessResult>
mutants::runProcess(const ProcessOptions &options) {
  if (options.argv.empty())
    return makeError(ErrorKind::Toolchain, "empty command");
  auto program = resolveProgram(options.argv.front());
  if (!program)
    return program.takeError();

  int logFd = ::open(options.logPath.c_str(),
                     O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (logFd < 0)
    return makeError(ErrorKind::Isolation, "cannot open log " +
                                               options.logPath + ": " +
                                               llvm::sys::StrError(errno));
  auto closeLog = llvm::make_scope_exit([&] { ::close(logFd); });

  // The child may only make async-signal-safe calls, so everything it needs
  // is prepared before fork().
  std::vector<char *> argv;
  for (const std::string &arg : options.argv)
    argv.push_back(const_cast<char *>(arg.c_str()));
  argv.push_back(nullptr);
  std::vector<char *> envp;
  for (const std::string &entry : options.environment)
    envp.push_back(const_cast<char *>(entry.c_str()));
  envp.push_back(nullptr);
  const char *workingDirectory = options.workingDirectory.empty()
                                     ? nullptr
                                     : options.workingDirectory.c_str();

  // Other workers fork concurrently, so the pipe must be close-on-exec from
  // the moment it exists or their children would hold the write end open.
  int failurePipe[2];
#ifdef __linux__
  int pipeStatus = ::pipe2(failurePipe, O_CLOEXEC);
#else
  int pipeStatus = ::pipe(failurePipe);
  if (pipeStatus == 0) {
    ::fcntl(failurePipe[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(failurePipe[1], F_SETFD, FD_CLOEXEC);
  }
#endif
  if (pipeStatus != 0)
    return makeError(ErrorKind::Toolchain,
                     "cannot create pipe: " + llvm::sys::StrError(errno));

  pid_t pid = ::fork();
  if (pid < 0) {
    int error = errno;
    ::close(failurePipe[0]);
    ::close(failurePipe[1]);
    return makeError(ErrorKind::Toolchain,
                     "cannot fork: " + llvm::sys::StrError(error));
  }

  if (pid == 0) {
    ::close(failurePipe[0]);
    ::setpgid(0, 0);
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0)
      ::dup2(devNull, STDIN_FILENO);
    ::dup2(logFd, STDOUT_FILENO);
    ::dup2(logFd, STDERR_FILENO);
    LaunchFailure failure;
    if (workingDirectory && ::chdir(workingDirectory) != 0) {
      failure = {LaunchFailure::ChangeDirectory, errno};
    } else {
      ::execve(program->c_str(), argv.data(), envp.data());
      failure = {LaunchFailure::Execute, errno};
    }
    ssize_t written = ::write(failurePipe[1], &failure, sizeof(failure));
    (void)written;
    ::_exit(127);
  }

  // Also set the group from the parent so it exists before any kill below.
  // EACCES means the child has already exec'd, having set it itself.
  ::setpgid(pid, pid);
  ::close(failurePipe[1]);
  LaunchFailure failure;
  ssize_t received;
  do {
    received = ::read(failurePipe[0], &failure, sizeof(failure));
  } while (received < 0 && errno == EINTR);
  ::close(failurePipe[0]);

  if (received == static_cast<ssize_t>(sizeof(failure))) {
    int status;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    if (failure.stage == LaunchFailure::ChangeDirectory)
      return makeError(ErrorKind::Isolation,
                       "cannot enter " + options.workingDirectory + ": " +
                           llvm::sys::StrError(failure.error));
    return makeError(ErrorKind::Toolchain,
                     "cannot run '" + *program +
                         "': " + llvm::sys::StrError(failure.error));
  }

  LLVM_DEBUG(llvm::dbgs() << "started " << *program << " as pid " << pid
                          << "\n");

  auto start = std::chrono::steady_clock::now();
  ProcessResult result;
  {
    WallClockTimeout timer(options.timeout, [pid] {
      LLVM_DEBUG(llvm::dbgs() << "timeout: killing process group " << pid
                              << "\n");
      ::kill(-pid, SIGKILL);
    });
    while (!hasExited(pid)) {
      if (options.stopFlag && options.stopFlag->load() && !result.cancelled) {
        result.cancelled = true;
        ::kill(-pid, SIGKILL);
      }
      if (options.onTick)
        options.onTick(secondsSince(start));
      std::this_thread::sleep_for(options.pollInterval);
    }
    timer.cancel();
    result.timedOut = timer.hasExpired();
  }

  // Stragglers left in the group, such as background jobs of a test, go with
  // the leader.
  ::kill(-pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  waitForGroupToExit(pid);
  result.seconds = secondsSince(start);

  if (WIFEXITED(status))
    result.exitCode = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exitCode = 128 + WTERMSIG(status);

  LLVM_DEBUG(llvm::dbgs() << "pid " << pid << " finished with "
                          << result.exitCode
                          << (result.timedOut ? " (timed out)" : "")
                          << (result.cancelled ? " (cancelled)" : "") << "\n");
  return result;
}

std::vector<std::string>
mutants::buildEnvironment(const EnvironmentConfig &config) {
  llvm::StringSet<> dropped;
  for (const std::string &name : config.remove)
    dropped.insert(name);
  for (const std::string &entry : config.set)
    dropped.insert(parseAssignment(entry).first);
  dropped.insert("INSIDE_MUTANTS");

  std::vector<std::string> environment;
  for (char **entry = environ; entry && *entry; ++entry) {
    StringRef text(*entry);
    if (!dropped.count(text.split('=').first))
      environment.push_back(text.str());
  }
  for (const std::string &entry : config.set)
    environment.push_back(entry);
  environment.push_back("INSIDE_MUTANTS=true");
  return environment;
}

void mutants::becomeChildSubreaper() {
#ifdef __linux__
  if (::prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0)
    LLVM_DEBUG(llvm::dbgs() << "cannot become child subreaper: "
                            << llvm::sys::StrError(errno) << "\n");
#endif
}
