/** LICENSE TEMPLATE */
#include "process_launcher.h"
// ldb
#include <utils/logger.h>
#include <utils/scoped_fd.h>
// std
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>
// system
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace ldb {

std::string
SpawnError::Describe() const noexcept
{
  return std::format("{} failed: {}", mStage, strerror(mErrno));
}

namespace {
// Shared with a reader thread, which may outlive Run when it is detached after a join timeout.
struct PipeReaderState
{
  std::mutex mMutex;
  std::condition_variable mDone;
  std::string mBuffer;
  bool mFinished{ false };
};

std::shared_ptr<PipeReaderState>
SpawnPipeReader(int fd, std::thread &outThread) noexcept
{
  auto state = std::make_shared<PipeReaderState>();
  outThread = std::thread{ [fd, state]() {
    ScopedFd pipe{ fd };
    char chunk[4096];
    while (true) {
      const auto bytesRead = ::read(pipe.Get(), chunk, sizeof(chunk));
      if (bytesRead == -1 && errno == EINTR) {
        continue;
      }
      if (bytesRead <= 0) {
        break;
      }
      std::lock_guard lock(state->mMutex);
      state->mBuffer.append(chunk, static_cast<size_t>(bytesRead));
    }
    std::lock_guard lock(state->mMutex);
    state->mFinished = true;
    state->mDone.notify_all();
  } };
  return state;
}

std::string
JoinPipeReader(std::thread &thread,
  const std::shared_ptr<PipeReaderState> &state,
  std::chrono::milliseconds timeout,
  std::string_view name) noexcept
{
  std::unique_lock lock(state->mMutex);
  const bool finished = state->mDone.wait_for(lock, timeout, [&state]() { return state->mFinished; });
  auto captured = state->mBuffer;
  lock.unlock();
  if (finished) {
    thread.join();
  } else {
    DBGLOG(warning, "{} reader did not finish within {}ms; detaching it", name, timeout.count());
    thread.detach();
  }
  return captured;
}

int
WaitForExit(pid_t pid) noexcept
{
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      DBGLOG(warning, "waitpid({}) failed: {}", pid, strerror(errno));
      return -1;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}
} // namespace

std::expected<ProcessOutput, SpawnError>
ForkExecLauncher::Run(const LaunchRequest &request) noexcept
{
  // Everything the child touches is prepared before fork: only async-signal-safe calls may follow it.
  std::vector<std::string> argStorage{};
  argStorage.push_back(request.mProgram.string());
  for (const auto &arg : request.mArguments) {
    argStorage.push_back(arg);
  }
  std::vector<char *> argv{};
  for (auto &arg : argStorage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  const std::string program = request.mProgram.string();
  const std::string workingDirectory = request.mWorkingDirectory.string();

  int stdoutPipe[2];
  int stderrPipe[2];
  int execErrorPipe[2];
  if (::pipe2(stdoutPipe, O_CLOEXEC) == -1) {
    return std::unexpected(SpawnError{ "pipe", errno });
  }
  if (::pipe2(stderrPipe, O_CLOEXEC) == -1) {
    const auto err = errno;
    ::close(stdoutPipe[0]);
    ::close(stdoutPipe[1]);
    return std::unexpected(SpawnError{ "pipe", err });
  }
  if (::pipe2(execErrorPipe, O_CLOEXEC) == -1) {
    const auto err = errno;
    for (auto fd : { stdoutPipe[0], stdoutPipe[1], stderrPipe[0], stderrPipe[1] }) {
      ::close(fd);
    }
    return std::unexpected(SpawnError{ "pipe", err });
  }

  DBGLOG(attach, "spawning {} with {} arguments (cwd '{}')", program, request.mArguments.size(), workingDirectory);
  const auto childPid = ::fork();
  if (childPid == -1) {
    const auto err = errno;
    for (auto fd : { stdoutPipe[0], stdoutPipe[1], stderrPipe[0], stderrPipe[1], execErrorPipe[0], execErrorPipe[1] }) {
      ::close(fd);
    }
    return std::unexpected(SpawnError{ "fork", err });
  }

  if (childPid == 0) {
    int err = 0;
    if (::dup2(stdoutPipe[1], STDOUT_FILENO) == -1 || ::dup2(stderrPipe[1], STDERR_FILENO) == -1) {
      err = errno;
    } else if (!workingDirectory.empty() && ::chdir(workingDirectory.c_str()) == -1) {
      err = errno;
    } else {
      ::execve(program.c_str(), argv.data(), environ);
      err = errno;
    }
    [[maybe_unused]] auto written = ::write(execErrorPipe[1], &err, sizeof(err));
    ::_exit(127);
  }

  ::close(stdoutPipe[1]);
  ::close(stderrPipe[1]);
  ::close(execErrorPipe[1]);

  std::thread stdoutThread;
  std::thread stderrThread;
  auto stdoutState = SpawnPipeReader(stdoutPipe[0], stdoutThread);
  auto stderrState = SpawnPipeReader(stderrPipe[0], stderrThread);

  // execve closes the CLOEXEC error pipe on success, so a read of 0 bytes means the program is running.
  int execErrno = 0;
  ssize_t errorBytes;
  do {
    errorBytes = ::read(execErrorPipe[0], &execErrno, sizeof(execErrno));
  } while (errorBytes == -1 && errno == EINTR);
  ::close(execErrorPipe[0]);

  ProcessOutput output{};
  output.mExitCode = WaitForExit(childPid);
  output.mStdout = JoinPipeReader(stdoutThread, stdoutState, request.mStdoutJoinTimeout, "stdout");
  output.mStderr = JoinPipeReader(stderrThread, stderrState, request.mStderrJoinTimeout, "stderr");

  if (errorBytes == sizeof(execErrno)) {
    DBGLOG(attach, "could not start {}: {}", program, strerror(execErrno));
    return std::unexpected(SpawnError{ "execve", execErrno });
  }

  DBGLOG(attach, "{} exited with {}", program, output.mExitCode);
  return output;
}
} // namespace ldb
