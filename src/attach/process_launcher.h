/** LICENSE TEMPLATE */
#pragma once
#include <chrono>
#include <common.h>
#include <expected>
#include <string>
#include <vector>

namespace ldb {

struct SpawnError
{
  // The system call that failed.
  std::string mStage;
  int mErrno;

  std::string Describe() const noexcept;
};

struct ProcessOutput
{
  // Exit status, or 128 + signal number when the child was killed.
  int mExitCode{ -1 };
  std::string mStdout{};
  std::string mStderr{};
};

struct LaunchRequest
{
  Path mProgram;
  std::vector<std::string> mArguments{};
  Path mWorkingDirectory{};
  // Reader threads still running after these bounds are detached and their output truncated.
  std::chrono::milliseconds mStdoutJoinTimeout{ 3000 };
  std::chrono::milliseconds mStderrJoinTimeout{ 2000 };
};

/// Runs a program to completion, capturing its output.
class ProcessLauncher
{
public:
  virtual ~ProcessLauncher() noexcept = default;
  virtual std::expected<ProcessOutput, SpawnError> Run(const LaunchRequest &request) noexcept = 0;
};

/// fork + execve, with stdout and stderr drained on two reader threads so the child never blocks on a full pipe.
class ForkExecLauncher final : public ProcessLauncher
{
public:
  std::expected<ProcessOutput, SpawnError> Run(const LaunchRequest &request) noexcept final;
};
} // namespace ldb
