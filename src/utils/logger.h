/** LICENSE TEMPLATE */
#pragma once
#include <array>
#include <atomic>
#include <common/macros.h>
#include <common/typedefs.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <source_location>
#include <string>
#include <utils/log_channel.h>

namespace ldb::cfg {
class InitializationConfiguration;
}

namespace ldb::logging {

struct LogChannel
{
  std::mutex mChannelMutex;
  std::fstream mFileStream;
  void LogMessage(const char *file, u32 line, u32 column, std::string_view message) noexcept;
  void LogMessage(const char *file, u32 line, u32 column, const std::string &message) noexcept;
  void Log(std::string_view msg) noexcept;
};

class Logger
{
  static Logger *sLoggerInstance;
  std::atomic<uint64_t> mSequenceId{ 0 };

public:
  Logger() noexcept = default;
  ~Logger() noexcept;
  void SetupChannel(const std::filesystem::path &logDirectory, Channel id) noexcept;
  void Log(Channel id, std::string_view log_msg) noexcept;
  static Logger *GetLogger() noexcept;
  static uint64_t GetLogMessageId() noexcept;

  void OnAbort() noexcept;
  LogChannel *GetLogChannel(Channel id) noexcept;

  static void
  LogIf(Channel id, std::string_view message) noexcept
  {
    if (auto *channel = GetLogger()->GetLogChannel(id); channel) {
      channel->Log(message);
    }
  }

  static void ConfigureLogging(const ldb::cfg::InitializationConfiguration &config) noexcept;

private:
  std::array<std::atomic<LogChannel *>, Enum<Channel>::Count()> mLogChannels{};
};

Logger *GetLogger() noexcept;
LogChannel *GetLogChannel(Channel id) noexcept;

#define DBGLOG(channel, ...)                                                                                      \
  if (auto logChannel = ::ldb::logging::GetLogChannel(Channel::channel); logChannel) {                            \
    std::source_location srcLoc = std::source_location::current();                                                \
    logChannel->LogMessage(srcLoc.file_name(), srcLoc.line(), srcLoc.column(), ::std::format(__VA_ARGS__));       \
  }

#define DBGLOG_STR(channel, str)                                                                                  \
  if (auto logChannel = ::ldb::logging::GetLogChannel(Channel::channel); logChannel) {                            \
    std::source_location srcLoc = std::source_location::current();                                                \
    logChannel->LogMessage(srcLoc.file_name(), srcLoc.line(), srcLoc.column(), str);                              \
  }

} // namespace ldb::logging
