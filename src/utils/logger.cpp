/** LICENSE TEMPLATE */
#include "logger.h"
#include <algorithm>
#include <configuration/config.h>
#include <filesystem>

namespace ldb::logging {

Logger *Logger::sLoggerInstance = new Logger{};

/* static */
void
Logger::ConfigureLogging(const ldb::cfg::InitializationConfiguration &config) noexcept
{
  const auto &channels = config.mLogChannels;
  for (auto channel : Enum<Channel>::Variants()) {
    const bool alwaysOn = channel == Channel::core || channel == Channel::warning;
    if (alwaysOn || std::ranges::find(channels, channel) != std::end(channels)) {
      sLoggerInstance->SetupChannel(config.mLogDirectory, channel);
    }
  }
  DBGLOG(core, "log channels configured: {} requested, directory {}", channels.size(), config.mLogDirectory.c_str());
}

Logger::~Logger() noexcept
{
  for (auto &slot : mLogChannels) {
    if (auto ptr = slot.exchange(nullptr); ptr) {
      ptr->mFileStream.flush();
      ptr->mFileStream.close();
      delete ptr;
    }
  }
}

void
Logger::SetupChannel(const std::filesystem::path &logDirectory, Channel id) noexcept
{
  auto &slot = mLogChannels[std::to_underlying(id)];
  if (slot.load() != nullptr) {
    return;
  }
  const auto p = logDirectory / std::format("{}.log", id);
  auto channel = new LogChannel{ .mChannelMutex = {},
    .mFileStream = std::fstream{ p, std::ios_base::in | std::ios_base::out | std::ios_base::trunc } };
  if (!channel->mFileStream.is_open()) {
    channel->mFileStream.open(p, std::ios_base::out | std::ios_base::trunc);
  }
  slot.store(channel);
}

void
Logger::Log(Channel id, std::string_view log_msg) noexcept
{
  if (auto ptr = GetLogChannel(id); ptr) {
    ptr->Log(log_msg);
  }
}

/* static */
Logger *
Logger::GetLogger() noexcept
{
  return Logger::sLoggerInstance;
}

/* static */
uint64_t
Logger::GetLogMessageId() noexcept
{
  return GetLogger()->mSequenceId++;
}

void
Logger::OnAbort() noexcept
{
  for (auto &slot : mLogChannels) {
    if (auto chan = slot.load(); chan) {
      std::lock_guard guard{ chan->mChannelMutex };
      chan->mFileStream.flush();
    }
  }
}

LogChannel *
Logger::GetLogChannel(Channel id) noexcept
{
  return mLogChannels[std::to_underlying(id)].load(std::memory_order_acquire);
}

void
LogChannel::LogMessage(const char *file, u32 line, u32, std::string_view message) noexcept
{
  std::lock_guard guard{ mChannelMutex };
  const auto id = Logger::GetLogMessageId();
  mFileStream << '[' << id << "] " << message;
  char buf[1024];
  auto it = std::format_to_n(buf, sizeof(buf) - 1, " [{}:{}]", file, line).out;
  *it = 0;
  mFileStream << buf << std::endl;
}

void
LogChannel::LogMessage(const char *file, u32 line, u32 column, const std::string &message) noexcept
{
  LogMessage(file, line, column, std::string_view{ message });
}

void
LogChannel::Log(std::string_view msg) noexcept
{
  std::lock_guard guard{ mChannelMutex };
  mFileStream << msg << std::endl;
}

Logger *
GetLogger() noexcept
{
  return Logger::GetLogger();
}

LogChannel *
GetLogChannel(Channel id) noexcept
{
  return GetLogger()->GetLogChannel(id);
}

} // namespace ldb::logging
