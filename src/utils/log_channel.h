/** LICENSE TEMPLATE */
#pragma once

#include <common/macros.h>

#define FOR_EACH_LOG(LOGCHANNEL)                                                                                  \
  LOGCHANNEL(core, "Core", "Messages that don't have a intuitive log channel can be logged here.")                \
  LOGCHANNEL(transport, "Transport", "Connection setup, framing, sent and received wire records.")                \
  LOGCHANNEL(attach, "Process Attach", "Helper tool invocation, captured helper output, module scans, retries.")  \
  LOGCHANNEL(session, "Debug Session", "Session state transitions, run control and handshakes.")                  \
  LOGCHANNEL(breakpoint, "Breakpoints", "Breakpoint registration and resynchronization.")                         \
  LOGCHANNEL(warning, "Warnings", "Unexpected behaviors should be logged to this chanel")

ENUM_TYPE_METADATA(Channel, FOR_EACH_LOG, DEFAULT_ENUM, i8)
