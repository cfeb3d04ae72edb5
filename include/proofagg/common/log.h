#ifndef PROOFAGG_COMMON_LOG_H
#define PROOFAGG_COMMON_LOG_H

#include "proofagg/common/status.h"
#include "proofagg/common/types.h"

#ifdef __cplusplus
extern "C" {
#endif

enum pagg_log_severity {
  PAGG_TRACE,
  PAGG_DEBUG,
  PAGG_INFO,
  PAGG_LOCALWARNING,
  PAGG_LOCALERROR,
  PAGG_GLOBALWARNING,
  PAGG_GLOBALERROR,
  PAGG_FATAL,
  PAGG_SEVERITY_COUNT
};

enum pagg_log_channel {
  PAGG_GENERAL,
  PAGG_ENGINE,
  PAGG_QUEUE,
  PAGG_BLOB,
  PAGG_RUNNER,
  PAGG_SCHEDULER,
  PAGG_CHANNEL_COUNT
};

pagg_status
pagg_log_init(bool use_stdout);

void
pagg_log_set_severity(enum pagg_log_severity severity);

void
pagg_log_set_channel_active(enum pagg_log_channel channel, bool active);

void
pagg_log_set_local_name(const char* name);

/** @brief Names the calling thread in all following log entries. */
void
pagg_log_set_thread_name(const char* name);

const char*
pagg_log_severity_to_str(enum pagg_log_severity severity);

const char*
pagg_log_channel_to_str(enum pagg_log_channel channel);

void
pagg_log(enum pagg_log_channel channel,
         enum pagg_log_severity severity,
         const char* msg);

bool
pagg_log_enabled(enum pagg_log_channel channel,
                 enum pagg_log_severity severity);

#ifdef __cplusplus
}
#include <iostream>
#include <iterator>
#include <ostream>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ostream.h>

void
pagg_log(pagg_log_channel channel,
         pagg_log_severity severity,
         std::string_view msg);

inline std::ostream&
operator<<(std::ostream& o, pagg_log_severity severity) {
  return o << pagg_log_severity_to_str(severity);
}
inline std::ostream&
operator<<(std::ostream& o, pagg_log_channel channel) {
  return o << pagg_log_channel_to_str(channel);
}

template<>
struct fmt::formatter<pagg_status> : fmt::formatter<fmt::string_view> {
  template<typename FormatContext>
  auto format(pagg_status status, FormatContext& ctx) const {
    return fmt::formatter<fmt::string_view>::format(
      pagg_status_to_str(status), ctx);
  }
};

template<typename... Args>
void
pagg_log(pagg_log_channel channel,
         pagg_log_severity severity,
         fmt::format_string<Args...> fmt,
         Args&&... args) {
  if(!pagg_log_enabled(channel, severity))
    return;
  try {
    fmt::memory_buffer buf;
    fmt::format_to(
      std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    pagg_log(channel, severity, std::string_view(buf.data(), buf.size()));
  } catch(const std::exception& e) {
    std::cerr << "!! Could not format log entry because of exception! "
                 "Message: "
              << e.what() << std::endl;
  }
}
#endif

#endif
