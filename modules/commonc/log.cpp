#include <proofagg/common/log.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/predicates/has_attr.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <array>
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

using LoggerMT =
  boost::log::sources::severity_channel_logger_mt<pagg_log_severity,
                                                  pagg_log_channel>;

static boost::shared_ptr<boost::log::sinks::synchronous_sink<
  boost::log::sinks::basic_text_ostream_backend<char>>>
  global_console_sink;

static LoggerMT global_logger(boost::log::keywords::channel = PAGG_GENERAL);

static std::atomic<pagg_log_severity> global_severity{ PAGG_INFO };
static std::array<std::atomic_bool, PAGG_CHANNEL_COUNT> global_channels;

static std::mutex init_mutex;
static bool initialized = false;

using namespace boost::log;

BOOST_LOG_ATTRIBUTE_KEYWORD(pagg_logger_timestamp,
                            "TimeStamp",
                            boost::posix_time::ptime)

pagg_status
pagg_log_init(bool use_stdout) {
  std::unique_lock lock(init_mutex);

  if(initialized)
    return PAGG_OK;

  for(auto& c : global_channels) {
    c = true;
  }

  try {
    add_common_attributes();
    core::get()->add_thread_attribute(
      "ThreadName", attributes::constant<std::string>("main"));

    global_console_sink = add_console_log(use_stdout ? std::cout : std::clog);
    global_console_sink->set_formatter(
      expressions::stream
      << "["
      << expressions::if_(expressions::has_attr<std::string>(
           "LocalName"))[expressions::stream
                         << expressions::attr<std::string>("LocalName")
                         << "|"]
      << expressions::attr<std::string>("ThreadName") << "] ["
      << pagg_logger_timestamp << "] ["
      << expressions::attr<pagg_log_severity>("Severity") << "] ["
      << expressions::attr<pagg_log_channel>("Channel") << "] "
      << expressions::smessage);
    core::get()->add_sink(global_console_sink);
  } catch(std::exception& e) {
    std::cerr << "> Exception during log setup! Message: " << e.what()
              << std::endl;
    return PAGG_GENERIC_ERROR;
  }

  if(std::getenv("PAGG_LOG_DEBUG")) {
    pagg_log_set_severity(PAGG_DEBUG);
  }
  if(std::getenv("PAGG_LOG_TRACE")) {
    pagg_log_set_severity(PAGG_TRACE);
  }

  initialized = true;

  return PAGG_OK;
}

void
pagg_log_set_severity(pagg_log_severity severity) {
  global_severity = severity;
}

void
pagg_log_set_channel_active(pagg_log_channel channel, bool active) {
  global_channels[channel] = active;
}

void
pagg_log_set_local_name(const char* name) {
  std::string localName = name;
  if(localName.size() > 0) {
    global_logger.add_attribute("LocalName",
                                attributes::make_constant(localName));
  }
}

void
pagg_log_set_thread_name(const char* name) {
  core::get()->add_thread_attribute(
    "ThreadName", attributes::constant<std::string>(name));
}

void
pagg_log(pagg_log_channel channel,
         pagg_log_severity severity,
         const char* msg) {
  pagg_log(channel, severity, std::string_view(msg));
}

void
pagg_log(pagg_log_channel channel,
         pagg_log_severity severity,
         std::string_view msg) {
  if(pagg_log_enabled(channel, severity)) {
    try {
      BOOST_LOG_CHANNEL_SEV(global_logger, channel, severity) << msg;
    } catch(std::exception& e) {
      std::cerr
        << "!! Could not print log entry because of exception! Message: "
        << e.what() << std::endl;
    }
  }
}

bool
pagg_log_enabled(pagg_log_channel channel, pagg_log_severity severity) {
  return severity >= global_severity && global_channels[channel];
}

const char*
pagg_log_severity_to_str(pagg_log_severity severity) {
  switch(severity) {
    case PAGG_TRACE:
      return "TRCE";
    case PAGG_DEBUG:
      return "DEBG";
    case PAGG_INFO:
      return "INFO";
    case PAGG_LOCALWARNING:
      return "LWRN";
    case PAGG_LOCALERROR:
      return "LERR";
    case PAGG_GLOBALWARNING:
      return "GWRN";
    case PAGG_GLOBALERROR:
      return "GERR";
    case PAGG_FATAL:
      return "FTAL";

    case PAGG_SEVERITY_COUNT:
      break;
  }
  return "!!!!";
}

const char*
pagg_log_channel_to_str(pagg_log_channel channel) {
  switch(channel) {
    case PAGG_GENERAL:
      return "General";
    case PAGG_ENGINE:
      return "Engine";
    case PAGG_QUEUE:
      return "Queue";
    case PAGG_BLOB:
      return "Blob";
    case PAGG_RUNNER:
      return "Runner";
    case PAGG_SCHEDULER:
      return "Scheduler";
    case PAGG_CHANNEL_COUNT:
      break;
  }
  return "!";
}
