#include <proofagg/common/log.h>
#include <proofagg/engine/service.hpp>

#include <atomic>
#include <system_error>
#include <thread>

#if BOOST_VERSION >= 106600
#include <boost/asio/io_context.hpp>
#else
#include <boost/asio/io_service.hpp>
#endif
#include <boost/asio/executor_work_guard.hpp>
#include <boost/exception/diagnostic_information.hpp>

using boost::asio::io_context;

namespace pagg::engine {
struct Service::Internal {
  io_context context;
  boost::asio::executor_work_guard<io_context::executor_type> workGuard{
    context.get_executor()
  };
  std::thread thread;
  std::atomic_bool stopRequested = false;
};

Service::Service()
  : m_internal(std::make_unique<Internal>()) {}

Service::~Service() {
  requestStop();
  join();
  pagg_log(PAGG_ENGINE, PAGG_DEBUG, "Destroy Service.");
}

pagg_status
Service::start() {
  if(m_internal->thread.joinable())
    return PAGG_GENERIC_ERROR;
  try {
    m_internal->thread = std::thread([this]() {
      pagg_log_set_thread_name("Service");
      run();
    });
  } catch(const std::system_error& e) {
    pagg_log(PAGG_ENGINE,
             PAGG_LOCALERROR,
             "Could not start service thread! Error: {}",
             e.what());
    return PAGG_GENERIC_ERROR;
  }
  return PAGG_OK;
}

void
Service::join() {
  if(m_internal->thread.joinable() &&
     m_internal->thread.get_id() != std::this_thread::get_id()) {
    m_internal->thread.join();
  }
}

void
Service::requestStop() {
  if(m_internal->stopRequested.exchange(true))
    return;

  pagg_log(PAGG_ENGINE, PAGG_DEBUG, "Stopping service requested.");
  m_internal->workGuard.reset();
  m_internal->context.stop();
}

pagg_status
Service::run() {
  pagg_log(PAGG_ENGINE, PAGG_DEBUG, "Starting service io_context.");

  while(!m_internal->context.stopped()) {
    try {
      m_internal->context.run();
    } catch(std::exception& e) {
      pagg_log(PAGG_ENGINE,
               PAGG_LOCALERROR,
               "Exception in io context: {}, diagnostic info: {}",
               e.what(),
               boost::diagnostic_information(e));
    }
  }

  pagg_log(PAGG_ENGINE, PAGG_DEBUG, "Service io_context ended.");
  return PAGG_OK;
}

io_context&
Service::ioContext() {
  return m_internal->context;
}

bool
Service::stopped() const {
  return m_internal->context.stopped();
}
}
