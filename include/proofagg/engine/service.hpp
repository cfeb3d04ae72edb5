#pragma once

#include <memory>

#include <boost/version.hpp>

#include <proofagg/common/status.h>

namespace boost::asio {
#if BOOST_VERSION >= 106600
class io_context;
#else
class io_service;
typedef io_service io_context;
#endif
}

namespace pagg::engine {
/** @brief Owner of the io_context that job processors poll on.
 *
 * The context is kept alive while no handler is pending, so a processor
 * waiting for a worker thread does not end the loop.
 */
class Service {
  public:
  Service();
  ~Service();

  /** @brief Run the io_context on the calling thread until requestStop(). */
  pagg_status run();
  /** @brief Run the io_context on a thread of its own. */
  pagg_status start();
  void requestStop();
  /** @brief Wait for a thread started with start(). */
  void join();

  boost::asio::io_context& ioContext();
  bool stopped() const;

  private:
  struct Internal;
  std::unique_ptr<Internal> m_internal;
};
}
