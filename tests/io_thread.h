// Runs an io_context on a background thread for tests that need real sockets.
#pragma once

#include <chrono>
#include <future>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace linkpair {
namespace fakes {

class IoThread {
 public:
  IoThread() : work_(boost::asio::make_work_guard(ioc)), thread_([this]() { ioc.run(); }) {}

  ~IoThread() {
    work_.reset();
    ioc.stop();
    thread_.join();
  }

  boost::asio::io_context ioc;

 private:
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  std::thread thread_;
};

template <typename T>
bool WaitFor(std::future<T>& future, std::chrono::seconds timeout = std::chrono::seconds(10)) {
  return future.wait_for(timeout) == std::future_status::ready;
}

}  // namespace fakes
}  // namespace linkpair
