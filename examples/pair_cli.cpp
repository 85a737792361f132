// Example: pair with a browser session from scanned payloads read on stdin.
//
// Each input line is treated as one scan. The program exits once the browser
// has been handed the local endpoint address.
#include "linkpair/beast_transport.h"
#include "linkpair/endpoint.h"
#include "linkpair/linkpair.h"

#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

int main() {
  linkpair::Config config;
  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Invalid configuration: " << error << std::endl;
    return 1;
  }

  boost::asio::io_context ioc;
  auto work = boost::asio::make_work_guard(ioc);
  std::thread io_thread([&ioc]() { ioc.run(); });

  std::optional<linkpair::LocalEndpointInfo> handoff;
  int exit_code = 1;
  {
    linkpair::HttpEndpointLauncher launcher(ioc, config);
    linkpair::BeastRelayTransport transport(ioc, config);
    linkpair::PairingController controller(config, launcher, transport);

    std::mutex mutex;
    std::condition_variable settled;
    bool busy = false;

    controller.SetPhaseCallback([&](linkpair::PairingPhase phase) {
      std::cout << "phase: " << linkpair::PhaseName(phase) << std::endl;
      std::lock_guard<std::mutex> lock(mutex);
      // Only kIdle or a delivered hand-off ends the wait.
      busy = phase != linkpair::PairingPhase::kIdle;
      settled.notify_all();
    });
    controller.SetHandoffCallback([&](const linkpair::LocalEndpointInfo& endpoint) {
      std::lock_guard<std::mutex> lock(mutex);
      handoff = endpoint;
      settled.notify_all();
    });

    std::cout << "Paste a pairing payload per line (Ctrl-D to quit)." << std::endl;
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.empty()) {
        continue;
      }
      controller.OnScan(line);
      std::optional<linkpair::LocalEndpointInfo> paired;
      {
        std::unique_lock<std::mutex> lock(mutex);
        settled.wait(lock, [&]() { return !busy || handoff.has_value(); });
        paired = handoff;
      }
      if (paired) {
        std::cout << "Paired. Browser will reach http://" << paired->host << ":"
                  << paired->port << std::endl;
        exit_code = 0;
        break;
      }
      const auto last_error = controller.GetLastError();
      if (last_error) {
        std::cerr << "Pairing failed (" << linkpair::ErrorCodeName(last_error->code)
                  << "): " << last_error->message << std::endl;
        controller.DismissError();
      }
    }
  }

  work.reset();
  ioc.stop();
  io_thread.join();
  return exit_code;
}
