#pragma once

#include "probe/diagnostic_command.hpp"
#include "probe/probe_error.hpp"

#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <functional>

namespace netdiag::probe {
class ProbeRunner;
}

namespace netdiag::session {

// Runs probe jobs off the session thread.
class IProbeDispatcher {
public:
  // Invoked once when the probe finishes, on the worker thread that ran it.
  // Jobs dropped by Drain() never complete.
  using Completion = std::function<void(probe::ProbeOutcome outcome)>;

  virtual ~IProbeDispatcher() = default;

  // Queues one probe and returns immediately.
  virtual void Dispatch(probe::DiagnosticCommand command, Completion on_complete) = 0;

  // Drops queued jobs that have not started and waits for running ones.
  // Dispatch must not be called afterwards.
  virtual void Drain() = 0;
};

// Bounded pool: at most `max_concurrent_probes` external processes run at once,
// further commands wait in FIFO order.
class ThreadPoolProbeDispatcher final : public IProbeDispatcher {
public:
  ThreadPoolProbeDispatcher(probe::ProbeRunner& runner, std::size_t max_concurrent_probes);
  ~ThreadPoolProbeDispatcher() override;

  ThreadPoolProbeDispatcher(const ThreadPoolProbeDispatcher&) = delete;
  ThreadPoolProbeDispatcher& operator=(const ThreadPoolProbeDispatcher&) = delete;

  void Dispatch(probe::DiagnosticCommand command, Completion on_complete) override;
  void Drain() override;

private:
  probe::ProbeRunner& runner_;
  boost::asio::thread_pool pool_;
  bool drained_ = false;
};

} // namespace netdiag::session
