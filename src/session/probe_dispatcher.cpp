#include "session/probe_dispatcher.hpp"

#include "probe/probe_runner.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <utility>

namespace netdiag::session {

ThreadPoolProbeDispatcher::ThreadPoolProbeDispatcher(probe::ProbeRunner& runner,
                                                     const std::size_t max_concurrent_probes)
    : runner_(runner), pool_(std::max<std::size_t>(1U, max_concurrent_probes)) {}

ThreadPoolProbeDispatcher::~ThreadPoolProbeDispatcher() {
  Drain();
}

void ThreadPoolProbeDispatcher::Dispatch(probe::DiagnosticCommand command,
                                         Completion on_complete) {
  boost::asio::post(pool_, [this, command = std::move(command),
                            on_complete = std::move(on_complete)]() {
    probe::ProbeOutcome outcome = runner_.Run(command);
    on_complete(std::move(outcome));
  });
}

void ThreadPoolProbeDispatcher::Drain() {
  if (drained_) {
    return;
  }
  drained_ = true;
  pool_.stop();
  pool_.join();
}

} // namespace netdiag::session
