#ifndef __SB_LIVENESS_MONITOR__
#define __SB_LIVENESS_MONITOR__

#include "Headers.hpp"
#include "HostTerminal.hpp"
#include "HubConfig.hpp"
#include "Tenant.hpp"

namespace sb {
/**
 * @brief Periodically pings every known terminal of a tenant and evicts the
 * ones that never answer.
 *
 * A terminal's metadata can outlive its socket when the network drops
 * without a close. Each sweep sends a Ping through the host terminal to every
 * known terminal, retrying the ones that did not answer in time, and evicts
 * those that failed every attempt.
 */
class LivenessMonitor {
 public:
  LivenessMonitor(shared_ptr<Tenant> _tenant, shared_ptr<HostTerminal> _host,
                  const ProbeSettings &_settings);
  ~LivenessMonitor();

  /** @brief Starts the sweep thread. The first sweep runs immediately. */
  void start();
  /** @brief Stops the thread and cancels in-flight probes. Idempotent. */
  void stop();

  /**
   * @brief Runs one sweep on the calling thread.
   * @return The terminal ids that were evicted.
   */
  vector<string> sweep();

  bool isRunning();
  uint64_t getSweepCount() const { return sweepCount; }

 protected:
  shared_ptr<Tenant> tenant;
  shared_ptr<HostTerminal> host;
  ProbeSettings settings;

  mutex monitorMutex;
  std::condition_variable wakeup;
  bool halt;
  shared_ptr<thread> monitorThread;
  atomic<uint64_t> sweepCount;

  void run();
  bool isHalted();
  /** @brief Sleeps for `duration`. Returns false if the monitor stopped. */
  bool waitFor(std::chrono::milliseconds duration);
};
}  // namespace sb

#endif  // __SB_LIVENESS_MONITOR__
