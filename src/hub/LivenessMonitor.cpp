#include "LivenessMonitor.hpp"

namespace sb {
LivenessMonitor::LivenessMonitor(shared_ptr<Tenant> _tenant,
                                 shared_ptr<HostTerminal> _host,
                                 const ProbeSettings &_settings)
    : tenant(_tenant),
      host(_host),
      settings(_settings),
      halt(false),
      sweepCount(0) {}

LivenessMonitor::~LivenessMonitor() { stop(); }

void LivenessMonitor::start() {
  lock_guard<mutex> guard(monitorMutex);
  if (monitorThread) {
    STFATAL << "Liveness monitor started twice";
  }
  halt = false;
  monitorThread.reset(new thread(&LivenessMonitor::run, this));
}

void LivenessMonitor::stop() {
  shared_ptr<thread> t;
  {
    lock_guard<mutex> guard(monitorMutex);
    halt = true;
    t = monitorThread;
    monitorThread.reset();
  }
  wakeup.notify_all();
  host->cancelAllRequests();
  if (t && t->joinable()) {
    t->join();
  }
}

bool LivenessMonitor::isRunning() {
  lock_guard<mutex> guard(monitorMutex);
  return monitorThread != nullptr && !halt;
}

bool LivenessMonitor::isHalted() {
  lock_guard<mutex> guard(monitorMutex);
  return halt;
}

bool LivenessMonitor::waitFor(std::chrono::milliseconds duration) {
  unique_lock<mutex> lock(monitorMutex);
  wakeup.wait_for(lock, duration, [this] { return halt; });
  return !halt;
}

void LivenessMonitor::run() {
  el::Helpers::setThreadName("liveness-monitor");
  while (!isHalted()) {
    try {
      auto evicted = sweep();
      VLOG(1) << tenant->getPublicKey() << " liveness sweep done, evicted "
              << evicted.size();
      if (!waitFor(settings.interval)) {
        break;
      }
    } catch (const std::exception &e) {
      LOG(ERROR) << tenant->getPublicKey()
                 << " liveness sweep failed: " << e.what();
      if (!waitFor(settings.retryDelay)) {
        break;
      }
    }
  }
  VLOG(1) << tenant->getPublicKey() << " liveness monitor stopped";
}

vector<string> LivenessMonitor::sweep() {
  vector<string> remaining;
  // Endpoints as they were when the sweep began
  map<string, shared_ptr<TerminalEndpoint>> probed;
  for (const auto &id : tenant->getKnownTerminalIds()) {
    if (id != HOST_TERMINAL_ID) {
      remaining.push_back(id);
      probed[id] = tenant->getEndpoint(id);
    }
  }

  for (int attempt = 1; attempt <= settings.attempts && !remaining.empty();
       attempt++) {
    if (isHalted()) {
      return {};
    }
    auto deadline = std::chrono::steady_clock::now() + settings.timeout;
    vector<shared_ptr<PendingRequest>> probes;
    try {
      for (const auto &id : remaining) {
        probes.push_back(host->request("Ping", id, json::object()));
      }
    } catch (const std::runtime_error &) {
      for (auto &probe : probes) {
        host->cancelRequest(probe->getTraceId());
      }
      throw;
    }
    if (isHalted()) {
      // stop() may have cancelled before these were registered
      for (auto &probe : probes) {
        host->cancelRequest(probe->getTraceId());
      }
      return {};
    }
    vector<string> failed;
    for (size_t i = 0; i < probes.size(); i++) {
      bool answered = probes[i]->waitUntil(deadline);
      host->cancelRequest(probes[i]->getTraceId());
      if (!answered) {
        failed.push_back(remaining[i]);
      }
    }
    for (const auto &id : failed) {
      VLOG(1) << tenant->getPublicKey() << " ping attempt " << attempt << "/"
              << settings.attempts << " timed out for " << id;
    }
    remaining.swap(failed);
  }

  // Probes cancelled by a shutdown are not evidence of a dead terminal
  if (isHalted()) {
    return {};
  }
  vector<string> evicted;
  for (const auto &id : remaining) {
    if (tenant->evictIfCurrent(id, probed[id])) {
      LOG(INFO) << tenant->getPublicKey() << " terminal ping failed " << id
                << ", evicted";
      evicted.push_back(id);
    }
  }
  sweepCount++;
  return evicted;
}
}  // namespace sb
