#include "LivenessMonitor.hpp"
#include "TenantFixture.hpp"

using namespace sb;

namespace {
ProbeSettings fastProbes() {
  ProbeSettings settings;
  settings.interval = std::chrono::milliseconds(50);
  settings.timeout = std::chrono::milliseconds(100);
  settings.attempts = 3;
  settings.retryDelay = std::chrono::milliseconds(10);
  return settings;
}

/** @brief An endpoint whose first sends blow up. */
class FailingTerminalEndpoint : public FakeTerminalEndpoint {
 public:
  FailingTerminalEndpoint(const string &_terminalId, int _failures)
      : FakeTerminalEndpoint(_terminalId), failuresLeft(_failures) {}

  virtual bool send(const string &frame) {
    if (failuresLeft > 0) {
      failuresLeft--;
      throw std::runtime_error("send failed");
    }
    return FakeTerminalEndpoint::send(frame);
  }

  atomic<int> failuresLeft;
};

int countPings(shared_ptr<FakeTerminalEndpoint> endpoint) {
  int pings = 0;
  for (const auto &message : endpoint->getMessages()) {
    if (stringField(message, "method") == "Ping") {
      pings++;
    }
  }
  return pings;
}
}  // namespace

TEST_CASE("Silent terminals are evicted after every attempt fails",
          "[LivenessMonitor]") {
  TenantFixture fixture;
  auto alive = fixture.addTerminal("alive", "Alive");
  auto dead = fixture.addTerminal("dead", "Dead");
  fixture.answerPings(alive, []() { return true; });

  LivenessMonitor monitor(fixture.tenant, fixture.host, fastProbes());
  auto evicted = monitor.sweep();

  REQUIRE(evicted == vector<string>({"dead"}));
  REQUIRE(dead->isTerminated());
  REQUIRE_FALSE(fixture.tenant->hasInfo("dead"));
  REQUIRE(fixture.tenant->getEndpoint("dead") == nullptr);
  REQUIRE(countPings(dead) == 3);

  REQUIRE(fixture.tenant->hasInfo("alive"));
  REQUIRE_FALSE(alive->isTerminated());
  REQUIRE(countPings(alive) == 1);
  REQUIRE(monitor.getSweepCount() == 1);
}

TEST_CASE("A terminal answering a retry is kept", "[LivenessMonitor]") {
  TenantFixture fixture;
  auto slow = fixture.addTerminal("slow", "Slow");
  shared_ptr<atomic<int>> calls(new atomic<int>(0));
  fixture.answerPings(slow, [calls]() { return ++(*calls) >= 3; });

  LivenessMonitor monitor(fixture.tenant, fixture.host, fastProbes());
  REQUIRE(monitor.sweep().empty());
  REQUIRE(fixture.tenant->hasInfo("slow"));
  REQUIRE(countPings(slow) == 3);
}

TEST_CASE("Metadata without a connection is evicted", "[LivenessMonitor]") {
  TenantFixture fixture;
  json fields = {{"terminal_id", "ghost"}};
  fixture.tenant->updateInfo(*TerminalInfo::fromJson(fields));

  LivenessMonitor monitor(fixture.tenant, fixture.host, fastProbes());
  REQUIRE(monitor.sweep() == vector<string>({"ghost"}));
  REQUIRE(fixture.tenant->snapshot().empty());
}

TEST_CASE("The monitor sweeps in the background", "[LivenessMonitor]") {
  TenantFixture fixture;
  auto alive = fixture.addTerminal("alive", "Alive");
  auto dead = fixture.addTerminal("dead", "Dead");
  fixture.answerPings(alive, []() { return true; });

  LivenessMonitor monitor(fixture.tenant, fixture.host, fastProbes());
  monitor.start();
  REQUIRE(monitor.isRunning());
  for (int i = 0; i < 500 && fixture.tenant->hasInfo("dead"); i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE_FALSE(fixture.tenant->hasInfo("dead"));
  for (int i = 0; i < 500 && monitor.getSweepCount() < 3; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE(monitor.getSweepCount() >= 3);
  REQUIRE(fixture.tenant->hasInfo("alive"));

  monitor.stop();
  REQUIRE_FALSE(monitor.isRunning());
  monitor.stop();
}

TEST_CASE("Stopping mid-sweep evicts nothing", "[LivenessMonitor]") {
  TenantFixture fixture;
  auto dead = fixture.addTerminal("dead", "Dead");

  ProbeSettings settings = fastProbes();
  settings.timeout = std::chrono::seconds(30);
  LivenessMonitor monitor(fixture.tenant, fixture.host, settings);
  monitor.start();
  for (int i = 0; i < 500 && countPings(dead) == 0; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE(countPings(dead) == 1);

  auto start = std::chrono::steady_clock::now();
  monitor.stop();
  REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
  REQUIRE(fixture.tenant->hasInfo("dead"));
  REQUIRE_FALSE(dead->isTerminated());
  REQUIRE(monitor.getSweepCount() == 0);
}

TEST_CASE("A failed sweep is retried", "[LivenessMonitor]") {
  TenantFixture fixture;
  shared_ptr<FailingTerminalEndpoint> flaky(
      new FailingTerminalEndpoint("flaky", 1));
  fixture.tenant->registerEndpoint(flaky);
  json fields = {{"terminal_id", "flaky"}, {"name", "Flaky"}};
  fixture.tenant->updateInfo(*TerminalInfo::fromJson(fields));
  fixture.answerPings(flaky, []() { return true; });

  LivenessMonitor monitor(fixture.tenant, fixture.host, fastProbes());
  monitor.start();
  for (int i = 0; i < 500 && flaky->failuresLeft > 0; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE(flaky->failuresLeft == 0);

  auto silent = fixture.addTerminal("silent", "Silent");
  for (int i = 0; i < 500 && fixture.tenant->hasInfo("silent"); i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE_FALSE(fixture.tenant->hasInfo("silent"));
  REQUIRE(silent->isTerminated());

  uint64_t sweeps = monitor.getSweepCount();
  REQUIRE(sweeps >= 1);
  for (int i = 0; i < 500 && monitor.getSweepCount() <= sweeps; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE(monitor.getSweepCount() > sweeps);
  REQUIRE(monitor.isRunning());
  REQUIRE(fixture.tenant->hasInfo("flaky"));
  REQUIRE_FALSE(flaky->isTerminated());
  monitor.stop();
}

TEST_CASE("A terminal reconnecting during a sweep is not evicted",
          "[LivenessMonitor]") {
  TenantFixture fixture;
  auto stale = fixture.addTerminal("t1", "Alpha");
  shared_ptr<FakeTerminalEndpoint> fresh(new FakeTerminalEndpoint("t1"));

  // The old socket never answers, and the terminal comes back on a new one
  // while the last ping is out
  ProbeSettings settings = fastProbes();
  weak_ptr<Tenant> weakTenant(fixture.tenant);
  shared_ptr<atomic<int>> pings(new atomic<int>(0));
  stale->setResponder([weakTenant, fresh, pings, settings](const string &frame) {
    json message = json::parse(frame);
    if (stringField(message, "method") != "Ping" ||
        ++(*pings) != settings.attempts) {
      return;
    }
    auto t = weakTenant.lock();
    if (t) {
      t->registerEndpoint(fresh);
    }
  });

  LivenessMonitor monitor(fixture.tenant, fixture.host, settings);
  REQUIRE(monitor.sweep().empty());
  REQUIRE(*pings == settings.attempts);
  REQUIRE(fixture.tenant->getEndpoint("t1") == fresh);
  REQUIRE_FALSE(fresh->isTerminated());
  REQUIRE(fixture.tenant->hasInfo("t1"));
}
