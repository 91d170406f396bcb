#include "TenantFixture.hpp"

using namespace sb;

namespace {
json lastMessage(shared_ptr<FakeTerminalEndpoint> endpoint) {
  auto messages = endpoint->getMessages();
  REQUIRE_FALSE(messages.empty());
  return messages.back();
}
}  // namespace

TEST_CASE("Terminals discover each other through the host",
          "[HostTerminal]") {
  TenantFixture fixture;
  shared_ptr<FakeTerminalEndpoint> t1(new FakeTerminalEndpoint("t1"));
  fixture.tenant->registerEndpoint(t1);

  json info = {{"terminal_id", "t1"}, {"name", "Alpha"}};
  fixture.sendToHost("t1", "trace-1", "UpdateTerminalInfo", info);
  json response = lastMessage(t1);
  REQUIRE(response["trace_id"] == "trace-1");
  REQUIRE(response["source_terminal_id"] == HOST_TERMINAL_ID);
  REQUIRE(response["target_terminal_id"] == "t1");
  REQUIRE(response["res"]["code"] == 0);
  REQUIRE(response["res"]["message"] == "OK");

  fixture.sendToHost("t1", "trace-2", "ListTerminals");
  response = lastMessage(t1);
  REQUIRE(response["trace_id"] == "trace-2");
  REQUIRE(response["res"]["code"] == 0);
  REQUIRE(response["res"]["data"] == json::array({info}));
}

TEST_CASE("Terminal info updates are validated", "[HostTerminal]") {
  TenantFixture fixture;
  auto t1 = fixture.addTerminal("t1", "Alpha");

  fixture.sendToHost("t1", "bad", "UpdateTerminalInfo", {{"name", "x"}});
  json response = lastMessage(t1);
  REQUIRE(response["res"]["code"] == 400);
  REQUIRE(fixture.tenant->snapshot().size() == 1);
  REQUIRE(fixture.tenant->snapshot()[0].name == "Alpha");
}

TEST_CASE("Terminals cannot report info for the host id", "[HostTerminal]") {
  TenantFixture fixture;
  auto t1 = fixture.addTerminal("t1", "Alpha");

  fixture.sendToHost("t1", "spoof", "UpdateTerminalInfo",
                     {{"terminal_id", HOST_TERMINAL_ID}, {"name", "Host"}});
  json response = lastMessage(t1);
  REQUIRE(response["trace_id"] == "spoof");
  REQUIRE(response["res"]["code"] == 400);
  REQUIRE(response["res"]["message"] == "terminal_id is reserved");

  REQUIRE(fixture.tenant->getKnownTerminalIds() == vector<string>({"t1"}));
  fixture.sendToHost("t1", "list", "ListTerminals");
  REQUIRE(lastMessage(t1)["res"]["data"] ==
          json::array({{{"terminal_id", "t1"}, {"name", "Alpha"}}}));
}

TEST_CASE("The host refuses to be terminated", "[HostTerminal]") {
  TenantFixture fixture;
  auto t1 = fixture.addTerminal("t1", "Alpha");

  fixture.sendToHost("t1", "kill", "Terminate");
  json response = lastMessage(t1);
  REQUIRE(response["res"]["code"] == 403);
  REQUIRE(response["res"]["message"] ==
          "You are not allowed to terminate this terminal");

  fixture.sendToHost("t1", "ping", "Ping");
  REQUIRE(lastMessage(t1)["res"]["code"] == 0);

  fixture.sendToHost("t1", "what", "Reboot");
  response = lastMessage(t1);
  REQUIRE(response["res"]["code"] == 404);
  REQUIRE(response["res"]["message"] == "service not found: Reboot");
}

TEST_CASE("Only the admin host lists hosts", "[HostTerminal]") {
  {
    TenantFixture fixture;
    fixture.registry->recordSignature("pk", "sig");
    auto t1 = fixture.addTerminal("t1", "Alpha");
    REQUIRE_FALSE(fixture.host->isAdmin());
    REQUIRE_FALSE(fixture.host->hasService("ListHost"));
    fixture.sendToHost("t1", "hosts", "ListHost");
    REQUIRE(lastMessage(t1)["res"]["code"] == 404);
  }
  {
    TenantFixture fixture(true);
    REQUIRE(fixture.host->isAdmin());
    fixture.registry->recordSignature("pk", "sig");
    fixture.registry->recordSignature("other", "sig2");
    auto t1 = fixture.addTerminal("t1", "Alpha");
    fixture.sendToHost("t1", "hosts", "ListHost");
    json response = lastMessage(t1);
    REQUIRE(response["res"]["code"] == 0);
    json expected = json::array(
        {{{"public_key", "other"}, {"signature", "sig2"}},
         {{"public_key", "pk"}, {"signature", "sig"}}});
    REQUIRE(response["res"]["data"] == expected);
  }
}

TEST_CASE("TerminalInfo subscribers get every update", "[HostTerminal]") {
  TenantFixture fixture;
  auto watcher = fixture.addTerminal("watcher", "Watcher");
  fixture.sendToHost("watcher", "sub-1", "SubscribeChannel",
                     {{"channel_id", TERMINAL_INFO_CHANNEL}});
  REQUIRE(lastMessage(watcher)["res"]["code"] == 0);
  REQUIRE(fixture.host->getSubscriptionCount() == 1);

  fixture.addTerminal("t1", "Alpha");
  json pushed = lastMessage(watcher);
  REQUIRE(pushed["trace_id"] == "sub-1");
  REQUIRE(pushed["source_terminal_id"] == HOST_TERMINAL_ID);
  REQUIRE(pushed["frame"]["terminal_id"] == "t1");
  REQUIRE(pushed["frame"]["name"] == "Alpha");

  fixture.sendToHost("watcher", "sub-2", "SubscribeChannel",
                     {{"channel_id", "Weather"}});
  json response = lastMessage(watcher);
  REQUIRE(response["res"]["code"] == 404);
  REQUIRE(response["res"]["message"] == "channel not found: Weather");

  fixture.sendToHost("watcher", "unsub", "UnsubscribeChannel",
                     {{"channel_id", TERMINAL_INFO_CHANNEL}});
  REQUIRE(fixture.host->getSubscriptionCount() == 0);
  size_t before = watcher->getFrames().size();
  fixture.addTerminal("t2", "Beta");
  REQUIRE(watcher->getFrames().size() == before);
}

TEST_CASE("Subscriptions of departed terminals are pruned",
          "[HostTerminal]") {
  TenantFixture fixture;
  fixture.addTerminal("watcher", "Watcher");
  fixture.sendToHost("watcher", "sub", "SubscribeChannel",
                     {{"channel_id", TERMINAL_INFO_CHANNEL}});
  REQUIRE(fixture.host->getSubscriptionCount() == 1);

  fixture.tenant->unregister("watcher");
  fixture.addTerminal("t1", "Alpha");
  REQUIRE(fixture.host->getSubscriptionCount() == 0);
}

TEST_CASE("Host requests are settled by matching responses",
          "[HostTerminal]") {
  TenantFixture fixture;
  auto t1 = fixture.addTerminal("t1", "Alpha");
  fixture.answerPings(t1, []() { return true; });

  auto pending = fixture.host->request("Ping", "t1", json::object());
  REQUIRE(pending->waitUntil(std::chrono::steady_clock::now() +
                             std::chrono::seconds(1)));
  auto response = pending->getResponse();
  REQUIRE(response.has_value());
  REQUIRE((*response)["res"]["message"] == "pong");

  json request = t1->getMessages().back();
  REQUIRE(request["method"] == "Ping");
  REQUIRE(request["source_terminal_id"] == HOST_TERMINAL_ID);
  REQUIRE(request["trace_id"] == pending->getTraceId());
}

TEST_CASE("Unanswered host requests time out or get cancelled",
          "[HostTerminal]") {
  TenantFixture fixture;
  fixture.addTerminal("t1", "Alpha");

  auto pending = fixture.host->request("Ping", "t1", json::object());
  REQUIRE_FALSE(pending->waitUntil(std::chrono::steady_clock::now() +
                                   std::chrono::milliseconds(50)));
  fixture.host->cancelRequest(pending->getTraceId());

  auto cancelled = fixture.host->request("Ping", "t1", json::object());
  thread canceller([&fixture]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    fixture.host->cancelAllRequests();
  });
  auto start = std::chrono::steady_clock::now();
  REQUIRE_FALSE(cancelled->waitUntil(start + std::chrono::seconds(10)));
  REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
  canceller.join();

  // A late response is ignored
  json late = {{"trace_id", cancelled->getTraceId()},
               {"target_terminal_id", HOST_TERMINAL_ID},
               {"res", {{"code", 0}}}};
  REQUIRE(fixture.host->send(late.dump()));
  REQUIRE_FALSE(cancelled->getResponse().has_value());
}
