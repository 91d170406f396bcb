#include "HostTerminal.hpp"

namespace sb {
void PendingRequest::resolve(const json &_response) {
  {
    lock_guard<mutex> guard(requestMutex);
    if (response || cancelled) {
      return;
    }
    response = _response;
  }
  settled.notify_all();
}

void PendingRequest::cancel() {
  {
    lock_guard<mutex> guard(requestMutex);
    cancelled = true;
  }
  settled.notify_all();
}

bool PendingRequest::waitUntil(
    std::chrono::steady_clock::time_point deadline) {
  unique_lock<mutex> lock(requestMutex);
  settled.wait_until(lock, deadline,
                     [this] { return bool(response) || cancelled; });
  return bool(response);
}

optional<json> PendingRequest::getResponse() {
  lock_guard<mutex> guard(requestMutex);
  return response;
}

HostTerminal::HostTerminal(shared_ptr<Tenant> _tenant,
                           shared_ptr<MessageRouter> _router,
                           shared_ptr<HubRegistry> _registry, bool _admin)
    : terminalId(HOST_TERMINAL_ID),
      tenant(_tenant),
      router(_router),
      registry(_registry),
      admin(_admin) {
  services["ListTerminals"] = [this](const json &request) {
    return listTerminals(request);
  };
  services["UpdateTerminalInfo"] = [this](const json &request) {
    return updateTerminalInfo(request);
  };
  services["Terminate"] = [](const json &request) {
    return makeResponse(request, 403,
                        "You are not allowed to terminate this terminal");
  };
  services["Ping"] = [](const json &request) {
    return makeResponse(request, 0, "OK");
  };
  services["SubscribeChannel"] = [this](const json &request) {
    return subscribeChannel(request);
  };
  services["UnsubscribeChannel"] = [this](const json &request) {
    return unsubscribeChannel(request);
  };
  if (admin) {
    services["ListHost"] = [this](const json &request) {
      return listHost(request);
    };
  }
}

bool HostTerminal::hasService(const string &method) const {
  return services.find(method) != services.end();
}

bool HostTerminal::send(const string &frame) {
  auto message = tryParseJson(frame);
  if (!message || !message->is_object()) {
    VLOG(1) << "Host terminal ignoring a frame that is not a JSON object";
    return true;
  }
  string traceId = stringField(*message, "trace_id");
  if (message->contains("res")) {
    shared_ptr<PendingRequest> pending;
    {
      lock_guard<mutex> guard(hostMutex);
      auto it = pendingRequests.find(traceId);
      if (it != pendingRequests.end()) {
        pending = it->second;
        pendingRequests.erase(it);
      }
    }
    if (pending) {
      pending->resolve(*message);
    } else {
      VLOG(2) << "Host terminal got a response to an unknown request "
              << traceId;
    }
    return true;
  }
  if (!stringField(*message, "method").empty()) {
    handleRequest(*message);
    return true;
  }
  VLOG(2) << "Host terminal ignoring frame " << traceId;
  return true;
}

void HostTerminal::handleRequest(const json &request) {
  string method = stringField(request, "method");
  auto it = services.find(method);
  if (it == services.end()) {
    VLOG(1) << "Unknown service " << method << " requested by "
            << stringField(request, "source_terminal_id");
    reply(makeResponse(request, 404, "service not found: " + method));
    return;
  }
  reply(it->second(request));
}

void HostTerminal::reply(const json &response) {
  auto t = tenant.lock();
  if (!t) {
    return;
  }
  router->route(t, terminalId, response.dump());
}

json HostTerminal::listTerminals(const json &request) {
  auto t = tenant.lock();
  json data = json::array();
  if (t) {
    for (const auto &info : t->snapshot()) {
      data.push_back(info.toJson());
    }
  }
  return makeResponse(request, 0, "OK", data);
}

json HostTerminal::updateTerminalInfo(const json &request) {
  auto info = TerminalInfo::fromJson(request.contains("req") ? request["req"]
                                                             : json());
  if (!info) {
    return makeResponse(request, 400, "terminal_id is required");
  }
  if (info->terminalId == HOST_TERMINAL_ID) {
    return makeResponse(request, 400, "terminal_id is reserved");
  }
  auto t = tenant.lock();
  if (t) {
    VLOG(1) << t->getPublicKey() << " terminal info updated "
            << info->terminalId;
    // The tenant notifies its listeners, which publish on the channel
    if (!t->updateInfo(*info)) {
      return makeResponse(request, 400, "terminal_id is reserved");
    }
  }
  return makeResponse(request, 0, "OK");
}

json HostTerminal::subscribeChannel(const json &request) {
  json req = request.contains("req") ? request["req"] : json();
  if (stringField(req, "channel_id") != TERMINAL_INFO_CHANNEL) {
    return makeResponse(request, 404,
                        "channel not found: " + stringField(req, "channel_id"));
  }
  string subscriber = stringField(request, "source_terminal_id");
  string traceId = stringField(request, "trace_id");
  {
    lock_guard<mutex> guard(hostMutex);
    infoSubscriptions.insert(make_pair(subscriber, traceId));
  }
  return makeResponse(request, 0, "OK");
}

json HostTerminal::unsubscribeChannel(const json &request) {
  json req = request.contains("req") ? request["req"] : json();
  if (stringField(req, "channel_id") != TERMINAL_INFO_CHANNEL) {
    return makeResponse(request, 404,
                        "channel not found: " + stringField(req, "channel_id"));
  }
  string subscriber = stringField(request, "source_terminal_id");
  {
    lock_guard<mutex> guard(hostMutex);
    for (auto it = infoSubscriptions.begin(); it != infoSubscriptions.end();) {
      if (it->first == subscriber) {
        it = infoSubscriptions.erase(it);
      } else {
        ++it;
      }
    }
  }
  return makeResponse(request, 0, "OK");
}

json HostTerminal::listHost(const json &request) {
  json data = json::array();
  auto hubRegistry = registry.lock();
  if (!hubRegistry) {
    return makeResponse(request, 0, "OK", data);
  }
  for (const auto &record : hubRegistry->listHosts()) {
    json host = {{"public_key", record.publicKey},
                 {"signature", record.signature}};
    data.push_back(host);
  }
  return makeResponse(request, 0, "OK", data);
}

shared_ptr<PendingRequest> HostTerminal::request(const string &method,
                                                 const string &target,
                                                 const json &req) {
  string traceId = sole::uuid4().str();
  shared_ptr<PendingRequest> pending(new PendingRequest(traceId));
  {
    lock_guard<mutex> guard(hostMutex);
    pendingRequests[traceId] = pending;
  }
  auto t = tenant.lock();
  try {
    if (t && !router->route(
                 t, terminalId,
                 makeRequest(traceId, method, terminalId, target, req).dump())) {
      VLOG(2) << "Request " << method << " to " << target
              << " was not delivered";
    }
  } catch (const std::runtime_error &) {
    cancelRequest(traceId);
    throw;
  }
  return pending;
}

void HostTerminal::cancelRequest(const string &traceId) {
  shared_ptr<PendingRequest> pending;
  {
    lock_guard<mutex> guard(hostMutex);
    auto it = pendingRequests.find(traceId);
    if (it == pendingRequests.end()) {
      return;
    }
    pending = it->second;
    pendingRequests.erase(it);
  }
  pending->cancel();
}

void HostTerminal::cancelAllRequests() {
  unordered_map<string, shared_ptr<PendingRequest>> requests;
  {
    lock_guard<mutex> guard(hostMutex);
    requests.swap(pendingRequests);
  }
  for (auto &it : requests) {
    it.second->cancel();
  }
}

void HostTerminal::publishTerminalInfo(const TerminalInfo &info) {
  auto t = tenant.lock();
  if (!t) {
    return;
  }
  set<pair<string, string>> subscriptions;
  {
    lock_guard<mutex> guard(hostMutex);
    subscriptions = infoSubscriptions;
  }
  vector<pair<string, string>> gone;
  for (const auto &subscription : subscriptions) {
    if (!t->getRoutableEndpoint(subscription.first)) {
      gone.push_back(subscription);
      continue;
    }
    router->route(t, terminalId,
                  makeChannelFrame(subscription.second, subscription.first,
                                   info.toJson())
                      .dump());
  }
  if (!gone.empty()) {
    lock_guard<mutex> guard(hostMutex);
    for (const auto &subscription : gone) {
      VLOG(1) << "Dropping TerminalInfo subscription of "
              << subscription.first;
      infoSubscriptions.erase(subscription);
    }
  }
}

int HostTerminal::getSubscriptionCount() {
  lock_guard<mutex> guard(hostMutex);
  return int(infoSubscriptions.size());
}
}  // namespace sb
