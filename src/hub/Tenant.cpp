#include "Tenant.hpp"

namespace sb {
Tenant::Tenant(const string &_publicKey) : publicKey(_publicKey) {}

void Tenant::registerEndpoint(shared_ptr<TerminalEndpoint> endpoint) {
  lock_guard<recursive_mutex> guard(tenantMutex);
  const string &terminalId = endpoint->getTerminalId();
  auto it = endpoints.find(terminalId);
  if (it != endpoints.end() && it->second != endpoint) {
    LOG(INFO) << publicKey << " terminal replaced " << terminalId;
    it->second->close(1000, "terminal replaced");
  }
  endpoints[terminalId] = endpoint;
}

bool Tenant::unregister(const string &terminalId) {
  lock_guard<recursive_mutex> guard(tenantMutex);
  bool removedEndpoint = endpoints.erase(terminalId) > 0;
  bool removedInfo = infos.erase(terminalId) > 0;
  return removedEndpoint || removedInfo;
}

bool Tenant::unregisterIfCurrent(const string &terminalId,
                                 shared_ptr<TerminalEndpoint> endpoint) {
  lock_guard<recursive_mutex> guard(tenantMutex);
  auto it = endpoints.find(terminalId);
  if (it == endpoints.end() || it->second != endpoint) {
    VLOG(1) << publicKey << " not unregistering superseded connection for "
            << terminalId;
    return false;
  }
  return unregister(terminalId);
}

bool Tenant::evictIfCurrent(const string &terminalId,
                            shared_ptr<TerminalEndpoint> probed) {
  lock_guard<recursive_mutex> guard(tenantMutex);
  auto it = endpoints.find(terminalId);
  shared_ptr<TerminalEndpoint> current =
      it == endpoints.end() ? nullptr : it->second;
  if (current != probed) {
    VLOG(1) << publicKey << " " << terminalId
            << " reconnected since it was pinged, not evicting";
    return false;
  }
  infos.erase(terminalId);
  if (current) {
    current->terminate();
    endpoints.erase(it);
  }
  return true;
}

bool Tenant::updateInfo(const TerminalInfo &info) {
  if (info.terminalId == HOST_TERMINAL_ID) {
    LOG(WARNING) << publicKey << " refused info for the reserved id "
                 << info.terminalId;
    return false;
  }
  vector<InfoListener> listeners;
  {
    lock_guard<recursive_mutex> guard(tenantMutex);
    infos[info.terminalId] = info;
    listeners = infoListeners;
  }
  for (auto &listener : listeners) {
    listener(info);
  }
  return true;
}

void Tenant::addInfoListener(InfoListener listener) {
  lock_guard<recursive_mutex> guard(tenantMutex);
  infoListeners.push_back(listener);
}

vector<TerminalInfo> Tenant::snapshot() {
  lock_guard<recursive_mutex> guard(tenantMutex);
  vector<TerminalInfo> result;
  for (const auto &it : infos) {
    result.push_back(it.second);
  }
  return result;
}

bool Tenant::hasInfo(const string &terminalId) {
  lock_guard<recursive_mutex> guard(tenantMutex);
  return infos.find(terminalId) != infos.end();
}

vector<string> Tenant::getKnownTerminalIds() {
  lock_guard<recursive_mutex> guard(tenantMutex);
  vector<string> ids;
  for (const auto &it : infos) {
    ids.push_back(it.first);
  }
  return ids;
}

shared_ptr<TerminalEndpoint> Tenant::getEndpoint(const string &terminalId) {
  lock_guard<recursive_mutex> guard(tenantMutex);
  auto it = endpoints.find(terminalId);
  if (it == endpoints.end()) {
    return nullptr;
  }
  return it->second;
}

shared_ptr<TerminalEndpoint> Tenant::getRoutableEndpoint(
    const string &terminalId) {
  lock_guard<recursive_mutex> guard(tenantMutex);
  if (terminalId == HOST_TERMINAL_ID) {
    return host;
  }
  if (infos.find(terminalId) == infos.end()) {
    return nullptr;
  }
  return getEndpoint(terminalId);
}

vector<shared_ptr<TerminalEndpoint>> Tenant::getEndpoints() {
  lock_guard<recursive_mutex> guard(tenantMutex);
  vector<shared_ptr<TerminalEndpoint>> result;
  for (const auto &it : endpoints) {
    result.push_back(it.second);
  }
  return result;
}

int Tenant::getConnectionCount() {
  lock_guard<recursive_mutex> guard(tenantMutex);
  return int(endpoints.size());
}

void Tenant::setHost(shared_ptr<TerminalEndpoint> _host) {
  lock_guard<recursive_mutex> guard(tenantMutex);
  host = _host;
}

shared_ptr<TerminalEndpoint> Tenant::getHost() {
  lock_guard<recursive_mutex> guard(tenantMutex);
  return host;
}
}  // namespace sb
