#include "HubRegistry.hpp"

namespace sb {
shared_ptr<Tenant> HubRegistry::getOrCreateTenant(
    const string &publicKey, TenantInitializer initializer) {
  shared_ptr<TenantSlot> slot;
  {
    lock_guard<mutex> guard(registryMutex);
    auto it = tenants.find(publicKey);
    if (it == tenants.end()) {
      slot.reset(new TenantSlot());
      slot->tenant.reset(new Tenant(publicKey));
      tenants[publicKey] = slot;
    } else {
      slot = it->second;
    }
  }

  // If the initializer throws, the flag stays unset and the next caller
  // retries.
  std::call_once(slot->initialized, [this, &slot, &initializer]() {
    LOG(INFO) << slot->tenant->getPublicKey() << " initializing tenant";
    if (initializer) {
      initializer(slot->tenant);
    }
    lock_guard<mutex> guard(registryMutex);
    slot->ready = true;
  });
  return slot->tenant;
}

shared_ptr<Tenant> HubRegistry::findTenant(const string &publicKey) {
  lock_guard<mutex> guard(registryMutex);
  auto it = tenants.find(publicKey);
  if (it == tenants.end() || !it->second->ready) {
    return nullptr;
  }
  return it->second->tenant;
}

void HubRegistry::recordSignature(const string &publicKey,
                                  const string &signature) {
  lock_guard<mutex> guard(registryMutex);
  signatures[publicKey] = signature;
}

vector<HostRecord> HubRegistry::listHosts() {
  lock_guard<mutex> guard(registryMutex);
  vector<HostRecord> hosts;
  for (const auto &it : signatures) {
    HostRecord record;
    record.publicKey = it.first;
    record.signature = it.second;
    hosts.push_back(record);
  }
  return hosts;
}

vector<shared_ptr<Tenant>> HubRegistry::getTenants() {
  lock_guard<mutex> guard(registryMutex);
  vector<shared_ptr<Tenant>> result;
  for (const auto &it : tenants) {
    if (it.second->ready) {
      result.push_back(it.second->tenant);
    }
  }
  return result;
}
}  // namespace sb
